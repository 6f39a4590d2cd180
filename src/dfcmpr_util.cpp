#include "dfcmpr_util.hpp"
#include <cstdio>

namespace dfcmpr {
namespace util {

void setLogSetting(const std::string &pathStr, bool isDebug)
{
    cybozu::SetLogUseMsec(true);
    if (pathStr == "-") {
        cybozu::SetLogFILE(::stderr);
    } else {
        cybozu::OpenLogFile(pathStr);
    }
    if (isDebug) {
        cybozu::SetLogPriority(cybozu::LogDebug);
    } else {
        cybozu::SetLogPriority(cybozu::LogInfo);
    }
}

void loadInput(const std::string &path, Buffer &buf)
{
    if (path.empty()) {
        File file(0);
        readAllFromFile(file, buf);
    } else {
        readAllFromFile(path, buf);
    }
}

void saveOutput(const std::string &path, const Buffer &buf)
{
    if (path.empty()) {
        File file(1);
        writeAllToFile(file, buf);
        return;
    }
    File file(path, O_CREAT | O_TRUNC | O_WRONLY, 0644);
    writeAllToFile(file, buf);
    file.fdatasync();
    file.close();
}

}} // namespace dfcmpr::util

int errorSafeMain(int (*doMain)(int, char *[]), int argc, char *argv[], const char *msg)
{
    try {
        dfcmpr::util::setLogSetting("-", false);
        return doMain(argc, argv);
    } catch (std::exception &e) {
        LOGs.error() << msg << e.what();
    } catch (...) {
        LOGs.error() << msg << "unknown error";
    }
    return 1;
}
