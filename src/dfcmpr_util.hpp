#pragma once
/**
 * @file
 * @brief dfcmpr tool utilities.
 * @author HOSHINO Takashi
 *
 * (C) 2014 Cybozu Labs, Inc.
 */
#include <string>
#include "util.hpp"
#include "fileio.hpp"
#include "dfcmpr_types.hpp"
#include "dfcmpr_logger.hpp"
#include "cybozu/exception.hpp"
#include "cybozu/option.hpp"

namespace dfcmpr {
namespace util {

/**
 * "-" means stderr.
 */
void setLogSetting(const std::string &pathStr, bool isDebug);

inline std::string getElapsedTimeStr(double elapsedSec)
{
    return formatString("elapsed_time %.3f sec", elapsedSec);
}

/**
 * Read the whole input.
 * An empty path means stdin.
 */
void loadInput(const std::string &path, Buffer &buf);

/**
 * Write the whole output.
 * An empty path means stdout.
 * The destination file will be created or truncated only here.
 */
void saveOutput(const std::string &path, const Buffer &buf);

/**
 * Options for logging shared by all the tools.
 */
struct LogOption
{
    std::string logPath;
    bool isDebug;

    LogOption() : logPath("-"), isDebug(false) {}
    void append(cybozu::Option &opt) {
        opt.appendOpt(&logPath, "-", "log", ": log output path ('-' means stderr).");
        opt.appendBoolOpt(&isDebug, "debug", ": put debug messages.");
    }
    void apply() const {
        setLogSetting(logPath, isDebug);
    }
};

}} // dfcmpr::util

int errorSafeMain(int (*doMain)(int, char *[]), int argc, char *argv[], const char *msg);

#define DEFINE_ERROR_SAFE_MAIN(msg)                    \
    int main(int argc, char *argv[]) {                 \
        return errorSafeMain(doMain, argc, argv, msg); \
    }
