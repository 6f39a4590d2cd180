/**
 * @file
 * @brief Show the header and the block layout of a save file.
 */
#include "block_inspector.hpp"
#include "dfcmpr_util.hpp"

using namespace dfcmpr;

struct Option
{
    bool doInflate;
    bool isVerbose;
    util::LogOption logOpt;
    std::vector<std::string> v;
    std::string srcPath;

    Option(int argc, char *argv[]) {
        cybozu::Option opt;
        opt.setDescription("Show the header and blocks of a save file.\n");
        opt.appendBoolOpt(&doInflate, "inflate", ": inflate blocks to get uncompressed sizes.");
        opt.appendBoolOpt(&isVerbose, "v", ": show each block.");
        logOpt.append(opt);
        opt.appendHelp("h", ": show this message.");
        opt.appendParamVec(&v, "(SRC_PATH)", ": save file path. If not specified, stdin will be used.");
        if (!opt.parse(argc, argv)) {
            opt.usage();
            ::exit(1);
        }
        if (v.size() > 1) {
            throw cybozu::Exception("too many parameters") << v.size();
        }
        if (!v.empty()) srcPath = v[0];
    }
};

int doMain(int argc, char *argv[])
{
    Option opt(argc, argv);
    opt.logOpt.apply();

    Buffer in;
    util::loadInput(opt.srcPath, in);
    const FileInfo info = inspect(in, opt.doInflate);
    info.print(::stdout, opt.isVerbose);
    return 0;
}

DEFINE_ERROR_SAFE_MAIN("dfcmpr-show")
