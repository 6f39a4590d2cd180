#include "conv_tool.hpp"
#include <cstdlib>
#include "header_codec.hpp"
#include "thread_util.hpp"

namespace dfcmpr {

ConvOption::ConvOption(int argc, char *argv[], bool isCompress)
    : isCompress(isCompress), cfg(), logOpt(), v(), srcPath(), dstPath()
{
    cybozu::Option opt;
    if (isCompress) {
        opt.setDescription("Compress a save file segment by segment.\n");
        opt.appendOpt(&cfg.level, 0, "l", ": compression level [0, 9] (default: 0 means zlib default).");
    } else {
        opt.setDescription("Uncompress a save file compressed by dfcompress.\n");
    }
    opt.appendOpt(&cfg.concurrency, 0, "c", ": number of threads (default: 0 means the number of cores).");
    opt.appendBoolOpt(&cfg.strict, "strict", ": fail if the input has been already converted.");
    logOpt.append(opt);
    opt.appendHelp("h", ": show this message.");
    opt.appendParamVec(&v, "(SRC_PATH (DST_PATH))", ": source/destination file path. "
                       "If not specified, stdin/stdout will be used.");

    if (!opt.parse(argc, argv)) {
        opt.usage();
        ::exit(1);
    }
    if (v.size() > 2) {
        throw cybozu::Exception("too many parameters") << v.size();
    }
    if (!v.empty()) srcPath = v[0];
    if (v.size() >= 2) dstPath = v[1];
    cfg.concurrency = thread::resolveConcurrency(cfg.concurrency);
    cfg.verify();
}

int runConvTool(int argc, char *argv[], bool isCompress)
{
    ConvOption opt(argc, argv, isCompress);
    opt.logOpt.apply();
    LOGs.debug() << (isCompress ? "compress" : "uncompress") << opt.cfg.str()
                 << (opt.srcPath.empty() ? "stdin" : opt.srcPath)
                 << (opt.dstPath.empty() ? "stdout" : opt.dstPath);

    Buffer in;
    util::loadInput(opt.srcPath, in);
    const Header header = decodeHeader(in);
    if (header.compressed == isCompress && !opt.cfg.strict) {
        LOGs.info() << "already" << (isCompress ? "compressed" : "uncompressed")
                    << "pass through" << header.str();
    }

    const double t0 = util::getTime();
    const Buffer out = isCompress ? compress(in, opt.cfg) : uncompress(in, opt.cfg);
    const double t1 = util::getTime();
    LOGs.debug() << "in_size" << in.size() << "out_size" << out.size()
                 << util::getElapsedTimeStr(t1 - t0);

    util::saveOutput(opt.dstPath, out);
    return 0;
}

} // namespace dfcmpr
