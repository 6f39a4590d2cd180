#include "converter.hpp"
#include "constant.hpp"
#include "format_error.hpp"
#include "segment.hpp"
#include "util.hpp"
#include "cybozu/exception.hpp"

namespace dfcmpr {

void Config::verify() const
{
    if (level > MAX_COMPRESSION_LEVEL) {
        throw cybozu::Exception("Config:bad level") << level;
    }
}

std::string Config::str() const
{
    return util::formatString("concurrency %zu level %zu strict %d"
                              , concurrency, level, strict ? 1 : 0);
}

namespace {

/**
 * RETURN:
 *   true if the input must be passed through.
 */
bool checkAlreadyConverted(const Header &header, bool target, const Config &cfg)
{
    if (header.compressed != target) return false;
    if (cfg.strict) {
        throw FormatError(FormatError::AlreadyConverted)
            << (target ? "compressed" : "uncompressed") << header.version;
    }
    return true;
}

} // namespace

Buffer compress(const Buffer &in, const Config &cfg)
{
    cfg.verify();
    const Header header = decodeHeader(in);
    if (checkAlreadyConverted(header, true, cfg)) return in;

    Buffer out;
    appendHeader(Header(header.version, true), out);
    SegmentCompressor c(cfg.level, cfg.concurrency);
    c.run(in.data() + HEADER_SIZE, in.size() - HEADER_SIZE, out);
    return out;
}

Buffer uncompress(const Buffer &in, const Config &cfg)
{
    cfg.verify();
    const Header header = decodeHeader(in);
    if (checkAlreadyConverted(header, false, cfg)) return in;

    Buffer out;
    appendHeader(Header(header.version, false), out);
    SegmentDecompressor d(cfg.concurrency);
    d.run(in.data() + HEADER_SIZE, in.size() - HEADER_SIZE, out);
    return out;
}

} // namespace dfcmpr
