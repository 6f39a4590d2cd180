#include "header_codec.hpp"
#include "format_error.hpp"
#include "util.hpp"

namespace dfcmpr {

std::string Header::str() const
{
    return util::formatString("version %u compressed %d", version, compressed ? 1 : 0);
}

Header decodeHeader(const void *data, size_t size)
{
    if (size < HEADER_SIZE) {
        throw FormatError(FormatError::Truncated, "header") << size;
    }
    const char *p = static_cast<const char *>(data);
    const uint32_t version = getLe32(p);
    const uint32_t flag = getLe32(p + 4);
    if (flag != FLAG_UNCOMPRESSED && flag != FLAG_COMPRESSED) {
        throw FormatError(FormatError::InvalidFlag) << flag;
    }
    return Header(version, flag == FLAG_COMPRESSED);
}

void encodeHeader(const Header &header, void *out)
{
    char *p = static_cast<char *>(out);
    putLe32(p, header.version);
    putLe32(p + 4, header.compressed ? FLAG_COMPRESSED : FLAG_UNCOMPRESSED);
}

void appendHeader(const Header &header, Buffer &buf)
{
    const size_t off = buf.size();
    buf.resize(off + HEADER_SIZE);
    encodeHeader(header, &buf[off]);
}

} // namespace dfcmpr
