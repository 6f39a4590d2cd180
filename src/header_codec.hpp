#pragma once
/**
 * @file
 * @brief Save file header and little-endian integer helpers.
 */
#include <cstdint>
#include <string>
#include "constant.hpp"
#include "dfcmpr_types.hpp"

namespace dfcmpr {

inline uint32_t getLe32(const void *data)
{
    const uint8_t *p = static_cast<const uint8_t *>(data);
    return uint32_t(p[0])
        | (uint32_t(p[1]) << 8)
        | (uint32_t(p[2]) << 16)
        | (uint32_t(p[3]) << 24);
}

inline void putLe32(void *data, uint32_t v)
{
    uint8_t *p = static_cast<uint8_t *>(data);
    p[0] = uint8_t(v);
    p[1] = uint8_t(v >> 8);
    p[2] = uint8_t(v >> 16);
    p[3] = uint8_t(v >> 24);
}

/**
 * version is opaque and passed through as is.
 */
struct Header
{
    uint32_t version;
    bool compressed;

    Header() : version(0), compressed(false) {}
    Header(uint32_t version, bool compressed)
        : version(version), compressed(compressed) {}

    bool operator==(const Header &rhs) const {
        return version == rhs.version && compressed == rhs.compressed;
    }
    bool operator!=(const Header &rhs) const { return !(*this == rhs); }
    std::string str() const;
};

/**
 * Decode the first HEADER_SIZE bytes.
 * throws FormatError (Truncated or InvalidFlag).
 */
Header decodeHeader(const void *data, size_t size);

inline Header decodeHeader(const Buffer &buf)
{
    return decodeHeader(buf.data(), buf.size());
}

/**
 * Write HEADER_SIZE bytes to out.
 */
void encodeHeader(const Header &header, void *out);

/**
 * Append the encoded header to buf.
 */
void appendHeader(const Header &header, Buffer &buf);

} // namespace dfcmpr
