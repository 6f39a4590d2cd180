#pragma once
/**
 * @file
 * @brief Conversion between uncompressed and compressed save files.
 */
#include <string>
#include "dfcmpr_types.hpp"
#include "header_codec.hpp"

namespace dfcmpr {

struct Config
{
    /* number of threads for segments. 0 means the number of cores. */
    size_t concurrency;
    /* zlib level [0, 9]. 0 means the zlib default. */
    size_t level;
    /* reject inputs that already have the target flag instead of passing them through. */
    bool strict;

    Config() : concurrency(1), level(0), strict(false) {}
    void verify() const;
    std::string str() const;
};

/**
 * Convert an uncompressed save file to a compressed one.
 * The version is kept and the flag becomes 1.
 * A compressed input is returned as is unless cfg.strict.
 * throws FormatError.
 */
Buffer compress(const Buffer &in, const Config &cfg = Config());

/**
 * Convert a compressed save file to an uncompressed one.
 * The version is kept and the flag becomes 0.
 * An uncompressed input is returned as is unless cfg.strict.
 * throws FormatError.
 */
Buffer uncompress(const Buffer &in, const Config &cfg = Config());

} // namespace dfcmpr
