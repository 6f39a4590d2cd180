#pragma once
/**
 * @file
 * @brief Inspect the layout of save files.
 */
#include <cstdio>
#include <vector>
#include "dfcmpr_types.hpp"
#include "header_codec.hpp"

namespace dfcmpr {

/**
 * For compressed files, offset points to the length prefix of the block,
 * cmprSize is the zlib stream size, and origSize is valid only if inflated.
 * For uncompressed files, each item is a segment and cmprSize is 0.
 */
struct BlockInfo
{
    size_t index;
    size_t offset;
    size_t cmprSize;
    size_t origSize;
};

struct FileInfo
{
    Header header;
    size_t bodySize;
    bool isInflated;
    std::vector<BlockInfo> blocks;

    FileInfo() : header(), bodySize(0), isInflated(false), blocks() {}
    /**
     * Total size of the uncompressed body.
     * Valid for uncompressed files or inflated compressed files.
     */
    size_t origBodySize() const;
    void print(::FILE *fp = ::stdout, bool isVerbose = false) const;
};

/**
 * Walk the header and the blocks.
 * @doInflate inflate each block of compressed files to get its size.
 * throws FormatError as uncompress() does.
 */
FileInfo inspect(const Buffer &in, bool doInflate);

} // namespace dfcmpr
