#pragma once
/**
 * @file
 * @brief Segment compressor/decompressor of save file bodies.
 *
 * Uncompressed body: segments of SEGMENT_SIZE bytes, the last one may be shorter.
 * Compressed body: blocks of [u32 le length][length bytes of zlib stream],
 * the i-th block inflates to the i-th segment.
 */
#include <vector>
#include <exception>
#include "constant.hpp"
#include "dfcmpr_types.hpp"
#include "compressor.hpp"

namespace dfcmpr {

/**
 * Number of segments of a body of size bytes.
 */
inline size_t countSegments(size_t size)
{
    return (size + SEGMENT_SIZE - 1) / SEGMENT_SIZE;
}

/**
 * A contiguous range of an input buffer.
 * It does not own the data.
 */
struct Segment
{
    size_t index;
    const char *data;
    size_t size;
};

/**
 * Cut an uncompressed body into segments.
 */
std::vector<Segment> splitIntoSegments(const char *body, size_t size);

/**
 * A compressed block found in a compressed body.
 * offset points to the length prefix relative to the body top.
 * data/size is the zlib stream, it does not own the data.
 */
struct BlockView
{
    size_t index;
    size_t offset;
    const char *data;
    size_t size;
};

/**
 * Walk the blocks of a compressed body.
 * The zlib streams are not inspected.
 */
class BlockReader
{
private:
    const char *body_;
    size_t size_;
    size_t off_;
    size_t index_;
public:
    BlockReader(const char *body, size_t size)
        : body_(body), size_(size), off_(0), index_(0) {}
    /**
     * RETURN:
     *   false if the body is exhausted.
     * throws FormatError(Truncated) if the length prefix or the block is incomplete.
     */
    bool next(BlockView &blk);
    size_t offset() const { return off_; }
};

/**
 * Read all the blocks.
 * The blocks before the first framing error are stored to blkV,
 * and the error is returned instead of being thrown.
 */
std::exception_ptr readAllBlocks(const char *body, size_t size, std::vector<BlockView> &blkV);

/**
 * Compress uncompressed bodies segment by segment.
 * This is thread-safe.
 */
class SegmentCompressor
{
private:
    Compressor cmpr_;
    size_t concurrency_;
public:
    /**
     * @level zlib compression level [0, 9]. 0 means the zlib default.
     * @concurrency number of threads to compress. 0 means the number of cores.
     */
    explicit SegmentCompressor(size_t level = 0, size_t concurrency = 1)
        : cmpr_(level), concurrency_(concurrency) {}
    SegmentCompressor(std::unique_ptr<compressor_local::CompressorIF> &&engine, size_t concurrency)
        : cmpr_(std::move(engine)), concurrency_(concurrency) {}
    /**
     * Compress a segment into a block including its length prefix.
     * throws FormatError(CompressionEngineFailure).
     */
    Buffer compressSegment(const Segment &seg) const;
    /**
     * Append the compressed body of body[0, size) to out.
     */
    void run(const char *body, size_t size, Buffer &out) const;
};

/**
 * Decompress compressed bodies block by block.
 * This is thread-safe.
 */
class SegmentDecompressor
{
private:
    Uncompressor uncmpr_;
    size_t concurrency_;
public:
    explicit SegmentDecompressor(size_t concurrency = 1)
        : uncmpr_(), concurrency_(concurrency) {}
    SegmentDecompressor(std::unique_ptr<compressor_local::UncompressorIF> &&engine, size_t concurrency)
        : uncmpr_(std::move(engine)), concurrency_(concurrency) {}
    /**
     * Inflate a block to its segment.
     * throws FormatError(CorruptStream) if the block is not a valid stream.
     * Other engine errors are thrown as they are.
     */
    Buffer inflateBlock(const BlockView &blk) const;
    /**
     * Append the uncompressed body of body[0, size) to out.
     * The first error in the block order will be thrown
     * regardless of the concurrency.
     */
    void run(const char *body, size_t size, Buffer &out) const;
};

} // namespace dfcmpr
