#include "segment.hpp"
#include <algorithm>
#include <cstring>
#include <limits>
#include "format_error.hpp"
#include "header_codec.hpp"
#include "thread_util.hpp"
#include "cybozu/exception.hpp"

namespace dfcmpr {

std::vector<Segment> splitIntoSegments(const char *body, size_t size)
{
    std::vector<Segment> segV;
    segV.reserve(countSegments(size));
    size_t off = 0;
    while (off < size) {
        const size_t s = std::min(SEGMENT_SIZE, size - off);
        segV.push_back(Segment { segV.size(), body + off, s });
        off += s;
    }
    return segV;
}

bool BlockReader::next(BlockView &blk)
{
    if (off_ == size_) return false;
    const size_t rest = size_ - off_;
    if (rest < BLOCK_LENGTH_SIZE) {
        throw FormatError(FormatError::Truncated, "length prefix") << index_ << off_ << rest;
    }
    const size_t len = getLe32(body_ + off_);
    if (rest - BLOCK_LENGTH_SIZE < len) {
        throw FormatError(FormatError::Truncated, "block")
            << index_ << off_ << len << (rest - BLOCK_LENGTH_SIZE);
    }
    blk.index = index_;
    blk.offset = off_;
    blk.data = body_ + off_ + BLOCK_LENGTH_SIZE;
    blk.size = len;
    off_ += BLOCK_LENGTH_SIZE + len;
    index_++;
    return true;
}

std::exception_ptr readAllBlocks(const char *body, size_t size, std::vector<BlockView> &blkV)
{
    BlockReader reader(body, size);
    try {
        BlockView blk;
        while (reader.next(blk)) {
            blkV.push_back(blk);
        }
    } catch (FormatError &) {
        return std::current_exception();
    }
    return std::exception_ptr();
}

Buffer SegmentCompressor::compressSegment(const Segment &seg) const
{
    const size_t maxOutSize = cmpr_.maxOutSize(seg.size);
    Buffer blk(BLOCK_LENGTH_SIZE + maxOutSize);
    size_t outSize;
    if (!cmpr_.run(&blk[BLOCK_LENGTH_SIZE], &outSize, maxOutSize, seg.data, seg.size)) {
        throw FormatError(FormatError::CompressionEngineFailure) << seg.index << seg.size;
    }
    if (outSize > maxOutSize || outSize > std::numeric_limits<uint32_t>::max()) {
        throw FormatError(FormatError::CompressionEngineFailure, "bad size") << seg.index << outSize;
    }
    putLe32(&blk[0], uint32_t(outSize));
    blk.resize(BLOCK_LENGTH_SIZE + outSize);
    return blk;
}

void SegmentCompressor::run(const char *body, size_t size, Buffer &out) const
{
    std::vector<Buffer> blkV = thread::convertInOrder<Segment, Buffer>(
        splitIntoSegments(body, size),
        [this](Segment &&seg) { return compressSegment(seg); },
        concurrency_);

    size_t total = out.size();
    for (const Buffer &blk : blkV) total += blk.size();
    out.reserve(total);
    for (const Buffer &blk : blkV) {
        out.insert(out.end(), blk.begin(), blk.end());
    }
}

Buffer SegmentDecompressor::inflateBlock(const BlockView &blk) const
{
    Buffer seg(SEGMENT_SIZE);
    size_t s;
    try {
        s = uncmpr_.run(seg.data(), seg.size(), blk.data, blk.size);
    } catch (InvalidStreamError &e) {
        throw FormatError(FormatError::CorruptStream) << blk.index << blk.offset << e.what();
    }
    seg.resize(s);
    return seg;
}

namespace {

/**
 * A segment or the format error of its block.
 * Workers do not throw format errors so that
 * they can be reported in the block order.
 */
struct InflatedBlock
{
    Buffer seg;
    std::exception_ptr ep;
};

} // namespace

void SegmentDecompressor::run(const char *body, size_t size, Buffer &out) const
{
    std::vector<BlockView> blkV;
    const std::exception_ptr framingError = readAllBlocks(body, size, blkV);

    std::vector<InflatedBlock> resV = thread::convertInOrder<BlockView, InflatedBlock>(
        std::move(blkV),
        [this](BlockView &&blk) -> InflatedBlock {
            InflatedBlock res;
            try {
                res.seg = inflateBlock(blk);
            } catch (FormatError &) {
                res.ep = std::current_exception();
            }
            return res;
        },
        concurrency_);

    /* Blocks before a framing error come before it. */
    size_t total = out.size();
    for (const InflatedBlock &res : resV) {
        if (res.ep) std::rethrow_exception(res.ep);
        total += res.seg.size();
    }
    if (framingError) std::rethrow_exception(framingError);

    out.reserve(total);
    for (const InflatedBlock &res : resV) {
        out.insert(out.end(), res.seg.begin(), res.seg.end());
    }
}

} // namespace dfcmpr
