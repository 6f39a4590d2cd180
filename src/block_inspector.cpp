#include "block_inspector.hpp"
#include "constant.hpp"
#include "segment.hpp"
#include "format_error.hpp"

namespace dfcmpr {

size_t FileInfo::origBodySize() const
{
    size_t total = 0;
    for (const BlockInfo &b : blocks) total += b.origSize;
    return total;
}

void FileInfo::print(::FILE *fp, bool isVerbose) const
{
    ::fprintf(fp, "version %u\n"
              "compressed %d\n"
              "body_size %zu\n"
              "blocks %zu\n"
              , header.version, header.compressed ? 1 : 0, bodySize, blocks.size());
    if (!header.compressed || isInflated) {
        ::fprintf(fp, "uncompressed_body_size %zu\n", origBodySize());
    }
    if (!isVerbose) return;
    for (const BlockInfo &b : blocks) {
        if (!header.compressed) {
            ::fprintf(fp, "segment %zu offset %zu size %zu\n", b.index, b.offset, b.origSize);
        } else if (isInflated) {
            ::fprintf(fp, "block %zu offset %zu cmpr_size %zu orig_size %zu\n"
                      , b.index, b.offset, b.cmprSize, b.origSize);
        } else {
            ::fprintf(fp, "block %zu offset %zu cmpr_size %zu\n", b.index, b.offset, b.cmprSize);
        }
    }
}

FileInfo inspect(const Buffer &in, bool doInflate)
{
    FileInfo info;
    info.header = decodeHeader(in);
    const char *body = in.data() + HEADER_SIZE;
    info.bodySize = in.size() - HEADER_SIZE;

    if (!info.header.compressed) {
        for (const Segment &seg : splitIntoSegments(body, info.bodySize)) {
            info.blocks.push_back(BlockInfo { seg.index, size_t(seg.data - body), 0, seg.size });
        }
        return info;
    }

    const SegmentDecompressor d;
    BlockReader reader(body, info.bodySize);
    BlockView blk;
    while (reader.next(blk)) {
        BlockInfo b { blk.index, blk.offset, blk.size, 0 };
        if (doInflate) b.origSize = d.inflateBlock(blk).size();
        info.blocks.push_back(b);
    }
    info.isInflated = doInflate;
    return info;
}

} // namespace dfcmpr
