#pragma once
#include <cstdint>
#include <cstddef>

namespace dfcmpr {

/* Header: version (u32 le) and compression flag (u32 le). */
const size_t HEADER_SIZE = 8;

/* Uncompressed bodies are cut into segments of this size. The last one may be shorter. */
const size_t SEGMENT_SIZE = 20000;

/* Each compressed block starts with its zlib stream size (u32 le). */
const size_t BLOCK_LENGTH_SIZE = 4;

const uint32_t FLAG_UNCOMPRESSED = 0;
const uint32_t FLAG_COMPRESSED = 1;

const size_t MAX_COMPRESSION_LEVEL = 9;

} // namespace dfcmpr
