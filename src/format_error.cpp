#include "format_error.hpp"

namespace dfcmpr {

const char *FormatError::kindToStr(Kind kind)
{
    switch (kind) {
    case Truncated: return "truncated";
    case InvalidFlag: return "invalid flag";
    case CorruptStream: return "corrupt stream";
    case CompressionEngineFailure: return "compression engine failure";
    case AlreadyConverted: return "already converted";
    }
    return "unknown";
}

} // namespace dfcmpr
