#include "dfcmpr_logger.hpp"

namespace dfcmpr {

const char *Logger::priStr(cybozu::LogPriority pri) noexcept
{
    switch (pri) {
    case cybozu::LogDebug: return "DEBUG";
    case cybozu::LogInfo: return "INFO";
    case cybozu::LogWarning: return "WARNING";
    case cybozu::LogError: return "ERROR";
    default: return "UNKNOWN";
    }
}

} // namespace dfcmpr
