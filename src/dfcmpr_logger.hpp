#pragma once
/**
 * @file
 * @brief Stream-style wrapper of cybozu logger.
 * @author HOSHINO Takashi
 *
 * (C) 2013 Cybozu Labs, Inc.
 */
#include "cybozu/log.hpp"
#include <sstream>
#include <string>

#define LOGs dfcmpr::Logger()

namespace dfcmpr {

/**
 * Output target and priority are set by util::setLogSetting().
 * Default target of cybozu logger is syslog.
 *
 * Usage:
 *   LOGs.error() << "bad block" << index << offset;
 * Items are joined with ':' and put as one line.
 */
class Logger
{
public:
    static const char *priStr(cybozu::LogPriority pri) noexcept;
    void write(cybozu::LogPriority pri, const std::string &msg) const noexcept {
        cybozu::PutLog(pri, "%s %s", priStr(pri), msg.c_str());
    }

    template <cybozu::LogPriority priority>
    class Line
    {
        const Logger &logger_;
        std::string s_;
    public:
        explicit Line(const Logger &logger) : logger_(logger) {}
        Line(Line &&rhs) : logger_(rhs.logger_), s_(std::move(rhs.s_)) {}
        ~Line() noexcept {
            if (!s_.empty()) logger_.write(priority, s_);
        }
        template <typename T>
        Line &operator<<(const T &t) {
            std::ostringstream os;
            if (!s_.empty()) os << ':';
            os << t;
            s_ += os.str();
            return *this;
        }
    };

    Line<cybozu::LogDebug> debug() const { return Line<cybozu::LogDebug>(*this); }
    Line<cybozu::LogInfo> info() const { return Line<cybozu::LogInfo>(*this); }
    Line<cybozu::LogError> error() const { return Line<cybozu::LogError>(*this); }
};

} // namespace dfcmpr
