#pragma once
/**
 * @file
 * @brief Utilities.
 * @author HOSHINO Takashi
 *
 * (C) 2012 Cybozu Labs, Inc.
 */
#include <memory>
#include <stdexcept>
#include <string>
#include <cstdarg>
#include <cstring>
#include <cstdint>
#include <cerrno>
#include <cstdio>
#include <cstdlib>

#include <sys/time.h>

#define DISABLE_COPY_AND_ASSIGN(ClassName)              \
    ClassName(const ClassName &rhs) = delete;           \
    ClassName &operator=(const ClassName &rhs) = delete

namespace dfcmpr {
namespace util {

/**
 * Formst string with va_list.
 */
inline std::string formatStringV(const char *format, va_list ap)
{
    char *p = nullptr;
    int ret = ::vasprintf(&p, format, ap);
    if (ret < 0) throw std::runtime_error("vasprintf failed.");
    try {
        std::string s(p, ret);
        ::free(p);
        return s;
    } catch (...) {
        ::free(p);
        throw;
    }
}

/**
 * Create a std::string using printf() like formatting.
 */
inline std::string formatString(const char * format, ...)
{
    std::string s;
    std::exception_ptr ep;
    va_list args;
    va_start(args, format);
    try {
        s = formatStringV(format, args);
    } catch (...) {
        ep = std::current_exception();
    }
    va_end(args);
    if (ep) std::rethrow_exception(ep);
    return s;
}

/**
 * Get unix time in double.
 */
inline double getTime()
{
    struct timeval tv;
    ::gettimeofday(&tv, NULL);
    return static_cast<double>(tv.tv_sec) +
        static_cast<double>(tv.tv_usec) / 1000000.0;
}

/**
 * Libc error wrapper.
 */
class LibcError : public std::exception
{
public:
    explicit LibcError(int errnum = errno, const std::string &msg = "libc_error:")
        : errnum_(errnum)
        , str_(generateMessage(errnum, msg)) {}
    const char *what() const noexcept override {
        return str_.c_str();
    }
    int errnum() const { return errnum_; }
private:
    int errnum_;
    std::string str_;
    static std::string generateMessage(int errnum, const std::string &msg) {
        std::string s(msg);
        const size_t BUF_SIZE = 1024;
        char buf[BUF_SIZE];
        ::snprintf(buf, BUF_SIZE, " %d ", errnum);
        s += buf;
        s += ::strerror_r(errnum, buf, BUF_SIZE);
        return s;
    }
};

inline void throwLibcError(const std::string &msg)
{
    throw LibcError(errno, msg);
}

}} // namespace dfcmpr::util
