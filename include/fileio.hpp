#pragma once
/**
 * @file
 * @brief File IO utilities.
 * @author HOSHINO Takashi
 *
 * (C) 2012 Cybozu Labs, Inc.
 */
#include <string>

#include <unistd.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/stat.h>

#include "util.hpp"

namespace dfcmpr {
namespace util {

/**
 * Eof error for IO.
 */
class EofError : public std::exception {
public:
    const char *what() const noexcept override {
        return "eof error";
    }
};

/**
 * A simple file/fd operators.
 * close() will be called in the destructor when you forget to call it.
 */
class File
{
private:
    int fd_;
    bool autoClose_;

    void throwOpenError(const std::string& filePath) const {
        std::string s("open failed: ");
        s += filePath;
        throwLibcError(s);
    }
public:
    File()
        : fd_(-1), autoClose_(false) {
    }
    File(const std::string& filePath, int flags)
        : File() {
        if (!open(filePath, flags)) throwOpenError(filePath);
    }
    File(const std::string& filePath, int flags, mode_t mode)
        : File() {
        if (!open(filePath, flags, mode)) throwOpenError(filePath);
    }
    explicit File(int fd, bool autoClose = false)
        : fd_(fd), autoClose_(autoClose) {
    }
    DISABLE_COPY_AND_ASSIGN(File);
    ~File() noexcept {
        if (autoClose_ && fd_ >= 0) ::close(fd_);
    }
    bool open(const std::string& filePath, int flags) {
        fd_ = ::open(filePath.c_str(), flags);
        autoClose_ = true;
        return fd_ >= 0;
    }
    bool open(const std::string& filePath, int flags, mode_t mode) {
        fd_ = ::open(filePath.c_str(), flags, mode);
        autoClose_ = true;
        return fd_ >= 0;
    }
    void close() {
        if (!autoClose_ || fd_ < 0) return;
        const int fd = fd_;
        fd_ = -1;
        if (::close(fd) < 0) {
            throwLibcError("close failed.");
        }
    }
    size_t readsome(void *data, size_t size) {
        ssize_t r;
        do {
            r = ::read(fd_, data, size);
        } while (r < 0 && errno == EINTR);
        if (r < 0) throwLibcError("read failed.");
        return r;
    }
    void read(void *data, size_t size) {
        char *buf = reinterpret_cast<char *>(data);
        size_t s = 0;
        while (s < size) {
            size_t r = readsome(&buf[s], size - s);
            if (r == 0) throw EofError();
            s += r;
        }
    }
    void write(const void *data, size_t size) {
        const char *buf = reinterpret_cast<const char *>(data);
        size_t s = 0;
        while (s < size) {
            ssize_t r = ::write(fd_, &buf[s], size - s);
            if (r < 0) {
                if (errno == EINTR) continue;
                throwLibcError("write failed.");
            }
            if (r == 0) throw EofError();
            s += r;
        }
    }
    void fdatasync() {
        if (::fdatasync(fd_) < 0) {
            throwLibcError("fdatasync failed.");
        }
    }
};

/**
 * Read all contents from a file.
 *
 * String: it must have size(), resize(), and operator[].
 *   such as std::string and std::vector<char>.
 */
template <typename String>
inline void readAllFromFile(File &file, String &buf)
{
    constexpr const size_t usize = 65536; // unit size.
    size_t rsize = buf.size(); // read data will be appended to buf.

    for (;;) {
        if (buf.size() < rsize + usize) buf.resize(rsize + usize);
        const size_t r = file.readsome(&buf[rsize], usize);
        if (r == 0) break;
        rsize += r;
    }
    buf.resize(rsize);
}

template <typename String>
inline void readAllFromFile(const std::string &path, String &buf)
{
    File file(path, O_RDONLY);
    readAllFromFile(file, buf);
    file.close();
}

template <typename String>
inline void writeAllToFile(File &file, const String &buf)
{
    if (buf.empty()) return;
    file.write(&buf[0], buf.size());
}

}} //namespace dfcmpr::util
