#pragma once
/**
 * @file
 * @brief Errors of the save file format.
 */
#include <string>
#include "cybozu/exception.hpp"

namespace dfcmpr {

/**
 * Any failure of a conversion.
 * The whole conversion is aborted, there is no partial output.
 */
class FormatError : public cybozu::Exception
{
public:
    enum Kind {
        /* input ends before a header, a length prefix or a block is complete. */
        Truncated,
        /* compression flag is neither 0 nor 1. */
        InvalidFlag,
        /* a block does not inflate to a segment. */
        CorruptStream,
        /* deflate itself failed. */
        CompressionEngineFailure,
        /* the input already has the target flag (strict mode only). */
        AlreadyConverted,
    };

    explicit FormatError(Kind kind, const std::string &msg = "")
        : cybozu::Exception("FormatError"), kind_(kind) {
        cybozu::Exception::operator<<(kindToStr(kind));
        if (!msg.empty()) cybozu::Exception::operator<<(msg);
    }
    Kind kind() const { return kind_; }

    template <typename T>
    FormatError& operator<<(const T& t) {
        cybozu::Exception::operator<<(t);
        return *this;
    }

    static const char *kindToStr(Kind kind);
private:
    Kind kind_;
};

} // namespace dfcmpr
