#pragma once
/**
 * @file
 * @brief compressor/uncompressor class
 * @author MITSUNARI Shigeo
 *
 * (C) 2013 Cybozu Labs, Inc.
 */
#include <memory>
#include <string>
#include "util.hpp"
#include "cybozu/exception.hpp"

namespace dfcmpr {

/**
 * Thrown by uncompressors when the input is not a valid stream.
 * Resource failures are thrown as plain cybozu::Exception.
 */
class InvalidStreamError : public cybozu::Exception
{
public:
    explicit InvalidStreamError(const std::string &name)
        : cybozu::Exception(name) {}
    template <typename T>
    InvalidStreamError& operator<<(const T& t) {
        cybozu::Exception::operator<<(t);
        return *this;
    }
};

namespace compressor_local {

/**
 * run() is called from several threads at once,
 * so implementations must not keep per-call state in members.
 */
struct CompressorIF {
    virtual ~CompressorIF() noexcept {}
    virtual bool run(void *out, size_t *outSize, size_t maxOutSize, const void *in, size_t inSize) const = 0;
    virtual size_t maxOutSize(size_t inSize) const = 0;
};

struct UncompressorIF {
    virtual ~UncompressorIF() noexcept {}
    virtual size_t run(void *out, size_t maxOutSize, const void *in, size_t inSize) const = 0;
};

} // namespace compressor_local

struct CompressorZlib : compressor_local::CompressorIF {
    int compressionLevel_;
    /**
     * @compressionLevel [0, 9]. 0 means the zlib default.
     */
    explicit CompressorZlib(size_t compressionLevel);
    bool run(void *out, size_t *outSize, size_t maxOutSize, const void *in, size_t inSize) const override;
    size_t maxOutSize(size_t inSize) const override;
};

struct UncompressorZlib : compressor_local::UncompressorIF {
    /**
     * The zlib stream must end exactly at in + inSize.
     * throws InvalidStreamError when the stream is broken,
     * when it does not end at the end of in, or when it does not fit in maxOutSize.
     * throws cybozu::Exception when zlib runs out of memory.
     */
    size_t run(void *out, size_t maxOutSize, const void *in, size_t inSize) const override;
};

/**
 * compression class
 */
class Compressor
{
public:
    /**
     * @param compressionLevel [in] [0, 9] (0 means zlib default)
     */
    explicit Compressor(size_t compressionLevel = 0)
        : engine_(new CompressorZlib(compressionLevel)) {
    }
    explicit Compressor(std::unique_ptr<compressor_local::CompressorIF> &&engine)
        : engine_(std::move(engine)) {
    }
    /**
     * compress data
     * @param out [out] compressed data
     * @param outSize [out] compressed size
     * @param maxOutSize [in] maximum output size
     * @param in [in] input data
     * @param inSize [in] input size
     * @return success
     */
    bool run(void *out, size_t *outSize, size_t maxOutSize, const void *in, size_t inSize) const {
        return engine_->run(out, outSize, maxOutSize, in, inSize);
    }
    /**
     * Enough output buffer size for inSize bytes of input.
     */
    size_t maxOutSize(size_t inSize) const {
        return engine_->maxOutSize(inSize);
    }
private:
    DISABLE_COPY_AND_ASSIGN(Compressor);
    std::unique_ptr<compressor_local::CompressorIF> engine_;
};

/**
 * uncompression class
 */
class Uncompressor
{
public:
    Uncompressor()
        : engine_(new UncompressorZlib()) {
    }
    explicit Uncompressor(std::unique_ptr<compressor_local::UncompressorIF> &&engine)
        : engine_(std::move(engine)) {
    }
    /**
     * uncompress data
     * @param out [out] uncompressed data
     * @param maxOutSize [in] maximum output size
     * @param in [in] input compressed data
     * @param inSize [in] input size
     * @return uncompressed size
     */
    size_t run(void *out, size_t maxOutSize, const void *in, size_t inSize) const {
        return engine_->run(out, maxOutSize, in, inSize);
    }
private:
    DISABLE_COPY_AND_ASSIGN(Uncompressor);
    std::unique_ptr<compressor_local::UncompressorIF> engine_;
};

} // namespace dfcmpr
