#include "compressor.hpp"
#include "constant.hpp"
#include <cstring>
#include <zlib.h>
#include "cybozu/exception.hpp"

namespace dfcmpr {

CompressorZlib::CompressorZlib(size_t compressionLevel)
    : compressionLevel_(compressionLevel == 0 ? Z_DEFAULT_COMPRESSION : int(compressionLevel))
{
    if (compressionLevel > MAX_COMPRESSION_LEVEL) {
        throw cybozu::Exception("CompressorZlib:bad compressionLevel") << compressionLevel;
    }
}

bool CompressorZlib::run(void *out, size_t *outSize, size_t maxOutSize, const void *in, size_t inSize) const
{
    uLongf destLen = maxOutSize;
    const int ret = ::compress2(static_cast<Bytef *>(out), &destLen,
                                static_cast<const Bytef *>(in), uLong(inSize), compressionLevel_);
    if (ret != Z_OK) return false;
    *outSize = destLen;
    return true;
}

size_t CompressorZlib::maxOutSize(size_t inSize) const
{
    return ::compressBound(uLong(inSize));
}

size_t UncompressorZlib::run(void *out, size_t maxOutSize, const void *in, size_t inSize) const
{
    z_stream z;
    ::memset(&z, 0, sizeof(z));
    if (::inflateInit(&z) != Z_OK) {
        throw cybozu::Exception("UncompressorZlib:inflateInit") << (z.msg ? z.msg : "");
    }
    z.next_in = static_cast<Bytef *>(const_cast<void *>(in));
    z.avail_in = uInt(inSize);
    z.next_out = static_cast<Bytef *>(out);
    z.avail_out = uInt(maxOutSize);

    const int ret = ::inflate(&z, Z_FINISH);
    const size_t outSize = maxOutSize - z.avail_out;
    const size_t restIn = z.avail_in;
    const std::string msg(z.msg ? z.msg : "");
    ::inflateEnd(&z);

    if (ret == Z_STREAM_END) {
        if (restIn != 0) {
            throw InvalidStreamError("UncompressorZlib:trailing bytes") << restIn;
        }
        return outSize;
    }
    if (ret == Z_BUF_ERROR || ret == Z_OK) {
        if (outSize == maxOutSize) {
            throw InvalidStreamError("UncompressorZlib:output too large") << maxOutSize;
        }
        throw InvalidStreamError("UncompressorZlib:stream not terminated") << inSize;
    }
    if (ret == Z_MEM_ERROR) {
        throw cybozu::Exception("UncompressorZlib:inflate") << ret << msg;
    }
    throw InvalidStreamError("UncompressorZlib:inflate") << ret << msg;
}

} // namespace dfcmpr
