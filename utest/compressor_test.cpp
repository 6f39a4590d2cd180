#include "compressor.hpp"
#include <cybozu/test.hpp>
#include "constant.hpp"
#include "for_test.hpp"

using namespace dfcmpr;

void test(size_t level)
{
    const std::string in = "aaaabbbbccccddddeeeeffffgggghhhhiiiijjjjjaaaaaaaaaaaaabbbcccxxxxxxxxxxxxxxxxxsssssssssssssssssssssssssssssssss";
    Compressor c(level);
    std::string enc;
    enc.resize(c.maxOutSize(in.size()));
    size_t encSize;
    bool ret = c.run(&enc[0], &encSize, enc.size(), in.data(), in.size());
    CYBOZU_TEST_ASSERT(ret);
    printf("level=%zu inSize=%d, encSize=%d\n", level, (int)in.size(), (int)encSize);
    std::string dec;
    Uncompressor d;
    dec.resize(in.size() + 10);
    size_t decSize = d.run(&dec[0], dec.size(), &enc[0], encSize);
    CYBOZU_TEST_EQUAL(decSize, in.size());
    dec.resize(decSize);
    CYBOZU_TEST_EQUAL(dec, in);
}

CYBOZU_TEST_AUTO(testCompressor)
{
    for (size_t level = 0; level <= MAX_COMPRESSION_LEVEL; level++) {
        test(level);
    }
    CYBOZU_TEST_EXCEPTION(Compressor(MAX_COMPRESSION_LEVEL + 1), cybozu::Exception);
}

static std::string compressStr(const std::string &in)
{
    Compressor c;
    std::string enc(c.maxOutSize(in.size()), '\0');
    size_t encSize;
    if (!c.run(&enc[0], &encSize, enc.size(), in.data(), in.size())) {
        throw std::runtime_error("compressStr failed");
    }
    enc.resize(encSize);
    return enc;
}

CYBOZU_TEST_AUTO(uncompressErrors)
{
    const std::string in(1000, 'a');
    const std::string enc = compressStr(in);
    Uncompressor d;
    std::string dec(in.size(), '\0');

    /* exact size is enough. */
    CYBOZU_TEST_EQUAL(d.run(&dec[0], in.size(), enc.data(), enc.size()), in.size());
    CYBOZU_TEST_EQUAL(dec, in);

    /* output does not fit. */
    CYBOZU_TEST_EXCEPTION(d.run(&dec[0], in.size() - 1, enc.data(), enc.size()), InvalidStreamError);

    /* stream is cut. */
    CYBOZU_TEST_EXCEPTION(d.run(&dec[0], dec.size(), enc.data(), enc.size() - 1), InvalidStreamError);

    /* extra bytes after the stream end. */
    const std::string enc2 = enc + "x";
    CYBOZU_TEST_EXCEPTION(d.run(&dec[0], dec.size(), enc2.data(), enc2.size()), InvalidStreamError);

    /* not a zlib stream. */
    const std::string garbage(16, 'z');
    CYBOZU_TEST_EXCEPTION(d.run(&dec[0], dec.size(), garbage.data(), garbage.size()), InvalidStreamError);

    /* empty input. */
    CYBOZU_TEST_EXCEPTION(d.run(&dec[0], dec.size(), enc.data(), 0), InvalidStreamError);
}

CYBOZU_TEST_AUTO(emptyInput)
{
    const std::string enc = compressStr("");
    CYBOZU_TEST_ASSERT(!enc.empty());
    Uncompressor d;
    char dummy[1];
    CYBOZU_TEST_EQUAL(d.run(dummy, sizeof(dummy), enc.data(), enc.size()), 0u);
}
