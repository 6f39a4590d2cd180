#include "cybozu/test.hpp"
#include "header_codec.hpp"
#include "for_test.hpp"

using namespace dfcmpr;

CYBOZU_TEST_AUTO(le32)
{
    const char a[] = { 42, 0, 0, 0 };
    CYBOZU_TEST_EQUAL(getLe32(a), 42u);
    const char b[] = { 1, 2, 3, 4 };
    CYBOZU_TEST_EQUAL(getLe32(b), (4u << 24) + (3u << 16) + (2u << 8) + 1u);

    char c[4];
    putLe32(c, 11111111);
    CYBOZU_TEST_EQUAL(getLe32(c), 11111111u);
    putLe32(c, 0xfffffffe);
    CYBOZU_TEST_EQUAL(int(uint8_t(c[0])), 0xfe);
    CYBOZU_TEST_EQUAL(int(uint8_t(c[3])), 0xff);
}

CYBOZU_TEST_AUTO(decode)
{
    const Header h0 = decodeHeader(makeSaveFile(1, 0, Buffer()));
    CYBOZU_TEST_EQUAL(h0.version, 1u);
    CYBOZU_TEST_ASSERT(!h0.compressed);

    const Header h1 = decodeHeader(makeSaveFile(0x01020304, 1, Buffer(3, 'x')));
    CYBOZU_TEST_EQUAL(h1.version, 0x01020304u);
    CYBOZU_TEST_ASSERT(h1.compressed);

    /* version is opaque, even 0 is accepted. */
    CYBOZU_TEST_EQUAL(decodeHeader(makeSaveFile(0, 1, Buffer())).version, 0u);
}

CYBOZU_TEST_AUTO(encode)
{
    const Header h(1234, true);
    Buffer buf;
    appendHeader(h, buf);
    CYBOZU_TEST_EQUAL(buf.size(), HEADER_SIZE);
    CYBOZU_TEST_ASSERT(buf == makeSaveFile(1234, 1, Buffer()));
    CYBOZU_TEST_ASSERT(decodeHeader(buf) == h);

    char raw[HEADER_SIZE];
    encodeHeader(Header(0xffffffff, false), raw);
    CYBOZU_TEST_EQUAL(getLe32(raw), 0xffffffffu);
    CYBOZU_TEST_EQUAL(getLe32(raw + 4), 0u);
}

CYBOZU_TEST_AUTO(truncated)
{
    const Buffer file = makeSaveFile(1, 0, Buffer());
    for (size_t i = 0; i < HEADER_SIZE; i++) {
        CYBOZU_TEST_EQUAL(getErrorKind([&]() { decodeHeader(file.data(), i); }),
                          FormatError::Truncated);
    }
    CYBOZU_TEST_EQUAL(getErrorKind([]() { decodeHeader(Buffer()); }), FormatError::Truncated);
}

CYBOZU_TEST_AUTO(invalidFlag)
{
    CYBOZU_TEST_EQUAL(getErrorKind([]() { decodeHeader(makeSaveFile(1, 2, Buffer())); }),
                      FormatError::InvalidFlag);
    CYBOZU_TEST_EQUAL(getErrorKind([]() { decodeHeader(makeSaveFile(1, 0x100, Buffer())); }),
                      FormatError::InvalidFlag);
    CYBOZU_TEST_EXCEPTION(decodeHeader(makeSaveFile(1, 0xffffffff, Buffer())), cybozu::Exception);
}
