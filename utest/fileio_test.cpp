#include <cstdlib>
#include <string>
#include "cybozu/test.hpp"
#include "fileio.hpp"
#include "dfcmpr_util.hpp"
#include "for_test.hpp"

using namespace dfcmpr;

class TmpPath
{
    std::string path_;
public:
    TmpPath() {
        char name[] = "/tmp/dfcmpr_test_XXXXXX";
        const int fd = ::mkstemp(name);
        if (fd < 0) util::throwLibcError("mkstemp failed.");
        ::close(fd);
        path_ = name;
    }
    ~TmpPath() noexcept {
        ::unlink(path_.c_str());
    }
    const std::string &str() const { return path_; }
};

CYBOZU_TEST_AUTO(saveAndLoad)
{
    TmpPath tmp;
    const Buffer buf = randomBody(200000);
    util::saveOutput(tmp.str(), buf);
    Buffer buf2;
    util::loadInput(tmp.str(), buf2);
    CYBOZU_TEST_ASSERT(buf == buf2);

    /* truncate the existing file. */
    util::saveOutput(tmp.str(), Buffer(3, 'a'));
    Buffer buf3;
    util::readAllFromFile(tmp.str(), buf3);
    CYBOZU_TEST_ASSERT(buf3 == Buffer(3, 'a'));

    util::saveOutput(tmp.str(), Buffer());
    Buffer buf4(5, 'x');
    util::loadInput(tmp.str(), buf4);
    /* read data is appended. */
    CYBOZU_TEST_ASSERT(buf4 == Buffer(5, 'x'));
}

CYBOZU_TEST_AUTO(openError)
{
    Buffer buf;
    CYBOZU_TEST_EXCEPTION(util::loadInput("/nonexistent/dfcmpr/file", buf), util::LibcError);
    CYBOZU_TEST_EXCEPTION(util::saveOutput("/nonexistent/dfcmpr/file", buf), util::LibcError);
}

CYBOZU_TEST_AUTO(eof)
{
    TmpPath tmp;
    util::saveOutput(tmp.str(), Buffer(10, 'b'));
    util::File file(tmp.str(), O_RDONLY);
    char data[20];
    CYBOZU_TEST_EXCEPTION(file.read(data, sizeof(data)), util::EofError);
    file.close();
}
