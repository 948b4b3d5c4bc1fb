#include <gtest/gtest.h>

#include "common/serial/SerialTransport.hpp"

#include <cstdlib>

using namespace std::chrono_literals;

namespace {

/** 伪终端：master 端模拟设备，slave 路径交给 SerialTransport 打开 */
class PseudoTerminal {
public:
    PseudoTerminal() {
        master_ = ::posix_openpt(O_RDWR | O_NOCTTY);
        if (master_ >= 0 && ::grantpt(master_) == 0 && ::unlockpt(master_) == 0) {
            const char* name = ::ptsname(master_);
            if (name) slavePath_ = name;
        }
    }

    ~PseudoTerminal() {
        if (master_ >= 0) ::close(master_);
    }

    bool ready() const { return !slavePath_.empty(); }
    const std::string& slavePath() const { return slavePath_; }

    void send(const std::vector<uint8_t>& bytes) {
        ASSERT_EQ(::write(master_, bytes.data(), bytes.size()), static_cast<ssize_t>(bytes.size()));
    }

    std::vector<uint8_t> receive(size_t length) {
        std::vector<uint8_t> buffer(length);
        size_t got = 0;
        while (got < length) {
            pollfd pfd{master_, POLLIN, 0};
            if (::poll(&pfd, 1, 1000) <= 0) break;
            ssize_t n = ::read(master_, buffer.data() + got, length - got);
            if (n <= 0) break;
            got += static_cast<size_t>(n);
        }
        buffer.resize(got);
        return buffer;
    }

private:
    int master_ = -1;
    std::string slavePath_;
};

}  // namespace

TEST(SerialTransportTest, RejectsEmptyIdentifier) {
    EXPECT_THROW(SerialTransport::open("", 9600, 100ms), ConfigException);
}

TEST(SerialTransportTest, RejectsUnsupportedBaudRate) {
    EXPECT_THROW(SerialTransport::open("/dev/null", 14400, 100ms), ConfigException);
}

TEST(SerialTransportTest, MissingDeviceIsIoError) {
    EXPECT_THROW(SerialTransport::open("/dev/pzem-does-not-exist", 9600, 100ms), IoException);
}

TEST(SerialTransportTest, WritesAndReadsThroughPty) {
    PseudoTerminal pty;
    if (!pty.ready()) GTEST_SKIP() << "pseudo terminal unavailable";

    auto transport = SerialTransport::open(pty.slavePath(), 0, 500ms);
    ASSERT_TRUE(transport->isOpen());
    EXPECT_EQ(transport->identifier(), pty.slavePath());

    std::vector<uint8_t> request = {0xF8, 0x04, 0x00, 0x00, 0x00, 0x0A, 0x64, 0x64};
    EXPECT_EQ(transport->write(request), request.size());
    EXPECT_EQ(pty.receive(request.size()), request);

    std::vector<uint8_t> reply = {0xF8, 0x42, 0xC2, 0x41};
    pty.send(reply);
    uint8_t buffer[4] = {};
    ASSERT_EQ(transport->read(buffer, sizeof(buffer)), 4u);
    EXPECT_EQ(std::vector<uint8_t>(buffer, buffer + 4), reply);
}

TEST(SerialTransportTest, ReadReturnsPartialCountOnTimeout) {
    PseudoTerminal pty;
    if (!pty.ready()) GTEST_SKIP() << "pseudo terminal unavailable";

    auto transport = SerialTransport::open(pty.slavePath(), 9600, 200ms);
    pty.send({0x01, 0x02});

    uint8_t buffer[8] = {};
    EXPECT_EQ(transport->read(buffer, sizeof(buffer)), 2u);

    transport->setReadTimeout(50ms);
    EXPECT_EQ(transport->read(buffer, sizeof(buffer)), 0u);
}

TEST(SerialTransportTest, ClosedPortRejectsIo) {
    PseudoTerminal pty;
    if (!pty.ready()) GTEST_SKIP() << "pseudo terminal unavailable";

    auto transport = SerialTransport::open(pty.slavePath(), 9600, 100ms);
    transport->close();
    EXPECT_FALSE(transport->isOpen());

    uint8_t buffer[1];
    EXPECT_THROW(transport->read(buffer, 1), IoException);
    EXPECT_THROW(transport->write({0x00}), IoException);
}
