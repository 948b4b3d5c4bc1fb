#pragma once

#include "common/serial/Transport.hpp"
#include "common/protocol/pzem/Pzem.Types.hpp"

#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

/**
 * @brief POSIX 串口链路（termios 原始模式，8N1）
 *
 * 非阻塞打开，读操作用 poll 等待，直到填满缓冲区或读超时到期。
 * 析构时自动关闭文件描述符。
 */
class SerialTransport : public Transport {
    struct ConstructTag {
        explicit ConstructTag() = default;
    };

public:
    /**
     * @brief 打开并配置串口
     * @param identifier 设备路径
     * @param baudRate 波特率，0 表示默认 9600
     * @param readTimeout 读超时
     * @throws ConfigException 标识为空或波特率不支持
     * @throws IoException 打开或配置失败
     */
    static std::unique_ptr<SerialTransport> open(const std::string& identifier, int baudRate,
                                                 std::chrono::milliseconds readTimeout) {
        if (identifier.empty()) {
            throw ConfigException("serial port must be set");
        }
        if (baudRate == 0) {
            baudRate = pzem::DEFAULT_BAUD_RATE;
        }
        speed_t speed = baudToSpeed(baudRate);

        int fd = ::open(identifier.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd < 0) {
            throw IoException(errnoMessage("open " + identifier));
        }

        auto transport = std::make_unique<SerialTransport>(ConstructTag{}, identifier, fd, readTimeout);
        transport->configurePort(speed);

        LOG_INFO << "[Serial] Opened " << identifier << " @" << baudRate
                 << " baud, timeout=" << readTimeout.count() << "ms";
        return transport;
    }

    /** 仅供 open() 使用，fd 已打开 */
    SerialTransport(ConstructTag, std::string identifier, int fd, std::chrono::milliseconds readTimeout)
        : identifier_(std::move(identifier)), fd_(fd), readTimeout_(readTimeout) {}

    ~SerialTransport() override {
        close();
    }

    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    const std::string& identifier() const override { return identifier_; }

    bool isOpen() const override { return fd_ >= 0; }

    void setReadTimeout(std::chrono::milliseconds timeout) override {
        readTimeout_ = timeout;
    }

    void discardInput() override {
        if (fd_ >= 0) {
            ::tcflush(fd_, TCIFLUSH);
        }
    }

    size_t write(const std::vector<uint8_t>& bytes) override {
        ensureOpen("write");

        size_t sent = 0;
        while (sent < bytes.size()) {
            ssize_t n = ::write(fd_, bytes.data() + sent, bytes.size() - sent);
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    if (!waitFor(POLLOUT, readTimeout_)) {
                        throw IoException("write " + identifier_ + " timed out after "
                                          + std::to_string(sent) + "/" + std::to_string(bytes.size()) + " bytes");
                    }
                    continue;
                }
                throw IoException(errnoMessage("write " + identifier_));
            }
            sent += static_cast<size_t>(n);
        }

        // 确保请求在等待应答前已实际发出
        if (::tcdrain(fd_) != 0) {
            throw IoException(errnoMessage("tcdrain " + identifier_));
        }
        return sent;
    }

    size_t read(uint8_t* buffer, size_t length) override {
        ensureOpen("read");

        const auto deadline = std::chrono::steady_clock::now() + readTimeout_;
        size_t received = 0;

        while (received < length) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) break;

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            if (!waitFor(POLLIN, remaining)) break;

            ssize_t n = ::read(fd_, buffer + received, length - received);
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                throw IoException(errnoMessage("read " + identifier_));
            }
            if (n == 0) break;
            received += static_cast<size_t>(n);
        }

        if (received < length) {
            LOG_DEBUG << "[Serial] Read timeout on " << identifier_ << ": "
                      << received << "/" << length << " bytes";
        }
        return received;
    }

    void close() override {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
            LOG_INFO << "[Serial] Closed " << identifier_;
        }
    }

private:
    std::string identifier_;
    int fd_;
    std::chrono::milliseconds readTimeout_;

    void ensureOpen(const char* op) const {
        if (fd_ < 0) {
            throw IoException(std::string(op) + " failed: port " + identifier_ + " is closed");
        }
    }

    /** @return 是否就绪，超时返回 false */
    bool waitFor(short events, std::chrono::milliseconds timeout) {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = events;

        int timeoutMs = static_cast<int>(std::max<int64_t>(timeout.count(), 1));
        while (true) {
            int rc = ::poll(&pfd, 1, timeoutMs);
            if (rc == 0) return false;
            if (rc < 0) {
                if (errno == EINTR) continue;
                throw IoException(errnoMessage("poll " + identifier_));
            }
            if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
                throw IoException("serial port error/hangup on " + identifier_);
            }
            return true;
        }
    }

    void configurePort(speed_t speed) {
        struct termios tio;
        std::memset(&tio, 0, sizeof(tio));

        if (::tcgetattr(fd_, &tio) != 0) {
            throw IoException(errnoMessage("tcgetattr " + identifier_));
        }

        // 原始模式
        tio.c_iflag &= static_cast<tcflag_t>(~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR |
                                               IGNCR | ICRNL | IXON | IXOFF | IXANY));
        tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
        tio.c_lflag &= static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));

        // 8N1，无硬件流控
        tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARENB | PARODD | CSTOPB | CRTSCTS));
        tio.c_cflag |= static_cast<tcflag_t>(CS8 | CLOCAL | CREAD);

        // 由 poll 控制等待，read 立即返回
        tio.c_cc[VMIN] = 0;
        tio.c_cc[VTIME] = 0;

        ::cfsetispeed(&tio, speed);
        ::cfsetospeed(&tio, speed);

        if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
            throw IoException(errnoMessage("tcsetattr " + identifier_));
        }

        ::tcflush(fd_, TCIOFLUSH);
    }

    static speed_t baudToSpeed(int baud) {
        switch (baud) {
            case 1200: return B1200;
            case 2400: return B2400;
            case 4800: return B4800;
            case 9600: return B9600;
            case 19200: return B19200;
            case 38400: return B38400;
            case 57600: return B57600;
            case 115200: return B115200;
            default:
                throw ConfigException("unsupported baud rate: " + std::to_string(baud));
        }
    }

    static std::string errnoMessage(const std::string& op) {
        return op + " failed: " + std::strerror(errno);
    }
};
