#pragma once

#include "common/utils/ErrorCodes.hpp"

/**
 * @brief 应用异常基类
 */
class AppException : public std::exception {
private:
    int code_;
    std::string message_;

public:
    AppException(int code, std::string message)
        : code_(code), message_(std::move(message)) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    int getCode() const { return code_; }
    const std::string& getMessage() const { return message_; }
};

/**
 * 错误码定义见 ErrorCodes.hpp：
 * 1xxx - 配置错误，不重试
 * 3xxx - 链路/帧错误，由调用方决定是否重试
 * 4xxx - 设备拒绝指令，重试结果相同
 */

/**
 * @brief 配置异常 - 构造参数无效
 */
class ConfigException : public AppException {
public:
    explicit ConfigException(const std::string& message = "invalid configuration",
                             int code = ErrorCodes::CONFIG_ERROR)
        : AppException(code, message) {}
};

/**
 * @brief 从站地址超出可写范围 0x01-0xF7
 */
class InvalidAddressException : public ConfigException {
public:
    explicit InvalidAddressException(uint8_t address)
        : ConfigException(formatMessage(address), ErrorCodes::INVALID_ADDRESS), address_(address) {}

    uint8_t getAddress() const { return address_; }

private:
    uint8_t address_;

    static std::string formatMessage(uint8_t address) {
        std::ostringstream oss;
        oss << "slave address 0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
            << static_cast<int>(address) << " out of range [0x01, 0xF7]";
        return oss.str();
    }
};

/**
 * @brief 串口 IO 异常（打开/读/写失败，写入不完整）
 */
class IoException : public AppException {
public:
    explicit IoException(const std::string& message)
        : AppException(ErrorCodes::IO_ERROR, message) {}
};

/**
 * @brief 帧级错误基类
 */
class ProtocolException : public AppException {
public:
    explicit ProtocolException(const std::string& message, int code = ErrorCodes::MALFORMED_FRAME)
        : AppException(code, message) {}
};

/**
 * @brief 接收长度与期望帧长不一致
 */
class ShortReadException : public ProtocolException {
public:
    ShortReadException(size_t expected, size_t received)
        : ProtocolException("should get " + std::to_string(expected) + " bytes, but "
                                + std::to_string(received) + " received",
                            ErrorCodes::SHORT_READ),
          expected_(expected), received_(received) {}

    size_t getExpected() const { return expected_; }
    size_t getReceived() const { return received_; }

private:
    size_t expected_;
    size_t received_;
};

/**
 * @brief CRC 不匹配（线路噪声/数据损坏，可重试）
 */
class BadChecksumException : public ProtocolException {
public:
    BadChecksumException()
        : ProtocolException("received CRC is not valid", ErrorCodes::BAD_CHECKSUM) {}
};

/**
 * @brief 写入回显与请求不一致（写入可能未生效）
 */
class EchoMismatchException : public ProtocolException {
public:
    EchoMismatchException()
        : ProtocolException("response should be the same as the request", ErrorCodes::ECHO_MISMATCH) {}
};
