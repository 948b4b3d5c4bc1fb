#pragma once

/**
 * @brief 字节流链路抽象（半双工，单会话独占）
 *
 * 读写失败抛出 IoException。read 在超时前返回已收到的字节数，
 * 不足期望长度时由协议层按 ShortRead 处理，链路层不重试。
 */
class Transport {
public:
    virtual ~Transport() = default;

    /** 链路标识（如 /dev/ttyUSB0） */
    virtual const std::string& identifier() const = 0;

    virtual bool isOpen() const = 0;

    /** 设置读超时（整帧等待上限） */
    virtual void setReadTimeout(std::chrono::milliseconds timeout) = 0;

    /** 丢弃尚未读取的输入（发送请求前清理残留字节） */
    virtual void discardInput() {}

    /** @return 实际写入字节数 */
    virtual size_t write(const std::vector<uint8_t>& bytes) = 0;

    /** @return 实际读取字节数（超时则可能少于 length） */
    virtual size_t read(uint8_t* buffer, size_t length) = 0;

    virtual void close() = 0;
};
