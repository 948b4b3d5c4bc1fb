#pragma once

#include "common/serial/Transport.hpp"

/**
 * @brief 脚本化链路：每次 write 后把下一条预置应答放入待读缓冲
 *
 * 状态放在共享的 Script 中，会话接管链路后测试仍可检查发送记录。
 */
class ScriptedTransport : public Transport {
public:
    struct Script {
        std::deque<std::vector<uint8_t>> replies;
        std::vector<std::vector<uint8_t>> writes;
        std::vector<uint8_t> pending;
        size_t reads = 0;
        size_t discards = 0;
        std::chrono::milliseconds readTimeout{0};
        bool closed = false;

        // 故障注入
        bool failWrite = false;
        bool failRead = false;
        std::optional<size_t> shortWrite;

        void reply(std::vector<uint8_t> bytes) { replies.push_back(std::move(bytes)); }
    };

    explicit ScriptedTransport(std::shared_ptr<Script> script, std::string identifier = "scripted0")
        : script_(std::move(script)), identifier_(std::move(identifier)) {}

    const std::string& identifier() const override { return identifier_; }

    bool isOpen() const override { return !script_->closed; }

    void setReadTimeout(std::chrono::milliseconds timeout) override {
        script_->readTimeout = timeout;
    }

    void discardInput() override {
        ++script_->discards;
        script_->pending.clear();
    }

    size_t write(const std::vector<uint8_t>& bytes) override {
        if (script_->failWrite) {
            throw IoException("scripted write failure");
        }
        script_->writes.push_back(bytes);
        if (!script_->replies.empty()) {
            auto& next = script_->replies.front();
            script_->pending.insert(script_->pending.end(), next.begin(), next.end());
            script_->replies.pop_front();
        }
        if (script_->shortWrite) {
            return std::min(*script_->shortWrite, bytes.size());
        }
        return bytes.size();
    }

    size_t read(uint8_t* buffer, size_t length) override {
        ++script_->reads;
        if (script_->failRead) {
            throw IoException("scripted read failure");
        }
        size_t n = std::min(length, script_->pending.size());
        std::copy_n(script_->pending.begin(), n, buffer);
        script_->pending.erase(script_->pending.begin(), script_->pending.begin() + static_cast<std::ptrdiff_t>(n));
        return n;
    }

    void close() override { script_->closed = true; }

private:
    std::shared_ptr<Script> script_;
    std::string identifier_;
};
