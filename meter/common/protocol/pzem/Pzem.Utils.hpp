#pragma once

#include "Pzem.Types.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <iomanip>

namespace pzem {

/**
 * @brief PZEM 协议工具类
 * CRC16 计算/校验、请求帧构建、应答帧准入检查
 */
class PzemUtils {
public:
    // ==================== CRC16 (Modbus RTU) ====================

    static uint16_t crc16(const uint8_t* data, size_t len) {
        uint16_t crc = 0xFFFF;
        for (size_t i = 0; i < len; ++i) {
            crc ^= data[i];
            for (int j = 0; j < 8; ++j) {
                if (crc & 0x0001) {
                    crc = (crc >> 1) ^ 0xA001;
                } else {
                    crc >>= 1;
                }
            }
        }
        return crc;
    }

    static uint16_t crc16(const std::vector<uint8_t>& data) {
        return crc16(data.data(), data.size());
    }

    /**
     * @brief 校验帧尾 CRC（小端序: 低字节在前）
     * @return 长度 <= 2 时无法容纳 CRC，返回 false
     */
    static bool verifyChecksum(const std::vector<uint8_t>& frame) {
        size_t len = frame.size();
        if (len <= 2) return false;

        uint16_t crcRecv = static_cast<uint16_t>(frame[len - 2])
                         | (static_cast<uint16_t>(frame[len - 1]) << 8);
        return crcRecv == crc16(frame.data(), len - 2);
    }

    /**
     * @brief 计算除末尾两字节外的 CRC 并写入末尾两字节
     */
    static void appendChecksum(std::vector<uint8_t>& frame) {
        size_t len = frame.size();
        if (len <= 2) return;

        uint16_t crc = crc16(frame.data(), len - 2);
        frame[len - 2] = static_cast<uint8_t>(crc & 0xFF);        // CRC Low
        frame[len - 1] = static_cast<uint8_t>((crc >> 8) & 0xFF); // CRC High
    }

    // ==================== 帧构建 ====================

    /**
     * @brief 构建读/写单寄存器请求帧
     * [SlaveAddr(1)][FC(1)][Register(2)][Value/Quantity(2)][CRC16(2)]
     *
     * 功能码与寄存器组合的合法性由调用方负责
     */
    static std::vector<uint8_t> buildRegisterFrame(uint8_t address, uint8_t functionCode,
                                                   uint16_t reg, uint16_t valueOrCount) {
        std::vector<uint8_t> frame(REGISTER_FRAME_LENGTH);
        frame[0] = address;
        frame[1] = functionCode;
        frame[2] = static_cast<uint8_t>(reg >> 8);
        frame[3] = static_cast<uint8_t>(reg & 0xFF);
        frame[4] = static_cast<uint8_t>(valueOrCount >> 8);
        frame[5] = static_cast<uint8_t>(valueOrCount & 0xFF);
        appendChecksum(frame);
        return frame;
    }

    /**
     * @brief 构建电能清零帧
     * [SlaveAddr(1)][0x42(1)][CRC16(2)]，CRC 覆盖两个 0x00 占位字节
     */
    static std::vector<uint8_t> buildResetFrame(uint8_t address) {
        std::vector<uint8_t> frame = {address, FuncCodes::RESET_ENERGY, 0x00, 0x00};
        appendChecksum(frame);
        return frame;
    }

    // ==================== 帧解析 ====================

    /**
     * @brief 应答帧准入检查
     * @param raw 从串口收到的原始字节
     * @param expectedLength 本次请求对应的应答帧长
     * @return 校验通过的原始字节
     * @throws ShortReadException 长度不符
     * @throws BadChecksumException CRC 不匹配
     * @throws DeviceException 功能码带异常标志
     *
     * 设备异常应答只有 5 字节，长度与期望帧长不同；若收到的恰是一帧
     * CRC 正确的异常应答，按设备异常上报而非长度错误。
     */
    static std::vector<uint8_t> parseResponse(const std::vector<uint8_t>& raw,
                                              size_t expectedLength) {
        if (raw.size() != expectedLength && !isExceptionFrame(raw)) {
            throw ShortReadException(expectedLength, raw.size());
        }

        if (!verifyChecksum(raw)) {
            throw BadChecksumException();
        }

        if (raw.size() >= 3 && (raw[1] & FuncCodes::ERROR_MARKER)) {
            throw DeviceException(parseDeviceError(raw[2]), raw[2]);
        }

        return raw;
    }

    /**
     * @brief 写入回显校验：应答必须与请求逐字节一致
     * @throws EchoMismatchException
     */
    static void verifyEcho(const std::vector<uint8_t>& sent, const std::vector<uint8_t>& received) {
        if (sent.size() != received.size() ||
            !std::equal(sent.begin(), sent.end(), received.begin())) {
            throw EchoMismatchException();
        }
    }

    // ==================== 调试 ====================

    static std::string toHexString(const std::vector<uint8_t>& data) {
        std::ostringstream oss;
        for (size_t i = 0; i < data.size(); ++i) {
            if (i > 0) oss << " ";
            oss << std::hex << std::uppercase << std::setw(2)
                << std::setfill('0') << static_cast<int>(data[i]);
        }
        return oss.str();
    }

private:
    /** 5 字节、带异常标志、CRC 正确 */
    static bool isExceptionFrame(const std::vector<uint8_t>& raw) {
        return raw.size() == EXCEPTION_FRAME_LENGTH
            && (raw[1] & FuncCodes::ERROR_MARKER)
            && verifyChecksum(raw);
    }
};

}  // namespace pzem
