#pragma once

#include "Pzem.Types.hpp"

namespace pzem {

/**
 * @brief 测量块解码器
 *
 * 输入为经 PzemUtils::parseResponse 校验后的 25 字节应答：
 *   [Addr][FC][ByteCount=20][V(2)][I(4)][P(4)][E(4)][F(2)][PF(2)][Alarm(2)][CRC(2)]
 *
 * 32 位量（电流/功率/电能）由低字寄存器 + 高字寄存器组成，按设备寄存器排布拼接：
 *   raw = b[n] << 8 | b[n+1] | b[n+2] << 24 | b[n+3] << 16
 * 不可改成常规的大端 32 位读取。
 */
class RegisterDecoder {
public:
    static Measurement decodeMeasurement(const std::vector<uint8_t>& payload) {
        if (payload.size() != MEASUREMENT_FRAME_LENGTH) {
            throw ShortReadException(MEASUREMENT_FRAME_LENGTH, payload.size());
        }

        const uint8_t* b = payload.data();
        Measurement m;
        m.voltage = static_cast<double>(word16(b + 3)) / 10.0;
        m.current = static_cast<double>(interleaved32(b + 5)) / 1000.0;
        m.power = static_cast<double>(interleaved32(b + 9)) / 10.0;
        // 已知差异：手册标注 1LSB = 1Wh（即无需缩放），此处保持 /1000 与既有读数口径一致，
        // 待实测抓包确认后再调整
        m.energy = static_cast<double>(interleaved32(b + 13)) / 1000.0;
        m.frequency = static_cast<double>(word16(b + 17)) / 10.0;
        m.powerFactor = static_cast<double>(word16(b + 19)) / 100.0;
        m.alarm = word16(b + 21);
        return m;
    }

    /**
     * @brief 解码单个保持寄存器的读应答
     * [Addr][0x03][ByteCount=2][Hi][Lo][CRC(2)]
     */
    static uint16_t decodeHoldingRegister(const std::vector<uint8_t>& payload) {
        if (payload.size() != HOLDING_FRAME_LENGTH) {
            throw ShortReadException(HOLDING_FRAME_LENGTH, payload.size());
        }
        if (payload[2] != 2) {
            throw ProtocolException("unexpected byte count " + std::to_string(payload[2])
                                    + " in holding register reply");
        }
        return word16(payload.data() + 3);
    }

private:
    static uint16_t word16(const uint8_t* p) {
        return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
    }

    static uint32_t interleaved32(const uint8_t* p) {
        return (static_cast<uint32_t>(p[0]) << 8)
             | static_cast<uint32_t>(p[1])
             | (static_cast<uint32_t>(p[2]) << 24)
             | (static_cast<uint32_t>(p[3]) << 16);
    }
};

}  // namespace pzem
