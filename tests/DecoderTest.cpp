#include <gtest/gtest.h>

#include "common/protocol/pzem/Pzem.hpp"

using namespace pzem;

TEST(DecoderTest, DecodesFullMeasurementBlock) {
    std::vector<uint8_t> reply = {
        0xF8, 0x04, 0x14, 0x00, 0xE6, 0x03, 0xE8, 0x00, 0x01, 0x12, 0x34, 0x00, 0x00,
        0x56, 0x78, 0x00, 0x02, 0x01, 0xF4, 0x00, 0x5F, 0xFF, 0xFF, 0xEA, 0x89};

    Measurement m = RegisterDecoder::decodeMeasurement(reply);

    EXPECT_DOUBLE_EQ(m.voltage, 23.0);
    // 低字 0x03E8 + 高字 0x0001
    EXPECT_DOUBLE_EQ(m.current, 66.536);
    EXPECT_DOUBLE_EQ(m.power, 466.0);
    EXPECT_DOUBLE_EQ(m.energy, 153.208);
    EXPECT_DOUBLE_EQ(m.frequency, 50.0);
    EXPECT_DOUBLE_EQ(m.powerFactor, 0.95);
    EXPECT_EQ(m.alarm, ALARM_ON);
    EXPECT_TRUE(m.isAlarmActive());
}

TEST(DecoderTest, IdleMeterReadsZeroWithoutAlarm) {
    std::vector<uint8_t> reply = {
        0xF8, 0x04, 0x14, 0x00, 0xE7, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x01, 0xF4, 0x00, 0x64, 0x00, 0x00, 0xC7, 0x82};

    Measurement m = RegisterDecoder::decodeMeasurement(reply);

    EXPECT_DOUBLE_EQ(m.voltage, 23.1);
    EXPECT_DOUBLE_EQ(m.current, 0.0);
    EXPECT_DOUBLE_EQ(m.power, 0.0);
    EXPECT_DOUBLE_EQ(m.energy, 0.0);
    EXPECT_DOUBLE_EQ(m.powerFactor, 1.0);
    EXPECT_FALSE(m.isAlarmActive());
}

TEST(DecoderTest, HighWordOnlyCurrent) {
    std::vector<uint8_t> reply(MEASUREMENT_FRAME_LENGTH, 0x00);
    reply[7] = 0x00;
    reply[8] = 0x02;  // 高字 = 2 -> raw 0x00020000

    Measurement m = RegisterDecoder::decodeMeasurement(reply);
    EXPECT_DOUBLE_EQ(m.current, 131.072);
}

TEST(DecoderTest, RejectsWrongLength) {
    std::vector<uint8_t> reply(24, 0x00);
    EXPECT_THROW(RegisterDecoder::decodeMeasurement(reply), ShortReadException);
}

TEST(DecoderTest, HoldingRegisterValue) {
    EXPECT_EQ(RegisterDecoder::decodeHoldingRegister({0xF8, 0x03, 0x02, 0x08, 0x98, 0x22, 0x3A}), 2200);
}

TEST(DecoderTest, HoldingRegisterRejectsUnexpectedByteCount) {
    std::vector<uint8_t> reply = {0xF8, 0x03, 0x04, 0x00, 0x01, 0x00, 0x02};
    try {
        RegisterDecoder::decodeHoldingRegister(reply);
        FAIL() << "expected ProtocolException";
    } catch (const ProtocolException& e) {
        EXPECT_EQ(e.getCode(), ErrorCodes::MALFORMED_FRAME);
    }
}
