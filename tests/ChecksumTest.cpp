#include <gtest/gtest.h>

#include "common/protocol/pzem/Pzem.hpp"

using namespace pzem;

TEST(ChecksumTest, KnownReadRequestVector) {
    std::vector<uint8_t> body = {0x01, 0x03, 0x00, 0x00, 0x00, 0x0A};
    EXPECT_EQ(PzemUtils::crc16(body), 0xCDC5);
}

TEST(ChecksumTest, EmptyInputKeepsInitialValue) {
    EXPECT_EQ(PzemUtils::crc16(std::vector<uint8_t>{}), 0xFFFF);
}

TEST(ChecksumTest, VerifyAcceptsLittleEndianTrailer) {
    EXPECT_TRUE(PzemUtils::verifyChecksum({0x01, 0x03, 0x00, 0x00, 0x00, 0x0A, 0xC5, 0xCD}));
    EXPECT_TRUE(PzemUtils::verifyChecksum({0xF8, 0x42, 0xC2, 0x41}));
}

TEST(ChecksumTest, VerifyRejectsSwappedOrCorruptTrailer) {
    EXPECT_FALSE(PzemUtils::verifyChecksum({0x01, 0x03, 0x00, 0x00, 0x00, 0x0A, 0xCD, 0xC5}));
    EXPECT_FALSE(PzemUtils::verifyChecksum({0x01, 0x03, 0x00, 0x01, 0x00, 0x0A, 0xC5, 0xCD}));
}

TEST(ChecksumTest, FramesTooShortForTrailerAreInvalid) {
    EXPECT_FALSE(PzemUtils::verifyChecksum({}));
    EXPECT_FALSE(PzemUtils::verifyChecksum({0xFF}));
    EXPECT_FALSE(PzemUtils::verifyChecksum({0xFF, 0xFF}));
}

TEST(ChecksumTest, AppendOverwritesLastTwoBytes) {
    std::vector<uint8_t> frame = {0x01, 0x06, 0x00, 0x02, 0x00, 0x05, 0x00, 0x00};
    PzemUtils::appendChecksum(frame);
    EXPECT_EQ(frame, (std::vector<uint8_t>{0x01, 0x06, 0x00, 0x02, 0x00, 0x05, 0xE8, 0x09}));
    EXPECT_TRUE(PzemUtils::verifyChecksum(frame));
}

TEST(ChecksumTest, AppendThenVerifyHoldsForEveryLength) {
    uint32_t seed = 0x1234567;
    for (size_t len = 3; len <= 64; ++len) {
        for (int variant = 0; variant < 8; ++variant) {
            std::vector<uint8_t> frame(len);
            for (auto& byte : frame) {
                seed = seed * 1103515245u + 12345u;
                byte = static_cast<uint8_t>(seed >> 16);
            }
            if (variant == 0) std::fill(frame.begin(), frame.end(), 0x00);
            if (variant == 1) std::fill(frame.begin(), frame.end(), 0xFF);

            PzemUtils::appendChecksum(frame);
            EXPECT_TRUE(PzemUtils::verifyChecksum(frame)) << "len=" << len << " variant=" << variant;

            frame[len / 2] ^= 0x5A;
            EXPECT_FALSE(PzemUtils::verifyChecksum(frame)) << "len=" << len << " variant=" << variant;
        }
    }
}

TEST(ChecksumTest, AppendIgnoresFramesWithoutRoomForTrailer) {
    std::vector<uint8_t> frame = {0x12, 0x34};
    PzemUtils::appendChecksum(frame);
    EXPECT_EQ(frame, (std::vector<uint8_t>{0x12, 0x34}));
}
