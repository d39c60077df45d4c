/**
 * @file test_rtu.cpp
 * @brief Modbus/RTU codec, length estimation and framer tests.
 */

#include "TestHelpers.hpp"

using modbus::Bytes;
using modbus::RtuCodec;
using test_helpers::hex;

// ============================================================================
// Encode / decode
// ============================================================================

TEST(RtuCodecTest, EncodeAppendsCrcLowByteFirst) {
    EXPECT_EQ(RtuCodec::encodeToWire(hex("01 03 00 00 00 0A")), hex("01 03 00 00 00 0A C5 CD"));
}

TEST(RtuCodecTest, DecodeStripsCrc) {
    EXPECT_EQ(RtuCodec::decodeFromWire(hex("01 03 02 00 2A 39 9B")), hex("01 03 02 00 2A"));
}

TEST(RtuCodecTest, DecodeRejectsBadCrc) {
    EXPECT_THROW(RtuCodec::decodeFromWire(hex("01 03 02 00 2A 39 9C")), BadChecksumException);
    EXPECT_THROW(RtuCodec::decodeFromWire(hex("01 03 00 00 00 0A CD C5")), BadChecksumException);
}

TEST(RtuCodecTest, DecodeRejectsTooShort) {
    EXPECT_THROW(RtuCodec::decodeFromWire(hex("01 03 C5")), BadFormException);
    EXPECT_THROW(RtuCodec::decodeFromWire(Bytes{}), BadFormException);
}

TEST(RtuCodecTest, EncodeRejectsTooShort) {
    EXPECT_THROW(RtuCodec::encodeToWire(hex("01")), BadFormException);
}

// ============================================================================
// Length estimation
// ============================================================================

TEST(RtuEstimateTest, RequestFixedLength) {
    EXPECT_EQ(RtuCodec::estimateRequestLength(hex("01 03 00 00 00 0A")), 6u);
    EXPECT_EQ(RtuCodec::estimateRequestLength(hex("01 06")), 6u);
    EXPECT_EQ(RtuCodec::estimateRequestLength(hex("01 07")), 2u);
    EXPECT_EQ(RtuCodec::estimateRequestLength(hex("01 11")), 2u);
}

TEST(RtuEstimateTest, RequestWriteMultipleUsesByteCount) {
    EXPECT_EQ(RtuCodec::estimateRequestLength(hex("01 10 00 01 00 01 02 00 07")), 9u);
    EXPECT_EQ(RtuCodec::estimateRequestLength(hex("01 0F 00 00 00 0A 02")), 9u);
    EXPECT_EQ(RtuCodec::estimateRequestLength(hex("01 10 00 01 00")), RtuCodec::LENGTH_NOT_YET);
}

TEST(RtuEstimateTest, RequestNotYetOrUnknowable) {
    EXPECT_EQ(RtuCodec::estimateRequestLength(hex("01")), RtuCodec::LENGTH_NOT_YET);
    EXPECT_EQ(RtuCodec::estimateRequestLength(Bytes{}), RtuCodec::LENGTH_NOT_YET);
    EXPECT_EQ(RtuCodec::estimateRequestLength(hex("01 2B 0E 01 00")), RtuCodec::LENGTH_UNKNOWABLE);
}

TEST(RtuEstimateTest, ResponseLengths) {
    EXPECT_EQ(RtuCodec::estimateResponseLength(hex("01 03 02")), 5u);
    EXPECT_EQ(RtuCodec::estimateResponseLength(hex("01 0B 04")), 7u);
    EXPECT_EQ(RtuCodec::estimateResponseLength(hex("01 06")), 6u);
    EXPECT_EQ(RtuCodec::estimateResponseLength(hex("01 10")), 6u);
    EXPECT_EQ(RtuCodec::estimateResponseLength(hex("01 83")), 3u);
    EXPECT_EQ(RtuCodec::estimateResponseLength(hex("01 03")), RtuCodec::LENGTH_NOT_YET);
    EXPECT_EQ(RtuCodec::estimateResponseLength(hex("01")), RtuCodec::LENGTH_NOT_YET);
    EXPECT_EQ(RtuCodec::estimateResponseLength(hex("01 11 05")), RtuCodec::LENGTH_UNKNOWABLE);
}

// ============================================================================
// Framer
// ============================================================================

TEST(RtuFramerTest, ConcatenatedRequests) {
    auto split = RtuCodec::testEndOfMessage(
        hex("01 03 00 00 00 0A C5 CD 01 03 00 00 00 01 84 0A"), true);
    ASSERT_EQ(split.frames.size(), 2u);
    EXPECT_EQ(split.frames[0], hex("01 03 00 00 00 0A C5 CD"));
    EXPECT_EQ(split.frames[1], hex("01 03 00 00 00 01 84 0A"));
    EXPECT_TRUE(split.remainder.empty());
}

TEST(RtuFramerTest, PartialFrameIsRemainder) {
    auto split = RtuCodec::testEndOfMessage(hex("01 03 00 00 00 0A C5 CD 01 03 00"), true);
    ASSERT_EQ(split.frames.size(), 1u);
    EXPECT_EQ(split.remainder, hex("01 03 00"));

    split = RtuCodec::testEndOfMessage(hex("01"), true);
    EXPECT_TRUE(split.frames.empty());
    EXPECT_EQ(split.remainder, hex("01"));
}

TEST(RtuFramerTest, ResponsesUseResponseEstimate) {
    auto split = RtuCodec::testEndOfMessage(hex("01 03 02 00 2A 39 9B 01 83 02 C0 F1"), false);
    ASSERT_EQ(split.frames.size(), 2u);
    EXPECT_EQ(split.frames[0], hex("01 03 02 00 2A 39 9B"));
    EXPECT_EQ(split.frames[1], hex("01 83 02 C0 F1"));
}

TEST(RtuFramerTest, UnknownFunctionTakesRestAsOneFrame) {
    auto split = RtuCodec::testEndOfMessage(hex("01 2B 0E 01 00 AA BB"), true);
    ASSERT_EQ(split.frames.size(), 1u);
    EXPECT_EQ(split.frames[0], hex("01 2B 0E 01 00 AA BB"));
    EXPECT_TRUE(split.remainder.empty());
}

TEST(RtuCodecTest, RoundTripAtLengthLimits) {
    for (size_t len : {size_t{2}, modbus::MAX_SERIAL_ADU_LENGTH + 1}) {
        Bytes packet(len);
        for (size_t i = 0; i < len; ++i) packet[i] = static_cast<uint8_t>(i * 13 + 1);
        EXPECT_EQ(RtuCodec::decodeFromWire(RtuCodec::encodeToWire(packet)), packet) << len;
    }
}
