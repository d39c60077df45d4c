/**
 * @file test_bridge_session.cpp
 * @brief Bridge session: host and device sides driven without I/O.
 */

#include "TestHelpers.hpp"

using modbus::BridgeSession;
using modbus::Bytes;
using modbus::Sequence;
using modbus::TcpCodec;
using modbus::WireProtocol;
using test_helpers::hex;
using test_helpers::text;

namespace {
const char* kTcpReadHolding = "00 01 00 00 00 06 01 03 00 00 00 0A";
const char* kTcpReadOne = "00 02 00 00 00 06 01 03 00 00 00 01";
const char* kRtuReadHolding = "01 03 00 00 00 0A C5 CD";
const char* kRtuReadOne = "01 03 00 00 00 01 84 0A";
const char* kRtuResponse = "01 03 02 00 2A 39 9B";
}  // namespace

// ============================================================================
// TCP host, RTU device
// ============================================================================

class TcpToRtuSessionTest : public ::testing::Test {
protected:
    BridgeSession session{WireProtocol::TCP, WireProtocol::RTU};
};

TEST_F(TcpToRtuSessionTest, RoundTrip) {
    EXPECT_EQ(session.feedHost(hex(kTcpReadHolding)), 1u);
    EXPECT_EQ(session.pendingCount(), 1u);

    auto request = session.nextDeviceRequest();
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(*request, hex(kRtuReadHolding));
    EXPECT_TRUE(session.hasInFlight());
    EXPECT_FALSE(session.nextDeviceRequest().has_value());

    auto answer = session.feedDevice(hex(kRtuResponse));
    ASSERT_TRUE(answer.has_value());
    EXPECT_EQ(*answer, hex("00 01 00 00 00 05 01 03 02 00 2A"));
    EXPECT_FALSE(session.hasInFlight());

    EXPECT_EQ(session.stats().hostFrames, 1u);
    EXPECT_EQ(session.stats().deviceFrames, 1u);
    EXPECT_EQ(session.stats().badFrames, 0u);
}

TEST_F(TcpToRtuSessionTest, SplitHostInput) {
    Bytes frame = hex(kTcpReadHolding);
    Bytes head(frame.begin(), frame.begin() + 5);
    Bytes tail(frame.begin() + 5, frame.end());

    EXPECT_EQ(session.feedHost(head), 0u);
    EXPECT_FALSE(session.nextDeviceRequest().has_value());
    EXPECT_EQ(session.feedHost(tail), 1u);
    EXPECT_EQ(session.nextDeviceRequest(), hex(kRtuReadHolding));
}

TEST_F(TcpToRtuSessionTest, ConcatenatedHostInputIsServedInOrder) {
    EXPECT_EQ(session.feedHost(hex(std::string(kTcpReadHolding) + " " + kTcpReadOne)), 2u);

    EXPECT_EQ(session.nextDeviceRequest(), hex(kRtuReadHolding));
    EXPECT_FALSE(session.nextDeviceRequest().has_value());
    EXPECT_EQ(session.pendingCount(), 1u);

    ASSERT_TRUE(session.feedDevice(hex(kRtuResponse)).has_value());
    EXPECT_EQ(session.nextDeviceRequest(), hex(kRtuReadOne));

    // 第二个事务沿用自己的事务号
    EXPECT_EQ(session.feedDevice(hex(kRtuResponse)), hex("00 02 00 00 00 05 01 03 02 00 2A"));
}

TEST_F(TcpToRtuSessionTest, TrailingDeviceByteDoesNotLeakIntoNextAnswer) {
    session.feedHost(hex(std::string(kTcpReadHolding) + " " + kTcpReadOne));
    ASSERT_TRUE(session.nextDeviceRequest().has_value());

    EXPECT_EQ(session.feedDevice(hex(std::string(kRtuResponse) + " 00")),
              hex("00 01 00 00 00 05 01 03 02 00 2A"));
    EXPECT_EQ(session.stats().discardedBytes, 1u);

    EXPECT_EQ(session.nextDeviceRequest(), hex(kRtuReadOne));
    EXPECT_EQ(session.feedDevice(hex(kRtuResponse)), hex("00 02 00 00 00 05 01 03 02 00 2A"));
    EXPECT_EQ(session.stats().badFrames, 0u);
}

TEST_F(TcpToRtuSessionTest, TrailingBytesAfterBadAnswerAreDropped) {
    session.feedHost(hex(std::string(kTcpReadHolding) + " " + kTcpReadOne));
    ASSERT_TRUE(session.nextDeviceRequest().has_value());

    EXPECT_EQ(session.feedDevice(hex("01 03 02 00 2A 39 9C 01 03")), hex("00 01 00 00 00 03 01 83 0B"));
    EXPECT_EQ(session.stats().discardedBytes, 2u);

    ASSERT_TRUE(session.nextDeviceRequest().has_value());
    EXPECT_EQ(session.feedDevice(hex(kRtuResponse)), hex("00 02 00 00 00 05 01 03 02 00 2A"));
}

TEST_F(TcpToRtuSessionTest, RequestTooLongForDeviceGetsGatewayException) {
    // 254 字节 ADU 在 TCP 内合法，超出 RTU 上限 252
    Bytes adu(254, 0x00);
    adu[0] = 0x10;
    Bytes oversize = TcpCodec::encodeToWire(Sequence{0x00, 0x07}, 1, adu);

    EXPECT_EQ(session.feedHost(oversize), 1u);
    EXPECT_EQ(session.feedHost(hex(kTcpReadOne)), 1u);

    // 超长请求被跳过，直接发送下一个
    EXPECT_EQ(session.nextDeviceRequest(), hex(kRtuReadOne));
    EXPECT_EQ(session.stats().badFrames, 1u);

    EXPECT_EQ(session.nextHostReply(), hex("00 07 00 00 00 03 01 90 0A"));
    EXPECT_FALSE(session.nextHostReply().has_value());
}

TEST_F(TcpToRtuSessionTest, SplitDeviceResponse) {
    session.feedHost(hex(kTcpReadHolding));
    ASSERT_TRUE(session.nextDeviceRequest().has_value());

    EXPECT_FALSE(session.feedDevice(hex("01 03 02")).has_value());
    EXPECT_TRUE(session.hasInFlight());
    EXPECT_EQ(session.feedDevice(hex("00 2A 39 9B")), hex("00 01 00 00 00 05 01 03 02 00 2A"));
}

TEST_F(TcpToRtuSessionTest, CorruptDeviceAnswerBecomesGatewayException) {
    session.feedHost(hex(kTcpReadHolding));
    ASSERT_TRUE(session.nextDeviceRequest().has_value());

    auto answer = session.feedDevice(hex("01 03 02 00 2A 39 9C"));
    ASSERT_TRUE(answer.has_value());
    EXPECT_EQ(*answer, hex("00 01 00 00 00 03 01 83 0B"));
    EXPECT_FALSE(session.hasInFlight());
    EXPECT_EQ(session.stats().badFrames, 1u);
}

TEST_F(TcpToRtuSessionTest, AnswerFromOtherUnitBecomesGatewayException) {
    session.feedHost(hex(kTcpReadHolding));
    ASSERT_TRUE(session.nextDeviceRequest().has_value());

    EXPECT_EQ(session.feedDevice(hex("02 03 02 00 2A 7D 9B")), hex("00 01 00 00 00 03 01 83 0B"));
    EXPECT_EQ(session.stats().badFrames, 1u);
}

TEST_F(TcpToRtuSessionTest, TimeoutGivesGatewayException) {
    session.feedHost(hex(kTcpReadHolding));
    ASSERT_TRUE(session.nextDeviceRequest().has_value());
    session.feedDevice(hex("01 03"));

    EXPECT_EQ(session.onDeviceTimeout(), hex("00 01 00 00 00 03 01 83 0B"));
    EXPECT_FALSE(session.hasInFlight());
    EXPECT_EQ(session.stats().timeouts, 1u);

    // 超时后的迟到响应被丢弃
    EXPECT_FALSE(session.feedDevice(hex(kRtuResponse)).has_value());
}

TEST_F(TcpToRtuSessionTest, TimeoutWithNothingInFlight) {
    EXPECT_FALSE(session.onDeviceTimeout().has_value());
    EXPECT_EQ(session.stats().timeouts, 0u);
}

TEST_F(TcpToRtuSessionTest, UnsolicitedDeviceBytesAreDiscarded) {
    EXPECT_FALSE(session.feedDevice(hex(kRtuResponse)).has_value());
    EXPECT_EQ(session.stats().discardedBytes, 7u);
    EXPECT_EQ(session.stats().deviceFrames, 0u);
}

TEST_F(TcpToRtuSessionTest, BadHostHeaderIsDiscarded) {
    EXPECT_EQ(session.feedHost(hex("00 01 00 01 00 06 01 03 00 00 00 0A")), 0u);
    EXPECT_EQ(session.stats().discardedBytes, 12u);
    EXPECT_EQ(session.pendingCount(), 0u);
}

TEST_F(TcpToRtuSessionTest, ResetDropsEverything) {
    session.feedHost(hex(std::string(kTcpReadHolding) + " " + kTcpReadOne + " 00 03"));
    ASSERT_TRUE(session.nextDeviceRequest().has_value());

    session.reset();
    EXPECT_FALSE(session.hasInFlight());
    EXPECT_FALSE(session.nextHostReply().has_value());
    EXPECT_EQ(session.pendingCount(), 0u);

    // 缓冲区已清空，新的完整帧可正常分帧
    EXPECT_EQ(session.feedHost(hex(kTcpReadHolding)), 1u);
}

// ============================================================================
// Serial host
// ============================================================================

TEST(SerialHostSessionTest, RtuHostAsciiDevice) {
    BridgeSession session(WireProtocol::RTU, WireProtocol::ASCII);

    EXPECT_EQ(session.feedHost(hex(kRtuReadHolding)), 1u);
    EXPECT_EQ(session.nextDeviceRequest(), text(":01030000000AF2\r\n"));
    EXPECT_EQ(session.feedDevice(text(":010302002AD0\r\n")), hex(kRtuResponse));
}

TEST(SerialHostSessionTest, TimeoutGivesNothing) {
    BridgeSession session(WireProtocol::ASCII, WireProtocol::RTU);

    session.feedHost(text(":01030000000AF2\r\n"));
    EXPECT_EQ(session.nextDeviceRequest(), hex(kRtuReadHolding));

    EXPECT_FALSE(session.onDeviceTimeout().has_value());
    EXPECT_FALSE(session.hasInFlight());
    EXPECT_EQ(session.stats().timeouts, 1u);
}

TEST(SerialHostSessionTest, CorruptAnswerGivesNothing) {
    BridgeSession session(WireProtocol::RTU, WireProtocol::RTU);

    session.feedHost(hex(kRtuReadHolding));
    ASSERT_TRUE(session.nextDeviceRequest().has_value());
    EXPECT_FALSE(session.feedDevice(hex("01 03 02 00 2A 00 00")).has_value());
    EXPECT_FALSE(session.hasInFlight());
    EXPECT_EQ(session.stats().badFrames, 1u);
}

TEST(SerialHostSessionTest, BadHostChecksumIsCounted) {
    BridgeSession session(WireProtocol::RTU, WireProtocol::ASCII);

    EXPECT_EQ(session.feedHost(hex("01 03 00 00 00 0A C5 CE")), 0u);
    EXPECT_EQ(session.stats().hostFrames, 1u);
    EXPECT_EQ(session.stats().badFrames, 1u);
    EXPECT_FALSE(session.nextDeviceRequest().has_value());
}

TEST(SerialHostSessionTest, AnswerTooLongForHostGivesNothing) {
    BridgeSession session(WireProtocol::RTU, WireProtocol::TCP);

    session.feedHost(hex(kRtuReadHolding));
    EXPECT_EQ(session.nextDeviceRequest(), hex("00 00 00 00 00 06 01 03 00 00 00 0A"));

    // TCP 侧 253 字节 ADU 超出 RTU 上限
    Bytes adu(253, 0x00);
    adu[0] = 0x03;
    EXPECT_FALSE(session.feedDevice(TcpCodec::encodeToWire(Sequence{0x00, 0x00}, 1, adu)).has_value());
    EXPECT_FALSE(session.hasInFlight());
    EXPECT_EQ(session.stats().deviceFrames, 1u);
    EXPECT_EQ(session.stats().badFrames, 1u);
    EXPECT_FALSE(session.nextHostReply().has_value());
}

TEST(SerialHostSessionTest, BroadcastIsNotKeptInFlight) {
    BridgeSession session(WireProtocol::RTU, WireProtocol::ASCII);

    session.feedHost(hex(std::string("00 06 00 01 00 03 99 DA ") + kRtuReadHolding));
    EXPECT_EQ(session.nextDeviceRequest(), text(":000600010003F6\r\n"));
    EXPECT_FALSE(session.hasInFlight());

    // 广播之后立即发送下一个请求
    EXPECT_EQ(session.nextDeviceRequest(), text(":01030000000AF2\r\n"));
    EXPECT_TRUE(session.hasInFlight());
}

TEST(SerialHostSessionTest, AsciiGarbageBetweenFramesIsDiscarded) {
    BridgeSession session(WireProtocol::ASCII, WireProtocol::RTU);

    EXPECT_EQ(session.feedHost(text("\x01\x02:01030000000AF2\r\n")), 1u);
    EXPECT_EQ(session.stats().discardedBytes, 2u);
}

// ============================================================================
// Buffer limit
// ============================================================================

TEST(BridgeBufferTest, OversizeRemainderIsCleared) {
    BridgeSession session(WireProtocol::TCP, WireProtocol::RTU, 10);

    // 11 字节的不完整帧超过 10 字节上限
    EXPECT_EQ(session.feedHost(hex("00 01 00 00 00 06 01 03 00 00 00")), 0u);
    EXPECT_EQ(session.stats().discardedBytes, 11u);

    // 缓冲区已清空，完整帧重新对齐
    EXPECT_EQ(session.feedHost(hex("00 02 00 00 00 02 01 07")), 1u);
}

// ============================================================================
// Request queue limit
// ============================================================================

TEST(BridgeQueueTest, FullQueueDropsNewRequests) {
    BridgeSession session(WireProtocol::TCP, WireProtocol::RTU, 1024, 2);

    Bytes burst;
    for (int i = 0; i < 5; ++i) {
        Bytes frame = hex(kTcpReadOne);
        burst.insert(burst.end(), frame.begin(), frame.end());
    }

    EXPECT_EQ(session.feedHost(burst), 2u);
    EXPECT_EQ(session.pendingCount(), 2u);
    EXPECT_EQ(session.stats().hostFrames, 5u);
    EXPECT_EQ(session.stats().droppedRequests, 3u);

    // 在途事务不占队列位置
    ASSERT_TRUE(session.nextDeviceRequest().has_value());
    EXPECT_EQ(session.pendingCount(), 1u);
    EXPECT_EQ(session.feedHost(hex(kTcpReadHolding)), 1u);
    EXPECT_EQ(session.feedHost(hex(kTcpReadHolding)), 0u);
    EXPECT_EQ(session.stats().droppedRequests, 4u);
}
