/**
 * @file test_replay.cpp
 * @brief Replay command handling against an in-memory bridge session.
 */

#include "TestHelpers.hpp"
#include "common/replay/ReplayRunner.hpp"

using modbus::BridgeSession;
using modbus::Bytes;
using modbus::ModbusUtils;
using modbus::Sequence;
using modbus::TcpCodec;
using modbus::WireProtocol;

namespace {
const char* kTcpReadHolding = "00 01 00 00 00 06 01 03 00 00 00 0A";
const char* kTcpReadOne = "00 02 00 00 00 06 01 03 00 00 00 01";
const char* kRtuResponse = "01 03 02 00 2A 39 9B";
}  // namespace

class ReplayRunnerTest : public ::testing::Test {
protected:
    BridgeSession session{WireProtocol::TCP, WireProtocol::RTU};
    std::ostringstream out;
    std::ostringstream err;
    ReplayRunner runner{session, out, err};

    size_t replay(const std::string& script) {
        std::istringstream in(script);
        return runner.run(in);
    }
};

// ============================================================================
// Host / device
// ============================================================================

TEST_F(ReplayRunnerTest, HostThenDevice) {
    EXPECT_EQ(replay(std::string("host ") + kTcpReadHolding + "\n" +
                     "device " + kRtuResponse + "\n"), 2u);

    EXPECT_EQ(out.str(),
              "device 01030000000AC5CD\n"
              "host 000100000005010302002A\n");
    EXPECT_TRUE(err.str().empty());
}

TEST_F(ReplayRunnerTest, QueuedRequestFollowsAnswer) {
    replay(std::string("host ") + kTcpReadHolding + " " + kTcpReadOne + "\n" +
           "device 01030200\n" +
           "device 2A399B\n");

    // 不完整的设备数据不产生输出
    EXPECT_EQ(out.str(),
              "device 01030000000AC5CD\n"
              "host 000100000005010302002A\n"
              "device 010300000001840A\n");
    EXPECT_TRUE(session.hasInFlight());
}

TEST_F(ReplayRunnerTest, CommandsAreCaseInsensitive) {
    replay(std::string("HOST ") + kTcpReadHolding + "\n");
    EXPECT_EQ(out.str(), "device 01030000000AC5CD\n");
}

TEST_F(ReplayRunnerTest, RequestTooLongForDeviceIsAnsweredByGateway) {
    Bytes adu(254, 0x00);
    adu[0] = 0x10;
    std::string oversize = ModbusUtils::bytesToHex(TcpCodec::encodeToWire(Sequence{0x00, 0x07}, 1, adu));

    replay("host " + oversize + "\n");
    EXPECT_EQ(out.str(), "host 00070000000301900A\n");
    EXPECT_FALSE(session.hasInFlight());
}

// ============================================================================
// Timeout / reset / stats
// ============================================================================

TEST_F(ReplayRunnerTest, TimeoutPrintsGatewayException) {
    replay(std::string("host ") + kTcpReadHolding + "\ntimeout\ntimeout\n");

    // 第二个 timeout 没有在途事务，不输出
    EXPECT_EQ(out.str(),
              "device 01030000000AC5CD\n"
              "host 00010000000301830B\n");
}

TEST(ReplaySerialHostTest, TimeoutPrintsDash) {
    BridgeSession session(WireProtocol::RTU, WireProtocol::RTU);
    std::ostringstream out;
    std::ostringstream err;
    ReplayRunner runner(session, out, err);

    std::istringstream in("host 01 03 00 00 00 0A C5 CD\ntimeout\n");
    runner.run(in);

    EXPECT_EQ(out.str(),
              "device 01030000000AC5CD\n"
              "host -\n");
}

TEST_F(ReplayRunnerTest, ResetThenStats) {
    replay(std::string("host ") + kTcpReadHolding + " " + kTcpReadOne + "\n" +
           "stats\n"
           "reset\n"
           "stats\n");

    EXPECT_EQ(out.str(),
              "device 01030000000AC5CD\n"
              "stats host_frames=2 device_frames=0 bad_frames=0 timeouts=0 discarded_bytes=0 "
              "dropped_requests=0 pending=1 in_flight=1\n"
              "stats host_frames=2 device_frames=0 bad_frames=0 timeouts=0 discarded_bytes=0 "
              "dropped_requests=0 pending=0 in_flight=0\n");
}

TEST_F(ReplayRunnerTest, CommentsAndBlankLinesAreIgnored) {
    EXPECT_EQ(replay("# capture 1\n\n   \n"), 3u);
    EXPECT_TRUE(out.str().empty());
    EXPECT_TRUE(err.str().empty());
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(ReplayRunnerTest, BadHexIsReported) {
    replay("host 0G 01\nhost\n");

    EXPECT_TRUE(out.str().empty());
    EXPECT_NE(err.str().find("line 1: host expects hex bytes"), std::string::npos);
    EXPECT_NE(err.str().find("line 2: host expects hex bytes"), std::string::npos);
    EXPECT_EQ(session.stats().hostFrames, 0u);
}

TEST_F(ReplayRunnerTest, UnknownCommandIsReported) {
    replay("poll 01\n");

    EXPECT_TRUE(out.str().empty());
    EXPECT_NE(err.str().find("line 1: unknown command 'poll'"), std::string::npos);
}
