#pragma once

#include "Modbus.Types.hpp"
#include "Modbus.Ascii.hpp"
#include "Modbus.Rtu.hpp"
#include "Modbus.Tcp.hpp"

namespace modbus {

/**
 * @brief 按线路协议选择分帧方式
 * isRequest 仅对 RTU 有意义（请求与响应的帧长估算不同）
 */
class Framer {
public:
    static FrameSplit split(WireProtocol protocol, const uint8_t* data, size_t len, bool isRequest) {
        switch (protocol) {
            case WireProtocol::ASCII:
                return AsciiCodec::testEndOfMessage(data, len);
            case WireProtocol::RTU:
                return RtuCodec::testEndOfMessage(data, len, isRequest);
            case WireProtocol::TCP:
                return TcpCodec::testEndOfMessage(data, len);
        }
        throw BadProtocolException("Unknown IA protocol: " + std::to_string(static_cast<int>(protocol)));
    }

    static FrameSplit split(WireProtocol protocol, const Bytes& buffer, bool isRequest) {
        return split(protocol, buffer.data(), buffer.size(), isRequest);
    }
};

}  // namespace modbus
