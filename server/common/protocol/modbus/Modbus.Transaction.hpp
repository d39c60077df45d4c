#pragma once

#include "Modbus.Types.hpp"
#include "Modbus.Ascii.hpp"
#include "Modbus.Rtu.hpp"
#include "Modbus.Tcp.hpp"

#include <optional>

namespace modbus {

/** 事务状态：Empty → RequestSet → ResponseSet | TimedOut，不可回退 */
enum class TransactionState {
    Empty,
    RequestSet,
    ResponseSet,
    TimedOut
};

inline const char* transactionStateToString(TransactionState state) {
    switch (state) {
        case TransactionState::Empty: return "Empty";
        case TransactionState::RequestSet: return "RequestSet";
        case TransactionState::ResponseSet: return "ResponseSet";
        case TransactionState::TimedOut: return "TimedOut";
    }
    return "Unknown";
}

/** 一条线路消息：原始帧、所属协议、协议无关的 ADU（不含 UnitID） */
struct WireMessage {
    Bytes raw;
    WireProtocol protocol;
    Bytes adu;
};

/**
 * @brief Modbus 事务（一次请求 + 对应响应）
 *
 * 请求以任一线路协议进入，以协议无关的 UnitID + ADU 保存，
 * 可按另一线路协议重新编码转发；响应同理反向转换。
 * TCP 事务号随请求保存，响应和超时异常帧沿用同一事务号。
 *
 * 每个入站请求帧对应一个事务对象，不在多个流程间共享。
 */
class ModbusTransaction {
public:
    ModbusTransaction() = default;

    // ==================== 属性 ====================

    TransactionState state() const { return state_; }
    uint8_t unitId() const { return unitId_; }
    const Sequence& sequence() const { return sequence_; }
    bool isBroadcast() const { return unitId_ == BROADCAST_UNIT_ID; }

    const std::optional<WireMessage>& request() const { return request_; }
    const std::optional<WireMessage>& response() const { return response_; }

    /** 覆盖 TCP 事务号；长度不是 2 时补零或截断 */
    void setSequence(const Bytes& value) { sequence_ = TcpCodec::normalizeSequence(value); }
    void setSequence(uint16_t value) { sequence_ = TcpCodec::sequenceFromInt(value); }

    /** 默认协议：优先响应所用协议，其次请求所用协议 */
    std::optional<WireProtocol> protocol() const {
        if (response_) return response_->protocol;
        if (request_) return request_->protocol;
        return std::nullopt;
    }

    // ==================== 请求 ====================

    /**
     * @brief 写入请求帧
     * 失败时事务保持不变
     * @throws BadFormException / BadChecksumException 帧非法
     * @throws InvalidStateException 已有请求
     */
    void setRequest(const Bytes& raw, WireProtocol protocol) {
        requireState(state_ == TransactionState::Empty, "setRequest");

        Sequence seq = sequence_;
        Bytes packet = decodePacket(raw, protocol, seq);
        Bytes adu(packet.begin() + 1, packet.end());
        checkAduLength(adu, protocol);

        unitId_ = packet[0];
        sequence_ = seq;
        request_ = WireMessage{raw, protocol, std::move(adu)};
        state_ = TransactionState::RequestSet;
    }

    /**
     * @brief 以指定协议重新编码请求
     * @throws InvalidStateException 尚无请求
     */
    Bytes getRequest(WireProtocol protocol) const {
        if (!request_) {
            throw InvalidStateException("getRequest: no request data");
        }
        return render(protocol, request_->adu);
    }

    Bytes getRequest() const {
        return getRequest(requireProtocol());
    }

    // ==================== 响应 ====================

    /**
     * @brief 写入响应帧
     *
     * ASCII/RTU 要求 UnitID 与请求一致；TCP 要求事务号与 UnitID 均一致
     * 失败时事务保持 RequestSet，可继续接收正确的响应
     * @throws BadFormException / BadChecksumException 帧非法或不匹配
     * @throws InvalidStateException 尚无请求，或已有响应 / 已超时
     */
    void setResponse(const Bytes& raw, WireProtocol protocol) {
        requireState(state_ == TransactionState::RequestSet, "setResponse");

        Bytes packet = decodeResponsePacket(raw, protocol);
        Bytes adu(packet.begin() + 1, packet.end());
        checkAduLength(adu, protocol);

        response_ = WireMessage{raw, protocol, std::move(adu)};
        state_ = TransactionState::ResponseSet;
    }

    /**
     * @brief 以指定协议重新编码响应
     * @throws InvalidStateException 尚无响应
     */
    Bytes getResponse(WireProtocol protocol) const {
        if (!response_) {
            throw InvalidStateException("getResponse: no response data");
        }
        return render(protocol, response_->adu);
    }

    Bytes getResponse() const {
        return getResponse(requireProtocol());
    }

    // ==================== 超时 ====================

    /**
     * @brief 生成"无应答"时返回给请求方的帧
     *
     * ASCII/RTU 没有标准的无应答表示，返回 nullopt（不发送任何数据）；
     * TCP 返回异常响应 [FC|0x80][0x0B]（网关目标设备无响应），沿用原事务号
     * @throws InvalidStateException 尚无请求，或已收到响应
     */
    std::optional<Bytes> getNoResponseError(WireProtocol protocol) {
        requireState(state_ == TransactionState::RequestSet || state_ == TransactionState::TimedOut,
                     "getNoResponseError");

        auto frame = gatewayException(protocol, ExceptionCodes::GATEWAY_TARGET_NO_RESPONSE);
        if (frame) {
            response_ = WireMessage{*frame, protocol,
                                    exceptionAdu(ExceptionCodes::GATEWAY_TARGET_NO_RESPONSE)};
        }
        state_ = TransactionState::TimedOut;
        return frame;
    }

    /**
     * @brief 生成"网关路径不可用"帧：请求或响应无法按目标协议转发
     *
     * 与无应答帧相同，ASCII/RTU 返回 nullopt；
     * TCP 返回 [FC|0x80][0x0A]，沿用原事务号。不改变事务状态
     * @throws InvalidStateException 尚无请求
     */
    std::optional<Bytes> getPathUnavailableError(WireProtocol protocol) const {
        if (!request_) {
            throw InvalidStateException("getPathUnavailableError: no request data");
        }
        return gatewayException(protocol, ExceptionCodes::GATEWAY_PATH_UNAVAILABLE);
    }

private:
    TransactionState state_ = TransactionState::Empty;
    uint8_t unitId_ = DEFAULT_UNIT_ID;
    Sequence sequence_{0, 0};
    std::optional<WireMessage> request_;
    std::optional<WireMessage> response_;

    /** 网关异常帧；串口协议没有对应表示 */
    std::optional<Bytes> gatewayException(WireProtocol protocol, uint8_t exceptionCode) const {
        switch (protocol) {
            case WireProtocol::ASCII:
            case WireProtocol::RTU:
                return std::nullopt;

            case WireProtocol::TCP:
                return TcpCodec::encodeToWire(sequence_, unitId_, exceptionAdu(exceptionCode));
        }
        throw BadProtocolException("Unknown IA protocol: " + std::to_string(static_cast<int>(protocol)));
    }

    Bytes exceptionAdu(uint8_t exceptionCode) const {
        return Bytes{static_cast<uint8_t>(request_->adu[0] | FuncCodes::EXCEPTION_FLAG), exceptionCode};
    }

    /** 按协议解码为 UnitID + ADU；TCP 同时取出事务号 */
    static Bytes decodePacket(const Bytes& raw, WireProtocol protocol, Sequence& seq) {
        switch (protocol) {
            case WireProtocol::ASCII:
                return AsciiCodec::decodeFromWire(raw);
            case WireProtocol::RTU:
                return RtuCodec::decodeFromWire(raw);
            case WireProtocol::TCP: {
                Bytes packet = TcpCodec::decodeFromWire(raw);
                seq = TcpCodec::readSequence(raw);
                return packet;
            }
        }
        throw BadProtocolException("Unknown IA protocol: " + std::to_string(static_cast<int>(protocol)));
    }

    /** 响应解码，并核对 UnitID（TCP 另核对事务号） */
    Bytes decodeResponsePacket(const Bytes& raw, WireProtocol protocol) const {
        switch (protocol) {
            case WireProtocol::ASCII:
            case WireProtocol::RTU: {
                Sequence unused = sequence_;
                Bytes packet = decodePacket(raw, protocol, unused);
                if (packet[0] != unitId_) {
                    throw BadFormException("Unexpected Unit Id in response");
                }
                return packet;
            }
            case WireProtocol::TCP:
                TcpCodec::validateHeader(raw, sequence_, unitId_);
                return Bytes(raw.begin() + static_cast<ptrdiff_t>(MBAP_PREFIX_LENGTH), raw.end());
        }
        throw BadProtocolException("Unknown IA protocol: " + std::to_string(static_cast<int>(protocol)));
    }

    /** UnitID + ADU 按协议编码 */
    Bytes render(WireProtocol protocol, const Bytes& adu) const {
        checkAduLength(adu, protocol);

        switch (protocol) {
            case WireProtocol::ASCII:
                return AsciiCodec::encodeToWire(withUnitId(adu));
            case WireProtocol::RTU:
                return RtuCodec::encodeToWire(withUnitId(adu));
            case WireProtocol::TCP:
                return TcpCodec::encodeToWire(sequence_, unitId_, adu);
        }
        throw BadProtocolException("Unknown IA protocol: " + std::to_string(static_cast<int>(protocol)));
    }

    Bytes withUnitId(const Bytes& adu) const {
        Bytes packet;
        packet.reserve(adu.size() + 1);
        packet.push_back(unitId_);
        packet.insert(packet.end(), adu.begin(), adu.end());
        return packet;
    }

    static void checkAduLength(const Bytes& adu, WireProtocol protocol) {
        if (adu.size() > maxAduLength(protocol)) {
            throw BadFormException("data length " + std::to_string(adu.size()) +
                                   " is too long for " + wireProtocolToString(protocol));
        }
    }

    WireProtocol requireProtocol() const {
        auto value = protocol();
        if (!value) {
            throw InvalidStateException("Transaction lacks protocol");
        }
        return *value;
    }

    void requireState(bool allowed, const char* operation) const {
        if (!allowed) {
            throw InvalidStateException(std::string(operation) + ": not allowed in state " +
                                        transactionStateToString(state_));
        }
    }
};

}  // namespace modbus
