#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/utils/AppException.hpp"
#include "common/utils/Constants.hpp"
#include "common/utils/StringUtils.hpp"

namespace modbus {

/** 字节序列（帧、ADU 均使用） */
using Bytes = std::vector<uint8_t>;

// ==================== 枚举类型 ====================

/** 线路协议 */
enum class WireProtocol {
    ASCII,  // ':' + HEX + LRC + CRLF
    RTU,    // SlaveAddr + PDU + CRC16
    TCP     // MBAP Header + UnitID + PDU
};

// ==================== 功能码常量 ====================

struct FuncCodes {
    static constexpr uint8_t READ_COILS = 0x01;
    static constexpr uint8_t READ_DISCRETE_INPUTS = 0x02;
    static constexpr uint8_t READ_HOLDING_REGISTERS = 0x03;
    static constexpr uint8_t READ_INPUT_REGISTERS = 0x04;
    static constexpr uint8_t WRITE_SINGLE_COIL = 0x05;
    static constexpr uint8_t WRITE_SINGLE_REGISTER = 0x06;
    static constexpr uint8_t READ_EXCEPTION_STATUS = 0x07;
    static constexpr uint8_t GET_COMM_EVENT_COUNTER = 0x0B;
    static constexpr uint8_t GET_COMM_EVENT_LOG = 0x0C;
    static constexpr uint8_t WRITE_MULTIPLE_COILS = 0x0F;
    static constexpr uint8_t WRITE_MULTIPLE_REGISTERS = 0x10;
    static constexpr uint8_t REPORT_SERVER_ID = 0x11;

    /** 异常响应标志位 */
    static constexpr uint8_t EXCEPTION_FLAG = 0x80;
};

/** 异常码 */
struct ExceptionCodes {
    static constexpr uint8_t GATEWAY_PATH_UNAVAILABLE = 0x0A;
    static constexpr uint8_t GATEWAY_TARGET_NO_RESPONSE = 0x0B;
};

// ==================== 长度常量 ====================

/** 最短帧：UnitID + FC */
inline constexpr size_t MIN_FRAME_LENGTH = 2;

/** ASCII / RTU 的 ADU 上限（256 - UnitID - CRC16 - 1） */
inline constexpr size_t MAX_SERIAL_ADU_LENGTH = 252;

/** TCP 的 ADU 上限 */
inline constexpr size_t MAX_TCP_ADU_LENGTH = 255;

/** MBAP 头中 UnitID 之前的部分：TransID(2) + ProtocolID(2) + Length(2) */
inline constexpr size_t MBAP_PREFIX_LENGTH = 6;

/** 广播地址，不期望应答 */
inline constexpr uint8_t BROADCAST_UNIT_ID = 0;

/** 未指定时的默认单元号 */
inline constexpr uint8_t DEFAULT_UNIT_ID = 1;

// ==================== 分帧结果 ====================

/**
 * @brief 流式分帧结果
 *
 * frames 为完整帧，remainder 为尚不完整、需等待更多数据的尾部，
 * discarded 为被丢弃的字节数（起始符之前的垃圾，或不可恢复的 MBAP 头）。
 */
struct FrameSplit {
    std::vector<Bytes> frames;
    Bytes remainder;
    size_t discarded = 0;
};

// ==================== 枚举解析函数 ====================

/**
 * @brief 解析协议名称（大小写不敏感，兼容旧配置中的别名）
 * @throws BadProtocolException 未知名称
 */
inline WireProtocol parseWireProtocol(const std::string& name) {
    const std::string value = StringUtils::toLower(StringUtils::trim(name));

    if (value == Constants::PROTOCOL_MBASC || value == "modbus/ascii" ||
        value == "modbus/asc" || value == "ascii") {
        return WireProtocol::ASCII;
    }
    if (value == Constants::PROTOCOL_MBRTU || value == "modbus/rtu" ||
        value == "mbus/rtu" || value == "rtu") {
        return WireProtocol::RTU;
    }
    if (value == Constants::PROTOCOL_MBTCP || value == "modbus/tcp" ||
        value == "mbus/tcp" || value == "tcp") {
        return WireProtocol::TCP;
    }
    throw BadProtocolException("Unknown IA protocol: '" + name + "'");
}

inline const char* wireProtocolToString(WireProtocol protocol) {
    switch (protocol) {
        case WireProtocol::ASCII: return Constants::PROTOCOL_MBASC;
        case WireProtocol::RTU: return Constants::PROTOCOL_MBRTU;
        case WireProtocol::TCP: return Constants::PROTOCOL_MBTCP;
    }
    return "unknown";
}

/** 串行线路协议（ASCII / RTU） */
inline bool isSerialProtocol(WireProtocol protocol) {
    switch (protocol) {
        case WireProtocol::ASCII:
        case WireProtocol::RTU:
            return true;
        case WireProtocol::TCP:
            return false;
    }
    return false;
}

/** 各协议允许的最大 ADU 长度 */
inline size_t maxAduLength(WireProtocol protocol) {
    switch (protocol) {
        case WireProtocol::ASCII:
        case WireProtocol::RTU:
            return MAX_SERIAL_ADU_LENGTH;
        case WireProtocol::TCP:
            return MAX_TCP_ADU_LENGTH;
    }
    return MAX_SERIAL_ADU_LENGTH;
}

}  // namespace modbus
