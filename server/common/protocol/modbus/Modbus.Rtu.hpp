#pragma once

#include "Modbus.Types.hpp"
#include "Modbus.Checksum.hpp"

#include <cstdint>

namespace modbus {

/**
 * @brief Modbus/RTU 编解码与分帧
 *
 * 帧格式: [SlaveAddr(1)][FC(1)][Data...][CRC16(2, 小端)]
 * RTU 没有起止符，分帧依赖按功能码估算的帧长
 */
class RtuCodec {
public:
    /** 数据不足，尚无法估算 */
    static constexpr size_t LENGTH_NOT_YET = 0;

    /** 未知功能码，无法估算；剩余数据整体视为一帧 */
    static constexpr size_t LENGTH_UNKNOWABLE = SIZE_MAX;

    static constexpr size_t CRC_LENGTH = 2;

    /**
     * @brief 原始二进制 → 线路帧（追加 CRC16，低字节在前）
     * @throws BadFormException 少于 2 字节
     */
    static Bytes encodeToWire(const Bytes& packet) {
        uint16_t crc = Checksum::crc16(packet);
        Bytes frame;
        frame.reserve(packet.size() + CRC_LENGTH);
        frame.insert(frame.end(), packet.begin(), packet.end());
        frame.push_back(static_cast<uint8_t>(crc & 0xFF));         // CRC Low
        frame.push_back(static_cast<uint8_t>((crc >> 8) & 0xFF));  // CRC High
        return frame;
    }

    /**
     * @brief 线路帧 → 原始二进制（校验并去掉 CRC16）
     * @throws BadFormException 帧长不足 UnitID + FC + CRC16
     * @throws BadChecksumException CRC 不匹配
     */
    static Bytes decodeFromWire(const Bytes& frame) {
        if (frame.size() < MIN_FRAME_LENGTH + CRC_LENGTH) {
            throw BadFormException("MB/RTU packet is too short");
        }

        size_t payloadLen = frame.size() - CRC_LENGTH;
        uint16_t crcRecv = static_cast<uint16_t>(frame[payloadLen])
                         | (static_cast<uint16_t>(frame[payloadLen + 1]) << 8);
        uint16_t crcCalc = Checksum::crc16(frame.data(), payloadLen);
        if (crcRecv != crcCalc) {
            throw BadChecksumException("bad CRC, see:" + std::to_string(crcRecv) +
                                       " calc:" + std::to_string(crcCalc));
        }
        return Bytes(frame.begin(), frame.begin() + static_cast<ptrdiff_t>(payloadLen));
    }

    // ==================== 帧长估算（不含 CRC） ====================

    /**
     * @brief 估算请求帧长度
     *
     * FC01-06:        [id][fc][addr(2)][cnt/val(2)]          = 6
     * FC07/0B/0C/11:  [id][fc]                               = 2
     * FC0F/10:        [id][fc][addr(2)][cnt(2)][bytes][...]  = 7 + bytes
     */
    static size_t estimateRequestLength(const uint8_t* data, size_t len) {
        if (len < 2) return LENGTH_NOT_YET;

        switch (data[1]) {
            case FuncCodes::READ_COILS:
            case FuncCodes::READ_DISCRETE_INPUTS:
            case FuncCodes::READ_HOLDING_REGISTERS:
            case FuncCodes::READ_INPUT_REGISTERS:
            case FuncCodes::WRITE_SINGLE_COIL:
            case FuncCodes::WRITE_SINGLE_REGISTER:
                return 6;

            case FuncCodes::READ_EXCEPTION_STATUS:
            case FuncCodes::GET_COMM_EVENT_COUNTER:
            case FuncCodes::GET_COMM_EVENT_LOG:
            case FuncCodes::REPORT_SERVER_ID:
                return 2;

            case FuncCodes::WRITE_MULTIPLE_COILS:
            case FuncCodes::WRITE_MULTIPLE_REGISTERS:
                if (len < 7) return LENGTH_NOT_YET;
                return 7 + static_cast<size_t>(data[6]);

            default:
                return LENGTH_UNKNOWABLE;
        }
    }

    /**
     * @brief 估算响应帧长度
     *
     * 异常响应:            [id][fc|0x80][exc]                 = 3
     * FC01-04/0B:          [id][fc][bytes][...]               = 3 + bytes
     * FC05/06/0F/10:       [id][fc][addr(2)][val/cnt(2)]      = 6
     */
    static size_t estimateResponseLength(const uint8_t* data, size_t len) {
        if (len < 2) return LENGTH_NOT_YET;

        uint8_t fc = data[1];
        if (fc & FuncCodes::EXCEPTION_FLAG) {
            return 3;
        }

        switch (fc) {
            case FuncCodes::READ_COILS:
            case FuncCodes::READ_DISCRETE_INPUTS:
            case FuncCodes::READ_HOLDING_REGISTERS:
            case FuncCodes::READ_INPUT_REGISTERS:
            case FuncCodes::GET_COMM_EVENT_COUNTER:
                if (len < 3) return LENGTH_NOT_YET;
                return 3 + static_cast<size_t>(data[2]);

            case FuncCodes::WRITE_SINGLE_COIL:
            case FuncCodes::WRITE_SINGLE_REGISTER:
            case FuncCodes::WRITE_MULTIPLE_COILS:
            case FuncCodes::WRITE_MULTIPLE_REGISTERS:
                return 6;

            default:
                return LENGTH_UNKNOWABLE;
        }
    }

    static size_t estimateRequestLength(const Bytes& data) {
        return estimateRequestLength(data.data(), data.size());
    }

    static size_t estimateResponseLength(const Bytes& data) {
        return estimateResponseLength(data.data(), data.size());
    }

    // ==================== 分帧 ====================

    /**
     * @brief 将接收缓冲区切分为完整帧
     * @param isRequest true 按请求估算，false 按响应估算
     *
     * 处理粘包（一次接收多帧）与拆包（帧不完整，留作 remainder）
     */
    static FrameSplit testEndOfMessage(const uint8_t* data, size_t len, bool isRequest) {
        FrameSplit result;
        size_t pos = 0;

        while (pos < len) {
            const uint8_t* head = data + pos;
            size_t available = len - pos;
            size_t expected = isRequest ? estimateRequestLength(head, available)
                                        : estimateResponseLength(head, available);

            if (expected == LENGTH_NOT_YET) {
                break;
            }
            if (expected == LENGTH_UNKNOWABLE) {
                // 尽力而为：剩余数据整体作为一帧
                result.frames.emplace_back(head, data + len);
                pos = len;
                break;
            }

            expected += CRC_LENGTH;
            if (expected > available) {
                break;
            }

            result.frames.emplace_back(head, head + expected);
            pos += expected;
        }

        if (pos < len) {
            result.remainder.assign(data + pos, data + len);
        }
        return result;
    }

    static FrameSplit testEndOfMessage(const Bytes& buffer, bool isRequest) {
        return testEndOfMessage(buffer.data(), buffer.size(), isRequest);
    }
};

}  // namespace modbus
