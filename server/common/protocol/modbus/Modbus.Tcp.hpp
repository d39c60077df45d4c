#pragma once

#include "Modbus.Types.hpp"

#include <array>
#include <optional>

namespace modbus {

/** Modbus/TCP 事务号（2 字节，按线路原样保存） */
using Sequence = std::array<uint8_t, 2>;

/**
 * @brief Modbus/TCP 编解码与分帧
 *
 * 帧格式: [TransID(2)][ProtocolID(2)=0][Length(2)][UnitID(1)][FC(1)][Data...]
 * Length 为 UnitID 之后（含 UnitID）的字节数
 */
class TcpCodec {
public:
    /** 最短帧：MBAP(6) + UnitID + FC */
    static constexpr size_t MIN_LENGTH = MBAP_PREFIX_LENGTH + MIN_FRAME_LENGTH;

    /** Length 字段的合法范围：UnitID + FC 至 UnitID + 最大 ADU */
    static constexpr uint16_t MIN_DECLARED_LENGTH = 2;
    static constexpr uint16_t MAX_DECLARED_LENGTH = MAX_TCP_ADU_LENGTH + 1;

    // ==================== 事务号 ====================

    /** 任意长度的事务号规范为 2 字节：不足补零，超出截断 */
    static Sequence normalizeSequence(const Bytes& value) {
        Sequence seq{0, 0};
        for (size_t i = 0; i < seq.size() && i < value.size(); ++i) {
            seq[i] = value[i];
        }
        return seq;
    }

    static Sequence sequenceFromInt(uint16_t value) {
        return Sequence{static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value & 0xFF)};
    }

    static uint16_t sequenceToInt(const Sequence& seq) {
        return static_cast<uint16_t>((static_cast<uint16_t>(seq[0]) << 8) | seq[1]);
    }

    // ==================== 编解码 ====================

    /**
     * @brief 构建 Modbus/TCP 帧
     * @throws BadFormException ADU 为空或超过上限
     */
    static Bytes encodeToWire(const Sequence& seq, uint8_t unitId, const Bytes& adu) {
        if (adu.empty()) {
            throw BadFormException("MB/TCP ADU is empty");
        }
        if (adu.size() > MAX_TCP_ADU_LENGTH) {
            throw BadFormException("MB/TCP ADU length " + std::to_string(adu.size()) + " is too long");
        }

        uint16_t length = static_cast<uint16_t>(adu.size() + 1);
        Bytes frame;
        frame.reserve(MBAP_PREFIX_LENGTH + length);
        frame.push_back(seq[0]);
        frame.push_back(seq[1]);
        frame.push_back(0x00);  // Protocol ID
        frame.push_back(0x00);
        frame.push_back(static_cast<uint8_t>(length >> 8));
        frame.push_back(static_cast<uint8_t>(length & 0xFF));
        frame.push_back(unitId);
        frame.insert(frame.end(), adu.begin(), adu.end());
        return frame;
    }

    /**
     * @brief 校验 MBAP 头并返回 UnitID + ADU
     * @throws BadFormException 头部非法
     */
    static Bytes decodeFromWire(const Bytes& frame) {
        validateHeader(frame);
        return Bytes(frame.begin() + static_cast<ptrdiff_t>(MBAP_PREFIX_LENGTH), frame.end());
    }

    /** 读取帧头中的事务号（调用方保证帧长 >= 2） */
    static Sequence readSequence(const Bytes& frame) {
        return Sequence{frame[0], frame[1]};
    }

    /**
     * @brief 校验 MBAP 头
     * @param expectSeq 非空时要求事务号一致
     * @param expectUnit 非空时要求 UnitID 一致
     * @return 始终返回 true，失败时抛出异常
     * @throws BadFormException
     */
    static bool validateHeader(const Bytes& frame,
                               const std::optional<Sequence>& expectSeq = std::nullopt,
                               const std::optional<uint8_t>& expectUnit = std::nullopt) {
        if (frame.size() < MIN_LENGTH) {
            throw BadFormException("MB/TCP packet is too short");
        }

        if (frame[2] != 0 || frame[3] != 0) {
            throw BadFormException("MB/TCP header has bad protocol version");
        }

        uint16_t length = declaredLength(frame.data());
        if (length + MBAP_PREFIX_LENGTH != frame.size()) {
            throw BadFormException("MB/TCP header length:" + std::to_string(length + MBAP_PREFIX_LENGTH) +
                                   " != packet length:" + std::to_string(frame.size()));
        }

        if (expectSeq && *expectSeq != readSequence(frame)) {
            throw BadFormException("Unexpected Sequence Number");
        }

        if (expectUnit && *expectUnit != frame[6]) {
            throw BadFormException("Unexpected Unit Id");
        }

        if (length > MAX_DECLARED_LENGTH) {
            throw BadFormException("MB/TCP header has more than 256 bytes");
        }

        return true;
    }

    // ==================== 分帧 ====================

    /**
     * @brief 按 Length 字段切分接收缓冲区
     *
     * - 不足 6 字节：全部作为 remainder
     * - ProtocolID 非零或 Length 不合理：丢弃剩余全部数据（无法重新对齐）
     */
    static FrameSplit testEndOfMessage(const uint8_t* data, size_t len) {
        FrameSplit result;
        size_t pos = 0;

        while (pos < len) {
            const uint8_t* head = data + pos;
            size_t available = len - pos;

            if (available < MBAP_PREFIX_LENGTH) {
                result.remainder.assign(head, data + len);
                break;
            }

            uint16_t length = declaredLength(head);
            if (head[2] != 0 || head[3] != 0 ||
                length < MIN_DECLARED_LENGTH || length > MAX_DECLARED_LENGTH) {
                result.discarded += available;
                break;
            }

            size_t total = MBAP_PREFIX_LENGTH + length;
            if (total > available) {
                result.remainder.assign(head, data + len);
                break;
            }

            result.frames.emplace_back(head, head + total);
            pos += total;
        }

        return result;
    }

    static FrameSplit testEndOfMessage(const Bytes& buffer) {
        return testEndOfMessage(buffer.data(), buffer.size());
    }

private:
    static uint16_t declaredLength(const uint8_t* header) {
        return static_cast<uint16_t>((static_cast<uint16_t>(header[4]) << 8) | header[5]);
    }
};

}  // namespace modbus
