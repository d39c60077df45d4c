#pragma once

#include "Modbus.Types.hpp"
#include "Modbus.Checksum.hpp"
#include "Modbus.Utils.hpp"

#include <cstring>

namespace modbus {

/**
 * @brief Modbus/ASCII 编解码与分帧
 *
 * 帧格式: ':' + HEX(UnitID + PDU) + HEX(LRC) + "\r\n"
 */
class AsciiCodec {
public:
    static constexpr uint8_t START = ':';
    static constexpr uint8_t CR = '\r';
    static constexpr uint8_t LF = '\n';

    /**
     * @brief 原始二进制 → 线路帧
     * 01 03 00 00 00 0A → ":01030000000AF2\r\n"
     * @throws BadFormException 少于 2 字节
     */
    static Bytes encodeToWire(const Bytes& packet) {
        uint8_t lrc = Checksum::lrc(packet);

        std::string text;
        text.reserve(1 + (packet.size() + 1) * 2 + 2);
        text += static_cast<char>(START);
        text += ModbusUtils::bytesToHex(packet);
        text += ModbusUtils::bytesToHex(&lrc, 1);
        text += static_cast<char>(CR);
        text += static_cast<char>(LF);
        return Bytes(text.begin(), text.end());
    }

    /**
     * @brief 线路帧 → 原始二进制（含 UnitID，不含 LRC）
     *
     * 结尾可为 "\r\n"、单个 CR/LF，或已被剥离
     * @throws BadFormException 起始符错误、奇数个十六进制字符或非法字符
     * @throws BadChecksumException LRC 不匹配
     */
    static Bytes decodeFromWire(const Bytes& frame) {
        if (frame.empty() || frame[0] != START) {
            throw BadFormException(frame.empty()
                ? std::string("MB/ASC packet is empty")
                : "bad START byte, " + std::to_string(frame[0]) + " != ':'");
        }

        size_t end = frame.size();
        if (end >= 2 && frame[end - 2] == CR) {
            end -= 2;
        } else if (frame[end - 1] == CR || frame[end - 1] == LF) {
            end -= 1;
        }

        // 去掉 ':' 后至少要有 LRC 的两个字符
        if (end < 3) {
            throw BadFormException("MB/ASC packet is too short");
        }

        auto decoded = ModbusUtils::hexToBytes(frame.data() + 1, end - 1);
        if (!decoded) {
            throw BadFormException("Bad HEX form - odd byte count or bad chars");
        }

        Bytes packet = std::move(*decoded);
        uint8_t seenLrc = packet.back();
        packet.pop_back();

        uint8_t calcLrc = Checksum::lrc(packet);
        if (seenLrc != calcLrc) {
            throw BadChecksumException("bad LRC, see:" + std::to_string(seenLrc) +
                                       " calc:" + std::to_string(calcLrc));
        }
        return packet;
    }

    /**
     * @brief 将接收缓冲区切分为完整帧
     *
     * - 丢弃 ':' 之前的垃圾数据（帧与帧之间同样处理）
     * - 每个 ':' … '\n' 区间为一帧
     * - 最后一个 '\n' 之后、以 ':' 开头的数据作为 remainder 等待后续字节
     */
    static FrameSplit testEndOfMessage(const uint8_t* data, size_t len) {
        FrameSplit result;
        size_t pos = 0;

        while (pos < len) {
            const auto* start = static_cast<const uint8_t*>(std::memchr(data + pos, START, len - pos));
            if (start == nullptr) {
                result.discarded += len - pos;
                break;
            }
            size_t startPos = static_cast<size_t>(start - data);
            result.discarded += startPos - pos;
            pos = startPos;

            const auto* eol = static_cast<const uint8_t*>(std::memchr(data + pos, LF, len - pos));
            if (eol == nullptr) {
                result.remainder.assign(data + pos, data + len);
                break;
            }
            size_t endPos = static_cast<size_t>(eol - data) + 1;
            result.frames.emplace_back(data + pos, data + endPos);
            pos = endPos;
        }

        return result;
    }

    static FrameSplit testEndOfMessage(const Bytes& buffer) {
        return testEndOfMessage(buffer.data(), buffer.size());
    }
};

}  // namespace modbus
