#pragma once

#include "Modbus.Types.hpp"

#include <optional>
#include <sstream>
#include <iomanip>

namespace modbus {

/**
 * @brief Modbus 工具类
 * 十六进制编解码、日志用帧转储
 */
class ModbusUtils {
public:
    // ==================== 十六进制 ====================

    /** 二进制 → 大写十六进制（无分隔符），Modbus/ASCII 帧体使用 */
    static std::string bytesToHex(const uint8_t* data, size_t len) {
        static constexpr char HEX_CHARS[] = "0123456789ABCDEF";
        std::string result;
        result.reserve(len * 2);
        for (size_t i = 0; i < len; ++i) {
            result += HEX_CHARS[(data[i] >> 4) & 0x0F];
            result += HEX_CHARS[data[i] & 0x0F];
        }
        return result;
    }

    static std::string bytesToHex(const Bytes& data) {
        return bytesToHex(data.data(), data.size());
    }

    /**
     * @brief 十六进制 → 二进制（大小写均可）
     * @return 奇数个字符或含非法字符时返回 nullopt
     */
    static std::optional<Bytes> hexToBytes(const uint8_t* text, size_t len) {
        if (len % 2 != 0) return std::nullopt;

        Bytes result;
        result.reserve(len / 2);
        for (size_t i = 0; i < len; i += 2) {
            int hi = hexNibble(text[i]);
            int lo = hexNibble(text[i + 1]);
            if (hi < 0 || lo < 0) return std::nullopt;
            result.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }
        return result;
    }

    /** 解析人工输入的十六进制串，允许字节间空白（如 "01 03 00 00"） */
    static std::optional<Bytes> parseHexString(const std::string& text) {
        std::string compact;
        compact.reserve(text.size());
        for (unsigned char c : text) {
            if (!std::isspace(c)) compact += static_cast<char>(c);
        }
        return hexToBytes(reinterpret_cast<const uint8_t*>(compact.data()), compact.size());
    }

    /** 空格分隔的大写十六进制，用于日志 */
    static std::string toHexString(const Bytes& data) {
        std::ostringstream oss;
        for (size_t i = 0; i < data.size(); ++i) {
            if (i > 0) oss << " ";
            oss << std::hex << std::uppercase << std::setw(2)
                << std::setfill('0') << static_cast<int>(data[i]);
        }
        return oss.str();
    }

    /**
     * @brief 日志用帧转储："TCP-REQ [12]: 00 01 00 00 ..."
     * 超过 maxBytes 的部分以 "..." 截断
     */
    static std::string dumpFrame(const std::string& label, const Bytes& data,
                                 size_t maxBytes = Constants::LOG_DUMP_MAX_BYTES) {
        std::string result = label + " [" + std::to_string(data.size()) + "]: ";
        if (data.size() <= maxBytes) {
            return result + toHexString(data);
        }
        Bytes head(data.begin(), data.begin() + static_cast<ptrdiff_t>(maxBytes));
        return result + toHexString(head) + " ...";
    }

private:
    static int hexNibble(uint8_t c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    }
};

}  // namespace modbus
