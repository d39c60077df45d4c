#pragma once

#include "Modbus.Types.hpp"

#include <array>

namespace modbus {

namespace detail {

/** Modbus CRC16 反射多项式 */
inline constexpr uint16_t CRC16_POLY = 0xA001;

/**
 * @brief 生成 CRC16 查找表（XMODEM 风格，每个索引移位/异或 8 次）
 * 编译期生成，运行时只读，多线程共享无需初始化同步
 */
constexpr std::array<uint16_t, 256> makeCrc16Table() {
    std::array<uint16_t, 256> table{};
    for (uint16_t i = 0; i < 256; ++i) {
        uint16_t data = static_cast<uint16_t>(i << 1);
        uint16_t crc = 0;
        for (int j = 8; j > 0; --j) {
            data >>= 1;
            if ((data ^ crc) & 0x0001) {
                crc = static_cast<uint16_t>((crc >> 1) ^ CRC16_POLY);
            } else {
                crc >>= 1;
            }
        }
        table[i] = crc;
    }
    return table;
}

inline constexpr std::array<uint16_t, 256> CRC16_TABLE = makeCrc16Table();

}  // namespace detail

/**
 * @brief Modbus 校验工具
 * LRC（Modbus/ASCII）与 CRC16（Modbus/RTU），输入均为原始二进制（含 UnitID）
 */
class Checksum {
public:
    /** Modbus/RTU 初始 CRC */
    static constexpr uint16_t CRC16_SEED = 0xFFFF;

    // ==================== LRC (Modbus ASCII) ====================

    /**
     * @brief 计算 LRC：字节和取低 8 位，取反加一
     * @throws BadFormException 输入少于 2 字节
     */
    static uint8_t lrc(const uint8_t* data, size_t len) {
        if (len < MIN_FRAME_LENGTH) {
            throw BadFormException("MB/ASC packet is too short");
        }
        unsigned sum = 0;
        for (size_t i = 0; i < len; ++i) {
            sum += data[i];
        }
        return static_cast<uint8_t>(((sum & 0xFF) ^ 0xFF) + 1);
    }

    static uint8_t lrc(const Bytes& data) {
        return lrc(data.data(), data.size());
    }

    // ==================== CRC16 (Modbus RTU) ====================

    /**
     * @brief 查表计算 CRC16
     * @param seed 初始值，Modbus 为 0xFFFF；分段计算时传入上一段结果
     * @throws BadFormException 输入少于 2 字节
     */
    static uint16_t crc16(const uint8_t* data, size_t len, uint16_t seed = CRC16_SEED) {
        if (len < MIN_FRAME_LENGTH) {
            throw BadFormException("MB/RTU packet is too short");
        }
        uint16_t crc = seed;
        for (size_t i = 0; i < len; ++i) {
            crc = static_cast<uint16_t>((crc >> 8) ^ detail::CRC16_TABLE[(crc ^ data[i]) & 0xFF]);
        }
        return crc;
    }

    static uint16_t crc16(const Bytes& data, uint16_t seed = CRC16_SEED) {
        return crc16(data.data(), data.size(), seed);
    }
};

}  // namespace modbus
