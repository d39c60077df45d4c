#pragma once

/**
 * @brief 全局常量定义
 *
 * 集中管理项目中的魔法数字，提高可维护性和可读性
 */
namespace Constants {

// ==================== 日志相关 ====================

/** 默认日志目录 */
inline constexpr const char* DEFAULT_LOG_DIR = "./logs";

/** 默认日志级别 */
inline constexpr const char* DEFAULT_LOG_LEVEL = "INFO";

/** 单条日志中十六进制转储的最大字节数 */
inline constexpr size_t LOG_DUMP_MAX_BYTES = 64;

// ==================== 桥接会话 ====================

/** 接收缓冲区默认上限（字节），超过则清空防止内存泄漏 */
inline constexpr size_t DEFAULT_MAX_BUFFER_SIZE = 1024;

/** 接收缓冲区上限的允许范围：至少能容纳一个最大 ASCII 帧 */
inline constexpr size_t MIN_MAX_BUFFER_SIZE = 260;
inline constexpr size_t MAX_MAX_BUFFER_SIZE = 65536;

/** 待转发请求队列默认上限，设备慢或无应答时主机持续发送也不会无限堆积 */
inline constexpr size_t DEFAULT_MAX_PENDING_REQUESTS = 32;
inline constexpr size_t MIN_MAX_PENDING_REQUESTS = 1;
inline constexpr size_t MAX_MAX_PENDING_REQUESTS = 1024;

// ==================== 协议名称 ====================

/** Modbus/ASCII */
inline constexpr const char* PROTOCOL_MBASC = "mbasc";

/** Modbus/RTU */
inline constexpr const char* PROTOCOL_MBRTU = "mbrtu";

/** Modbus/TCP */
inline constexpr const char* PROTOCOL_MBTCP = "mbtcp";

}  // namespace Constants
