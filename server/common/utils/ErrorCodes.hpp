#pragma once

/**
 * @brief 统一错误码定义
 *
 * 错误码规则：
 * - 1xxx: 配置/参数错误
 * - 3xxx: Modbus 帧与事务错误
 */
namespace ErrorCodes {

// ==================== 配置错误 (1xxx) ====================

/** 配置验证失败 */
inline constexpr int VALIDATION_FAILED = 1002;

// ==================== Modbus 错误 (3xxx) ====================

/** 帧格式错误（起始符、十六进制、长度、协议号、单元号不匹配等） */
inline constexpr int MODBUS_BAD_FORM = 3001;

/** LRC / CRC 校验失败 */
inline constexpr int MODBUS_BAD_CHECKSUM = 3002;

/** 未知的线路协议名称 */
inline constexpr int MODBUS_BAD_PROTOCOL = 3003;

/** 事务状态不允许该操作 */
inline constexpr int MODBUS_INVALID_STATE = 3004;

}  // namespace ErrorCodes
