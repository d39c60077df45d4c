#pragma once

/**
 * @brief Modbus 协议桥接模块
 *
 * 包含:
 * - Modbus.Types.hpp       - 类型定义、常量、协议名称
 * - Modbus.Checksum.hpp    - LRC、CRC16（编译期查找表）
 * - Modbus.Utils.hpp       - 十六进制转换、日志转储
 * - Modbus.Ascii.hpp       - Modbus/ASCII 编解码与分帧
 * - Modbus.Rtu.hpp         - Modbus/RTU 编解码、帧长估算与分帧
 * - Modbus.Tcp.hpp         - Modbus/TCP 编解码、MBAP 校验与分帧
 * - Modbus.Framer.hpp      - 按协议选择分帧方式
 * - Modbus.Transaction.hpp - 事务：请求/响应跨协议转换、无应答异常帧
 * - Modbus.Bridge.hpp      - 桥接会话：缓冲、排队、在途事务
 */

#include "Modbus.Types.hpp"
#include "Modbus.Checksum.hpp"
#include "Modbus.Utils.hpp"
#include "Modbus.Ascii.hpp"
#include "Modbus.Rtu.hpp"
#include "Modbus.Tcp.hpp"
#include "Modbus.Framer.hpp"
#include "Modbus.Transaction.hpp"
#include "Modbus.Bridge.hpp"
