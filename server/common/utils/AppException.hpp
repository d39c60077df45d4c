#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief 应用异常基类
 */
class AppException : public std::exception {
private:
    int code_;
    std::string message_;

public:
    AppException(int code, std::string message)
        : code_(code), message_(std::move(message)) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    int getCode() const { return code_; }
    const std::string& getMessage() const { return message_; }
};

/**
 * @brief 配置验证失败
 */
class ValidationException : public AppException {
public:
    explicit ValidationException(const std::string& message = "Validation failed")
        : AppException(ErrorCodes::VALIDATION_FAILED, message) {}
};

/**
 * 错误码定义：
 * 3xxx - Modbus 帧与事务错误
 * 调用方（链路层）应将 BadForm / BadChecksum 视为"丢弃该帧"，而非致命错误
 */

/**
 * @brief 帧格式错误
 */
class BadFormException : public AppException {
public:
    explicit BadFormException(const std::string& message = "Malformed Modbus frame")
        : AppException(ErrorCodes::MODBUS_BAD_FORM, message) {}
};

/**
 * @brief LRC / CRC 校验失败
 */
class BadChecksumException : public AppException {
public:
    explicit BadChecksumException(const std::string& message = "Bad Modbus checksum")
        : AppException(ErrorCodes::MODBUS_BAD_CHECKSUM, message) {}
};

/**
 * @brief 未知线路协议
 */
class BadProtocolException : public AppException {
public:
    explicit BadProtocolException(const std::string& message = "Unknown Modbus protocol")
        : AppException(ErrorCodes::MODBUS_BAD_PROTOCOL, message) {}
};

/**
 * @brief 事务状态不允许当前操作
 */
class InvalidStateException : public AppException {
public:
    explicit InvalidStateException(const std::string& message = "Invalid transaction state")
        : AppException(ErrorCodes::MODBUS_INVALID_STATE, message) {}
};
