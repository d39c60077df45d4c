#pragma once

#include "common/utils/LoggerManager.hpp"
#include "common/protocol/modbus/Modbus.Types.hpp"

namespace fs = std::filesystem;

/**
 * @brief 桥接配置
 * 未出现的字段保持默认值
 */
struct BridgeSettings {
    std::string logLevel = Constants::DEFAULT_LOG_LEVEL;
    bool consoleLog = false;
    std::string logDir = Constants::DEFAULT_LOG_DIR;
    modbus::WireProtocol hostProtocol = modbus::WireProtocol::TCP;    // modbus_ip.protocol
    modbus::WireProtocol deviceProtocol = modbus::WireProtocol::RTU;  // modbus_serial.protocol
    size_t maxBufferSize = Constants::DEFAULT_MAX_BUFFER_SIZE;
    size_t maxPendingRequests = Constants::DEFAULT_MAX_PENDING_REQUESTS;
};

/**
 * @brief 配置管理器 - 负责加载、验证和管理桥接配置
 *
 * 启动时检查配置文件的完整性和正确性：
 * - JSON 语法检查
 * - 协议名称合法性（串口侧只允许 mbasc / mbrtu）
 * - 日志级别、缓冲区上限、请求队列上限范围校验
 * - 缺省节使用默认值并给出警告
 *
 * 所有错误与警告收集完毕后统一输出
 */
class ConfigManager {
public:
    /**
     * @brief 加载并验证配置文件
     * @param explicitPath 命令行指定的路径，为空时按默认位置查找
     * @return 是否成功加载，失败时已输出详细错误信息到 stderr 和日志
     */
    static bool load(const std::optional<std::string>& explicitPath = std::nullopt) {
        // 每次加载前重置为默认值，避免读取失败时沿用旧值
        settings_ = BridgeSettings{};

        // 1. 查找配置文件
        auto configPath = explicitPath ? checkExplicitPath(*explicitPath) : findConfigFile();
        if (!configPath) {
            return false;
        }

        // 2. 解析 JSON
        Json::Value root;
        if (!parseConfigFile(*configPath, root)) {
            return false;
        }

        // 3. 验证并提取配置
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
        BridgeSettings parsed = collect(root, errors, warnings);

        // 先输出警告（不阻断启动）
        if (!warnings.empty()) {
            printWarnings("配置警告 (" + *configPath + ")", warnings);
        }

        // 有错误则中断启动
        if (!errors.empty()) {
            printErrors("配置验证失败: " + *configPath, errors);
            return false;
        }

        settings_ = parsed;
        LOG_INFO << "[Config] Loaded from: " << *configPath;
        return true;
    }

    /**
     * @brief 从 JSON 对象构建配置
     * @throws ValidationException 存在任一错误，消息为全部错误以 "; " 连接
     */
    static BridgeSettings fromJson(const Json::Value& root) {
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
        BridgeSettings parsed = collect(root, errors, warnings);

        for (const auto& msg : warnings) {
            LOG_WARN << "[Config] " << msg;
        }

        if (!errors.empty()) {
            std::string message;
            for (const auto& msg : errors) {
                if (!message.empty()) message += "; ";
                message += msg;
            }
            throw ValidationException(message);
        }
        return parsed;
    }

    /**
     * @brief 校验配置并收集错误与警告
     * @return 解析出的配置（有错误时对应字段保持默认值）
     */
    static BridgeSettings collect(const Json::Value& root,
                                  std::vector<std::string>& errors,
                                  std::vector<std::string>& warnings) {
        BridgeSettings result;

        if (!root.isObject()) {
            errors.emplace_back("配置文件根节点必须是 JSON 对象");
            return result;
        }

        validateLogging(root, result, errors);
        validateProtocol(root, "modbus_ip", false, result.hostProtocol, errors, warnings);
        validateProtocol(root, "modbus_serial", true, result.deviceProtocol, errors, warnings);
        validateLimit(root, "max_buffer_size", Constants::MIN_MAX_BUFFER_SIZE,
                      Constants::MAX_MAX_BUFFER_SIZE, result.maxBufferSize, errors);
        validateLimit(root, "max_pending_requests", Constants::MIN_MAX_PENDING_REQUESTS,
                      Constants::MAX_MAX_PENDING_REQUESTS, result.maxPendingRequests, errors);

        return result;
    }

    static const BridgeSettings& getSettings() { return settings_; }

    static std::string getLogLevel() { return settings_.logLevel; }
    static bool isConsoleLogEnabled() { return settings_.consoleLog; }
    static std::string getLogDir() { return settings_.logDir; }
    static modbus::WireProtocol getHostProtocol() { return settings_.hostProtocol; }
    static modbus::WireProtocol getDeviceProtocol() { return settings_.deviceProtocol; }
    static size_t getMaxBufferSize() { return settings_.maxBufferSize; }
    static size_t getMaxPendingRequests() { return settings_.maxPendingRequests; }

private:
    inline static BridgeSettings settings_{};

    // ─── 配置文件查找 ───────────────────────────────────────────

    static std::optional<std::string> findConfigFile() {
        static const std::vector<std::string> paths = {
            "./config/config.local.json",
            "../config/config.local.json",
            "./config/config.json",
            "../config/config.json",
            "config.json"
        };

        for (const auto& path : paths) {
            if (fs::exists(path)) {
                return path;
            }
        }

        std::vector<std::string> hints = {"请在以下位置之一创建配置文件:"};
        for (const auto& p : paths) {
            hints.push_back("  - " + p);
        }
        hints.emplace_back("可参考 config/config.example.json");
        printErrors("未找到配置文件", hints);
        return std::nullopt;
    }

    static std::optional<std::string> checkExplicitPath(const std::string& path) {
        if (!fs::exists(path)) {
            printErrors("配置文件不存在: " + path, {"请检查命令行参数中的路径"});
            return std::nullopt;
        }
        return path;
    }

    // ─── JSON 解析 ──────────────────────────────────────────────

    static bool parseConfigFile(const std::string& path, Json::Value& root) {
        std::ifstream ifs(path);
        if (!ifs) {
            printErrors("无法打开配置文件: " + path, {"请检查文件是否存在及读取权限"});
            return false;
        }

        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, ifs, &root, &errs)) {
            printErrors("JSON 解析失败: " + path, {
                errs,
                "请检查 JSON 语法（缺少逗号、引号不匹配、尾部逗号等）"
            });
            return false;
        }

        if (!root.isObject()) {
            printErrors("JSON 格式错误: " + path, {"配置文件根节点必须是 JSON 对象"});
            return false;
        }

        return true;
    }

    // ─── 配置验证 ──────────────────────────────────────────────

    static void validateLogging(const Json::Value& root, BridgeSettings& result,
                                std::vector<std::string>& errors) {
        if (root.isMember("log_level")) {
            if (!root["log_level"].isString()) {
                errors.emplace_back("[log_level] 必须是字符串");
            } else {
                auto level = StringUtils::toUpper(StringUtils::trim(root["log_level"].asString()));
                if (!LoggerManager::parseLogLevel(level)) {
                    errors.push_back("[log_level] 未知日志级别: '" + root["log_level"].asString() +
                                     "'（可选: TRACE/DEBUG/INFO/WARN/ERROR/FATAL）");
                } else {
                    result.logLevel = level;
                }
            }
        }

        if (root.isMember("console_log")) {
            if (!root["console_log"].isBool()) {
                errors.emplace_back("[console_log] 必须是 true 或 false");
            } else {
                result.consoleLog = root["console_log"].asBool();
            }
        }

        if (root.isMember("log_dir")) {
            if (!root["log_dir"].isString() || root["log_dir"].asString().empty()) {
                errors.emplace_back("[log_dir] 必须是非空字符串");
            } else {
                result.logDir = root["log_dir"].asString();
            }
        }
    }

    /**
     * @brief 校验 "<section>.protocol"
     * @param serialOnly 串口侧只允许 ASCII / RTU
     */
    static void validateProtocol(const Json::Value& root, const std::string& section, bool serialOnly,
                                 modbus::WireProtocol& target,
                                 std::vector<std::string>& errors,
                                 std::vector<std::string>& warnings) {
        const std::string key = "[" + section + ".protocol] ";
        const std::string fallback = modbus::wireProtocolToString(target);

        if (!root.isMember(section)) {
            warnings.push_back("[" + section + "] 缺少配置节，使用默认协议 " + fallback);
            return;
        }
        if (!root[section].isObject()) {
            errors.push_back("[" + section + "] 必须是 JSON 对象");
            return;
        }

        const auto& node = root[section];
        if (!node.isMember("protocol")) {
            warnings.push_back(key + "未配置，使用默认协议 " + fallback);
            return;
        }
        if (!node["protocol"].isString()) {
            errors.push_back(key + "必须是字符串");
            return;
        }

        modbus::WireProtocol protocol = target;
        try {
            protocol = modbus::parseWireProtocol(node["protocol"].asString());
        } catch (const BadProtocolException& e) {
            errors.push_back(key + e.what() + "（可选: mbasc/mbrtu/mbtcp）");
            return;
        }

        if (serialOnly && !modbus::isSerialProtocol(protocol)) {
            errors.push_back(key + "串口侧只支持 mbasc 或 mbrtu，当前为 " +
                             modbus::wireProtocolToString(protocol));
            return;
        }

        target = protocol;
    }

    /** 校验可选的整数上限字段，缺省时保持默认值 */
    static void validateLimit(const Json::Value& root, const std::string& field,
                              size_t minValue, size_t maxValue, size_t& target,
                              std::vector<std::string>& errors) {
        if (!root.isMember(field)) {
            return;
        }

        const std::string key = "[" + field + "] ";
        const auto& value = root[field];
        if (!value.isIntegral()) {
            errors.push_back(key + "必须是整数");
            return;
        }

        auto size = value.asLargestInt();
        if (size < static_cast<Json::LargestInt>(minValue) ||
            size > static_cast<Json::LargestInt>(maxValue)) {
            errors.push_back(key + "值无效: " + std::to_string(size) +
                             "（有效范围: " + std::to_string(minValue) +
                             "-" + std::to_string(maxValue) + "）");
            return;
        }

        target = static_cast<size_t>(size);
    }

    // ─── 工具方法 ──────────────────────────────────────────────

    static void printErrors(const std::string& title, const std::vector<std::string>& messages) {
        std::string border(60, '=');
        std::cerr << "\n" << border << "\n";
        std::cerr << " [ERROR] " << title << "\n";
        std::cerr << std::string(60, '-') << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_ERROR << "[Config] " << msg;
        }
        std::cerr << border << "\n" << std::endl;
    }

    static void printWarnings(const std::string& title, const std::vector<std::string>& messages) {
        std::cerr << "\n" << std::string(60, '-') << "\n";
        std::cerr << " [WARN] " << title << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_WARN << "[Config] " << msg;
        }
        std::cerr << std::string(60, '-') << "\n" << std::endl;
    }
};
