// mimalloc: 全局替换 new/delete，必须在所有其他 include 之前
#include <mimalloc-new-delete.h>
#include <mimalloc.h>

// Utils
#include "common/utils/LoggerManager.hpp"
#include "common/utils/ConfigManager.hpp"

// Protocol
#include "common/protocol/modbus/Modbus.hpp"
#include "common/replay/ReplayRunner.hpp"

int main(int argc, char* argv[]) {
    // 1. 配置加载前日志只输出到 stderr（stdout 留给回放输出）
    LoggerManager::initializeConsoleOnly();

    // 2. 加载并验证配置文件（失败时 ConfigManager 已输出详细错误）
    std::optional<std::string> configPath;
    if (argc > 1) {
        configPath = argv[1];
    }
    if (!ConfigManager::load(configPath)) {
        std::cerr << "Bridge startup aborted due to configuration errors." << std::endl;
        return 1;
    }

    // 3. 初始化日志系统（AsyncFileLogger 异步写盘 + 按日期轮转）
    try {
        LoggerManager::initialize(ConfigManager::getLogDir(), ConfigManager::isConsoleLogEnabled());
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Cannot create log directory '" << ConfigManager::getLogDir() << "': "
                  << e.what() << std::endl;
        return 1;
    }
    LoggerManager::setLogLevel(ConfigManager::getLogLevel());

    int v = mi_version();
    LOG_INFO << "[Startup] mimalloc v" << (v / 100) << "." << (v % 100) << " active";
    LOG_INFO << "[Startup] Bridge " << modbus::wireProtocolToString(ConfigManager::getHostProtocol())
             << " <-> " << modbus::wireProtocolToString(ConfigManager::getDeviceProtocol())
             << ", buffer limit " << ConfigManager::getMaxBufferSize() << "B"
             << ", queue limit " << ConfigManager::getMaxPendingRequests();

    // 4. 回放 stdin
    modbus::BridgeSession session(ConfigManager::getHostProtocol(),
                                  ConfigManager::getDeviceProtocol(),
                                  ConfigManager::getMaxBufferSize(),
                                  ConfigManager::getMaxPendingRequests());

    ReplayRunner runner(session, std::cout, std::cerr);
    size_t lineNo = runner.run(std::cin);

    const auto& stats = session.stats();
    LOG_INFO << "[Startup] Replay finished: " << lineNo << " lines, "
             << stats.hostFrames << " host frames, " << stats.deviceFrames << " device frames, "
             << stats.badFrames << " bad frames, " << stats.timeouts << " timeouts, "
             << stats.droppedRequests << " dropped requests";

    // 5. 退出前刷新日志
    LoggerManager::close();
    return 0;
}
