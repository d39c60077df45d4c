#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/StringUtils.hpp"
#include "common/protocol/modbus/Modbus.hpp"

/**
 * @brief 回放驱动 - 按行读取命令驱动一个桥接会话
 *
 * 命令：
 * - host <hex>    主机侧数据，产生的设备请求输出为 "device <HEX>"
 * - device <hex>  设备侧数据，在途事务结束时输出 "host <HEX>"（无帧时 "host -"）
 * - timeout       设备无应答
 * - reset         主机断开
 * - stats         输出会话计数
 *
 * 空行和 # 开头的行忽略；协议输出写 out，诊断写 err
 */
class ReplayRunner {
public:
    ReplayRunner(modbus::BridgeSession& session, std::ostream& out, std::ostream& err)
        : session_(session), out_(out), err_(err) {}

    /**
     * @brief 读到 EOF 为止
     * @return 读取的行数
     */
    size_t run(std::istream& in) {
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            try {
                handleLine(line, lineNo);
            } catch (const AppException& e) {
                err_ << "line " << lineNo << ": " << e.what() << " (code " << e.getCode() << ")" << std::endl;
                LOG_ERROR << "[Replay] Line " << lineNo << " failed: " << e.what();
            }
        }
        out_.flush();
        return lineNo;
    }

    void handleLine(const std::string& rawLine, size_t lineNo) {
        std::string line = StringUtils::trim(rawLine);
        if (line.empty() || StringUtils::startsWith(line, "#")) {
            return;
        }

        auto spacePos = line.find_first_of(" \t");
        std::string command = StringUtils::toLower(line.substr(0, spacePos));
        std::string argument = spacePos == std::string::npos ? "" : StringUtils::trim(line.substr(spacePos));

        if (command == "host") {
            auto bytes = parseHexArgument(command, argument, lineNo);
            if (!bytes) return;
            session_.feedHost(*bytes);
            forward();
        } else if (command == "device") {
            auto bytes = parseHexArgument(command, argument, lineNo);
            if (!bytes) return;
            bool wasInFlight = session_.hasInFlight();
            auto answer = session_.feedDevice(*bytes);
            // 在途事务结束（正常应答或错误应答）才有输出
            if (wasInFlight && !session_.hasInFlight()) {
                emitFrame("host", answer);
                forward();
            }
        } else if (command == "timeout") {
            bool wasInFlight = session_.hasInFlight();
            auto error = session_.onDeviceTimeout();
            if (wasInFlight) {
                emitFrame("host", error);
                forward();
            }
        } else if (command == "reset") {
            session_.reset();
            LOG_INFO << "[Replay] Session reset";
        } else if (command == "stats") {
            printStats();
        } else {
            err_ << "line " << lineNo << ": unknown command '" << command << "'" << std::endl;
            LOG_WARN << "[Replay] Line " << lineNo << ": unknown command '" << command << "'";
        }
    }

private:
    modbus::BridgeSession& session_;
    std::ostream& out_;
    std::ostream& err_;

    /** "<side> <HEX>"；帧为空（串口主机的无应答）时输出 "<side> -" */
    void emitFrame(const char* side, const std::optional<modbus::Bytes>& frame) {
        if (frame) {
            out_ << side << " " << modbus::ModbusUtils::bytesToHex(*frame) << "\n";
        } else {
            out_ << side << " -\n";
        }
    }

    /** 转发所有可发送的设备请求，以及无法转发时直接回给主机的异常帧 */
    void forward() {
        while (auto request = session_.nextDeviceRequest()) {
            emitFrame("device", request);
        }
        while (auto reply = session_.nextHostReply()) {
            emitFrame("host", reply);
        }
    }

    void printStats() {
        const auto& stats = session_.stats();
        out_ << "stats host_frames=" << stats.hostFrames
             << " device_frames=" << stats.deviceFrames
             << " bad_frames=" << stats.badFrames
             << " timeouts=" << stats.timeouts
             << " discarded_bytes=" << stats.discardedBytes
             << " dropped_requests=" << stats.droppedRequests
             << " pending=" << session_.pendingCount()
             << " in_flight=" << (session_.hasInFlight() ? 1 : 0) << "\n";
    }

    std::optional<modbus::Bytes> parseHexArgument(const std::string& command, const std::string& text,
                                                  size_t lineNo) {
        auto bytes = modbus::ModbusUtils::parseHexString(text);
        if (!bytes || bytes->empty()) {
            err_ << "line " << lineNo << ": " << command << " expects hex bytes" << std::endl;
            LOG_WARN << "[Replay] Line " << lineNo << ": bad hex argument for '" << command << "'";
            return std::nullopt;
        }
        return bytes;
    }
};
