#pragma once

#include "Modbus.Types.hpp"
#include "Modbus.Utils.hpp"
#include "Modbus.Framer.hpp"
#include "Modbus.Transaction.hpp"

#include <deque>
#include <optional>

namespace modbus {

/** 桥接会话计数 */
struct BridgeStats {
    uint64_t hostFrames = 0;      // 主机侧完整请求帧
    uint64_t deviceFrames = 0;    // 设备侧完整响应帧
    uint64_t badFrames = 0;       // 格式/校验错误被丢弃的帧
    uint64_t timeouts = 0;        // 设备无应答次数
    uint64_t discardedBytes = 0;  // 分帧时丢弃的字节
    uint64_t droppedRequests = 0; // 队列已满被丢弃的请求
};

/**
 * @brief Modbus 桥接会话（不含 I/O）
 *
 * 一个会话连接一个主机侧（请求方，任意协议）和一个设备侧（串口总线）：
 * 1. feedHost: 主机数据进入缓冲区，切分为请求帧，每帧生成一个事务排队
 * 2. nextDeviceRequest: 无在途事务时取出下一个事务，按设备协议编码
 *    无法按设备协议编码的请求直接结束，网关异常帧经 nextHostReply 返回主机
 * 3. feedDevice: 设备数据切分为响应帧，写入在途事务并按主机协议编码返回
 * 4. onDeviceTimeout: 驱动判定设备无应答，返回主机协议的无应答帧
 *
 * Modbus 为半双工，同一时刻最多一个在途事务。
 * 事务结束时设备缓冲区中的残余字节一并丢弃，不带入下一个事务。
 * 会话由单一线程驱动，不加锁、不阻塞；串口/套接字读写由调用方负责。
 */
class BridgeSession {
public:
    BridgeSession(WireProtocol hostProtocol, WireProtocol deviceProtocol,
                  size_t maxBufferSize = Constants::DEFAULT_MAX_BUFFER_SIZE,
                  size_t maxPendingRequests = Constants::DEFAULT_MAX_PENDING_REQUESTS)
        : hostProtocol_(hostProtocol),
          deviceProtocol_(deviceProtocol),
          maxBufferSize_(maxBufferSize),
          maxPendingRequests_(maxPendingRequests) {}

    WireProtocol hostProtocol() const { return hostProtocol_; }
    WireProtocol deviceProtocol() const { return deviceProtocol_; }
    const BridgeStats& stats() const { return stats_; }
    bool hasInFlight() const { return inFlight_.has_value(); }
    size_t pendingCount() const { return pending_.size(); }

    // ==================== 主机侧 ====================

    /**
     * @brief 主机侧收到数据
     * @return 本次新排队的事务数
     */
    size_t feedHost(const char* data, size_t len) {
        hostBuffer_.append(data, len);

        size_t queued = 0;
        for (auto& frame : drainFrames(hostBuffer_, hostProtocol_, true, "host")) {
            ++stats_.hostFrames;
            LOG_DEBUG << "[Bridge] " << describeFrame(hostProtocol_, "REQ", frame);

            ModbusTransaction txn;
            try {
                txn.setRequest(frame, hostProtocol_);
            } catch (const BadFormException& e) {
                ++stats_.badFrames;
                LOG_WARN << "[Bridge] Bad Modbus form from host: " << e.what();
                continue;
            } catch (const BadChecksumException& e) {
                ++stats_.badFrames;
                LOG_WARN << "[Bridge] Bad checksum from host: " << e.what();
                continue;
            }

            if (pending_.size() >= maxPendingRequests_) {
                ++stats_.droppedRequests;
                LOG_WARN << "[Bridge] Request queue full (" << pending_.size()
                         << "), dropping request for unit " << static_cast<int>(txn.unitId());
                continue;
            }

            pending_.push_back(std::move(txn));
            ++queued;
        }
        return queued;
    }

    size_t feedHost(const Bytes& data) {
        return feedHost(reinterpret_cast<const char*>(data.data()), data.size());
    }

    /**
     * @brief 取出下一个待发往设备的请求
     *
     * 有在途事务或队列为空时返回 nullopt。
     * 广播请求（UnitID = 0）发出后不进入在途状态，设备不会应答。
     */
    std::optional<Bytes> nextDeviceRequest() {
        while (!inFlight_ && !pending_.empty()) {
            ModbusTransaction txn = std::move(pending_.front());
            pending_.pop_front();

            Bytes request;
            try {
                request = txn.getRequest(deviceProtocol_);
            } catch (const BadFormException& e) {
                ++stats_.badFrames;
                LOG_WARN << "[Bridge] Request from unit " << static_cast<int>(txn.unitId())
                         << " cannot be sent as " << wireProtocolToString(deviceProtocol_)
                         << ": " << e.what();
                if (auto error = txn.getPathUnavailableError(hostProtocol_)) {
                    LOG_DEBUG << "[Bridge] " << describeFrame(hostProtocol_, "ERR", *error);
                    hostReplies_.push_back(std::move(*error));
                }
                continue;
            }

            LOG_DEBUG << "[Bridge] " << describeFrame(deviceProtocol_, "REQ", request);

            if (txn.isBroadcast()) {
                LOG_DEBUG << "[Bridge] Broadcast request, no response expected";
            } else {
                inFlight_ = std::move(txn);
            }
            return request;
        }
        return std::nullopt;
    }

    /**
     * @brief 取出下一个不经设备、直接回给主机的帧（网关异常）
     */
    std::optional<Bytes> nextHostReply() {
        if (hostReplies_.empty()) {
            return std::nullopt;
        }
        Bytes reply = std::move(hostReplies_.front());
        hostReplies_.pop_front();
        return reply;
    }

    // ==================== 设备侧 ====================

    /**
     * @brief 设备侧收到数据
     *
     * 取第一个完整响应帧写入在途事务：
     * - 成功：返回按主机协议编码的响应
     * - 格式/校验错误或不匹配：返回主机协议的无应答帧（串口主机为空）
     * - 响应不完整：返回 nullopt，等待更多数据
     * 事务结束后缓冲区中余下的字节一律丢弃
     */
    std::optional<Bytes> feedDevice(const char* data, size_t len) {
        deviceBuffer_.append(data, len);

        if (!inFlight_) {
            discardDeviceBytes("no request in flight");
            return std::nullopt;
        }

        auto frames = drainFrames(deviceBuffer_, deviceProtocol_, false, "device");
        if (frames.empty()) {
            return std::nullopt;
        }

        stats_.deviceFrames += frames.size();
        if (frames.size() > 1) {
            LOG_WARN << "[Bridge] " << frames.size() - 1 << " extra response frame(s) from device ignored";
        }

        auto answer = applyResponse(frames.front());
        discardDeviceBytes("after response");
        return answer;
    }

    std::optional<Bytes> feedDevice(const Bytes& data) {
        return feedDevice(reinterpret_cast<const char*>(data.data()), data.size());
    }

    /**
     * @brief 设备无应答（由驱动的超时判定触发）
     * @return 主机协议的无应答帧；串口主机或无在途事务时为 nullopt
     */
    std::optional<Bytes> onDeviceTimeout() {
        if (!inFlight_) {
            LOG_DEBUG << "[Bridge] Timeout with no request in flight";
            return std::nullopt;
        }

        ++stats_.timeouts;
        LOG_DEBUG << "[Bridge] No response from unit " << static_cast<int>(inFlight_->unitId());

        discardDeviceBytes("incomplete response");
        return finishWithoutResponse();
    }

    /** 主机断开：清空缓冲区、队列与在途事务 */
    void reset() {
        hostBuffer_.retrieveAll();
        deviceBuffer_.retrieveAll();
        pending_.clear();
        hostReplies_.clear();
        inFlight_.reset();
    }

private:
    WireProtocol hostProtocol_;
    WireProtocol deviceProtocol_;
    size_t maxBufferSize_;
    size_t maxPendingRequests_;

    trantor::MsgBuffer hostBuffer_;
    trantor::MsgBuffer deviceBuffer_;

    std::deque<ModbusTransaction> pending_;
    std::deque<Bytes> hostReplies_;
    std::optional<ModbusTransaction> inFlight_;
    BridgeStats stats_;

    /**
     * @brief 切分缓冲区中的完整帧，不完整的尾部留在缓冲区
     * 尾部超过上限时清空，防止持续的垃圾数据撑大缓冲区
     */
    std::vector<Bytes> drainFrames(trantor::MsgBuffer& buffer, WireProtocol protocol,
                                   bool isRequest, const char* side) {
        if (buffer.readableBytes() == 0) {
            return {};
        }

        FrameSplit split = Framer::split(protocol, reinterpret_cast<const uint8_t*>(buffer.peek()),
                                         buffer.readableBytes(), isRequest);
        buffer.retrieveAll();

        if (split.discarded > 0) {
            stats_.discardedBytes += split.discarded;
            LOG_WARN << "[Bridge] Discarded " << split.discarded << "B unframed data on " << side << " side";
        }

        if (!split.remainder.empty()) {
            if (split.remainder.size() > maxBufferSize_) {
                stats_.discardedBytes += split.remainder.size();
                LOG_ERROR << "[Bridge] Buffer overflow (" << split.remainder.size() << "B) on "
                          << side << " side, clearing | "
                          << ModbusUtils::dumpFrame("HEAD", split.remainder);
            } else {
                buffer.append(reinterpret_cast<const char*>(split.remainder.data()),
                              split.remainder.size());
                LOG_TRACE << "[Bridge] Incomplete frame on " << side << " side ("
                          << split.remainder.size() << "B), waiting for more data";
            }
        }

        return std::move(split.frames);
    }

    /** 写入在途事务并结束它，返回给主机的帧 */
    std::optional<Bytes> applyResponse(const Bytes& frame) {
        LOG_DEBUG << "[Bridge] " << describeFrame(deviceProtocol_, "RSP", frame);

        try {
            inFlight_->setResponse(frame, deviceProtocol_);
            Bytes answer = inFlight_->getResponse(hostProtocol_);
            inFlight_.reset();
            LOG_DEBUG << "[Bridge] " << describeFrame(hostProtocol_, "RSP", answer);
            return answer;
        } catch (const BadFormException& e) {
            ++stats_.badFrames;
            LOG_WARN << "[Bridge] Bad Modbus form from device: " << e.what();
        } catch (const BadChecksumException& e) {
            // 多为线路噪声或接线松动
            ++stats_.badFrames;
            LOG_WARN << "[Bridge] Bad checksum from device: " << e.what();
        }

        return finishWithoutResponse();
    }

    /** 丢弃设备缓冲区中的全部字节 */
    void discardDeviceBytes(const char* reason) {
        size_t stale = deviceBuffer_.readableBytes();
        if (stale == 0) {
            return;
        }
        stats_.discardedBytes += stale;
        deviceBuffer_.retrieveAll();
        LOG_WARN << "[Bridge] Discarded " << stale << "B from device, " << reason;
    }

    /** 结束在途事务并生成主机协议的无应答帧 */
    std::optional<Bytes> finishWithoutResponse() {
        ModbusTransaction txn = std::move(*inFlight_);
        inFlight_.reset();

        if (txn.state() == TransactionState::ResponseSet) {
            // 响应已收到但无法按主机协议编码
            return txn.getPathUnavailableError(hostProtocol_);
        }

        auto error = txn.getNoResponseError(hostProtocol_);
        if (error) {
            LOG_DEBUG << "[Bridge] " << describeFrame(hostProtocol_, "ERR", *error);
        } else {
            LOG_DEBUG << "[Bridge] No error frame for " << wireProtocolToString(hostProtocol_) << " host";
        }
        return error;
    }

    /** 日志描述：ASCII 帧按文本输出，其余按十六进制 */
    static std::string describeFrame(WireProtocol protocol, const char* direction, const Bytes& frame) {
        switch (protocol) {
            case WireProtocol::ASCII: {
                std::string text(frame.begin(), frame.end());
                while (!text.empty() && (text.back() == '\r' || text.back() == '\n')) {
                    text.pop_back();
                }
                return std::string("ASC-") + direction + ": " + text;
            }
            case WireProtocol::RTU:
                return ModbusUtils::dumpFrame(std::string("RTU-") + direction, frame);
            case WireProtocol::TCP:
                return ModbusUtils::dumpFrame(std::string("TCP-") + direction, frame);
        }
        return ModbusUtils::dumpFrame(direction, frame);
    }
};

}  // namespace modbus
