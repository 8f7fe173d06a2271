/**
 * @file discovery_engine.cpp
 * @brief DiscoveryEngine implementation.
 *
 * @copyright Copyright (c) 2024 LightScout Contributors
 * @license MIT License
 */

#include "lightscout/core/discovery_engine.hpp"
#include "lightscout/core/completion_policy.hpp"
#include "lightscout/utils/logger.hpp"

#include <exception>
#include <system_error>

namespace lightscout {
namespace core {

namespace {

// Bounds how long destroy() waits for the receiver thread to notice shutdown
constexpr int kReceiveTimeoutMs = 100;

constexpr size_t kMaxDatagramSize = 65535;

std::chrono::milliseconds since(DiscoveryEngine::Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        DiscoveryEngine::Clock::now() - start);
}

}  // namespace

DiscoveryEngine::DiscoveryEngine(const DiscoveryConfig& config)
    : config_(config)
    , state_(RunState::IDLE)
    , started_(false)
    , activeStarts_(0)
    , nextListenerId_(1)
{
    LOG_DEBUG("Discovery", "Created engine for {}:{} (limit {}, timeout {}ms)",
              config_.multicast_host, config_.bind_port,
              config_.reply_limit, config_.timeout_ms);
}

DiscoveryEngine::~DiscoveryEngine() {
    destroy();

    // A start() still inside the poll loop has been woken by destroy();
    // wait until it has stopped touching this object
    {
        std::unique_lock<std::mutex> lock(stateMutex_);
        stateCv_.wait(lock, [this]() { return activeStarts_ == 0; });
    }

    // destroy() leaves the join to us when it ran on the receiver thread
    if (receiverThread_.joinable()) {
        receiverThread_.join();
    }
    releaseSocket();
}

ListenerId DiscoveryEngine::onDeviceAdded(DeviceAddedCallback callback) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    ListenerId id = nextListenerId_++;
    listeners_.emplace_back(id, std::move(callback));
    return id;
}

bool DiscoveryEngine::removeListener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
        if (it->first == id) {
            listeners_.erase(it);
            return true;
        }
    }
    return false;
}

size_t DiscoveryEngine::listenerCount() const {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    return listeners_.size();
}

DiscoveryResult DiscoveryEngine::start() {
    beginStart();
    ActiveStart scope(*this);
    return runStart();
}

std::future<DiscoveryResult> DiscoveryEngine::startAsync() {
    // Counted before the worker exists so the destructor cannot miss it
    beginStart();
    try {
        return std::async(std::launch::async, [this]() {
            ActiveStart scope(*this);
            return runStart();
        });
    } catch (const std::system_error& e) {
        LOG_ERROR("Discovery", "Cannot launch discovery thread: {}", e.what());
        endStart();
        throw;
    }
}

void DiscoveryEngine::beginStart() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    ++activeStarts_;
}

void DiscoveryEngine::endStart() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    --activeStarts_;
    stateCv_.notify_all();
}

DiscoveryResult DiscoveryEngine::runStart() {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == RunState::DESTROYED) {
            LOG_WARN("Discovery", "start() called on a destroyed engine");
            return DiscoveryResult::failure(DiscoveryStatus::ALREADY_DESTROYED,
                                            "engine already destroyed");
        }
        if (started_) {
            LOG_WARN("Discovery", "start() called twice");
            return DiscoveryResult::failure(DiscoveryStatus::ALREADY_STARTED,
                                            "discovery already started");
        }
        started_ = true;
    }

    std::string reason;
    if (!validateConfig(reason)) {
        return fail(DiscoveryStatus::INVALID_CONFIG, reason);
    }

    Clock::time_point sentAt;
    {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
        if (state() == RunState::DESTROYED) {
            return DiscoveryResult::failure(DiscoveryStatus::DESTROYED,
                                            "engine destroyed before bind");
        }

        auto socket = std::make_unique<net::UdpSocket>();
        if (!socket->isValid() || !socket->bind(config_.bind_port, config_.bind_host)) {
            int error = socket->getLastError();
            return fail(DiscoveryStatus::BIND_ERROR,
                        "cannot bind " +
                            (config_.bind_host.empty() ? std::string("0.0.0.0")
                                                       : config_.bind_host) +
                            ":" + std::to_string(config_.bind_port) + ": " +
                            socket->getLastErrorString(),
                        error);
        }

        {
            std::lock_guard<std::mutex> lock(socketMutex_);
            socket_ = std::move(socket);
        }
        setState(RunState::BOUND);

        if (!socket_->setBroadcast(true)) {
            LOG_WARN("Discovery", "Broadcast not enabled, probe may not leave the host");
        }

        setState(RunState::SENDING);

        const std::string probe = buildProbeMessage();
        net::SocketAddress dest(config_.multicast_host, config_.bind_port);
        if (socket_->sendTo(dest, probe.data(), probe.size()) < 0) {
            int error = socket_->getLastError();
            std::string detail = socket_->getLastErrorString();
            releaseSocket();
            return fail(DiscoveryStatus::SEND_ERROR,
                        "cannot send probe to " + dest.toString() + ": " + detail,
                        error);
        }
        sentAt = Clock::now();
        LOG_INFO("Discovery", "Probe sent to {} from port {}",
                 dest.toString(), socket_->getLocalPort());

        running_.store(true);
        receiverThread_ = std::thread(&DiscoveryEngine::receiverLoop, this);
        setState(RunState::POLLING);
    }

    return pollUntilComplete(sentAt);
}

void DiscoveryEngine::destroy() {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == RunState::DESTROYED) {
            return;
        }
        state_ = RunState::DESTROYED;
    }
    stateCv_.notify_all();

    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners_.clear();
    }

    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    running_.store(false);

    if (receiverThread_.joinable()) {
        if (receiverThread_.get_id() == std::this_thread::get_id()) {
            LOG_DEBUG("Discovery", "destroy() from a listener, endpoint released on teardown");
            return;
        }
        receiverThread_.join();
    }

    releaseSocket();
    LOG_DEBUG("Discovery", "Engine destroyed");
}

RunState DiscoveryEngine::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

uint16_t DiscoveryEngine::getLocalPort() const {
    std::lock_guard<std::mutex> lock(socketMutex_);
    return socket_ ? socket_->getLocalPort() : 0;
}

bool DiscoveryEngine::validateConfig(std::string& reason) const {
    if (config_.reply_limit < 1) {
        reason = "reply limit must be at least 1";
        return false;
    }
    if (config_.timeout_ms < 0) {
        reason = "timeout must not be negative";
        return false;
    }
    if (config_.poll_interval_ms < 1) {
        reason = "poll interval must be at least 1ms";
        return false;
    }
    return true;
}

void DiscoveryEngine::setState(RunState next) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (state_ != RunState::DESTROYED) {
        state_ = next;
    }
}

DiscoveryResult DiscoveryEngine::fail(DiscoveryStatus status, const std::string& message,
                                      int errorCode) {
    setState(RunState::FAILED);
    LOG_ERROR("Discovery", "Discovery failed ({}): {}",
              discoveryStatusToString(status), message);
    return DiscoveryResult::failure(status, message, errorCode);
}

DiscoveryResult DiscoveryEngine::pollUntilComplete(Clock::time_point sentAt) {
    const auto interval = std::chrono::milliseconds(config_.poll_interval_ms);
    const auto timeout = std::chrono::milliseconds(config_.timeout_ms);

    std::unique_lock<std::mutex> lock(stateMutex_);
    while (true) {
        bool destroyed = stateCv_.wait_for(lock, interval, [this]() {
            return state_ == RunState::DESTROYED;
        });
        if (destroyed) {
            LOG_INFO("Discovery", "Discovery cancelled by destroy()");
            DiscoveryResult result = DiscoveryResult::failure(
                DiscoveryStatus::DESTROYED, "engine destroyed while discovering");
            result.elapsed = since(sentAt);
            return result;
        }

        auto elapsed = since(sentAt);
        size_t count = registry_.count();

        switch (evaluateCompletion(count, config_.reply_limit, elapsed, timeout)) {
            case Completion::CONTINUE:
                continue;

            case Completion::LIMIT_REACHED:
                state_ = RunState::SUCCEEDED;
                LOG_INFO("Discovery", "Reply limit reached: {} device(s) in {}ms",
                         count, elapsed.count());
                return DiscoveryResult::success(registry_.snapshot(), elapsed);

            case Completion::TIMED_OUT:
                if (count > 0) {
                    state_ = RunState::SUCCEEDED;
                    LOG_INFO("Discovery", "Timeout after {}ms with {} device(s)",
                             elapsed.count(), count);
                    return DiscoveryResult::success(registry_.snapshot(), elapsed);
                }
                state_ = RunState::FAILED;
                LOG_WARN("Discovery", "No device found after timeout exceeded: {}ms",
                         elapsed.count());
                {
                    DiscoveryResult result = DiscoveryResult::failure(
                        DiscoveryStatus::NO_DEVICE_FOUND,
                        "no device found after timeout exceeded: " +
                            std::to_string(elapsed.count()) + "ms");
                    result.elapsed = elapsed;
                    return result;
                }
        }
    }
}

void DiscoveryEngine::receiverLoop() {
    LOG_DEBUG("Discovery", "Receiver thread started");

    std::vector<char> buffer(kMaxDatagramSize);

    while (running_.load()) {
        net::SocketAddress sender;
        int received = socket_->receiveFrom(buffer.data(), buffer.size(),
                                            kReceiveTimeoutMs, sender);

        if (received > 0) {
            handleDatagram(buffer.data(), static_cast<size_t>(received), sender);
        } else if (received < 0 && running_.load()) {
            LOG_ERROR("Discovery", "Receive error: {}", socket_->getLastErrorString());
            std::this_thread::sleep_for(std::chrono::milliseconds(kReceiveTimeoutMs));
        }
    }

    LOG_DEBUG("Discovery", "Receiver thread stopped");
}

void DiscoveryEngine::handleDatagram(const char* data, size_t length,
                                     const net::SocketAddress& sender) {
    std::string message(data, length);

    if (config_.debug) {
        LOG_INFO("Discovery", "Datagram from {}:\n{}", sender.toString(), message);
    }

    auto device = parseDeviceInfo(message, sender);
    if (!device) {
        return;
    }

    UpsertResult result = registry_.upsert(*device);
    LOG_DEBUG("Discovery", "Device {} {} ({} known)",
              device->id, upsertResultToString(result), registry_.count());

    notifyDeviceAdded(*device);
}

void DiscoveryEngine::notifyDeviceAdded(const DeviceInfo& device) {
    std::vector<std::pair<ListenerId, DeviceAddedCallback>> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners = listeners_;
    }

    for (const auto& entry : listeners) {
        if (!running_.load()) {
            break;
        }
        try {
            entry.second(device);
        } catch (const std::exception& e) {
            LOG_ERROR("Discovery", "deviceAdded listener {} threw: {}", entry.first, e.what());
        }
    }
}

void DiscoveryEngine::releaseSocket() {
    std::lock_guard<std::mutex> lock(socketMutex_);
    if (socket_) {
        socket_->close();
        socket_.reset();
    }
}

}  // namespace core
}  // namespace lightscout
