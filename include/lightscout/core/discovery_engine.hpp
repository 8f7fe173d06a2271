/**
 * @file discovery_engine.hpp
 * @brief One-shot UDP discovery of smart bulbs on the local network.
 *
 * The DiscoveryEngine handles:
 * - Binding an exclusive UDP endpoint
 * - Broadcasting the search probe once
 * - Receiving replies and registering the bulbs they describe
 * - Deciding completion (reply limit, timeout, no device found)
 *
 * @copyright Copyright (c) 2024 LightScout Contributors
 * @license MIT License
 */

#pragma once

#include "lightscout/core/device_registry.hpp"
#include "lightscout/core/discovery_result.hpp"
#include "lightscout/core/export.hpp"
#include "lightscout/net/udp_socket.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace lightscout {
namespace core {

/**
 * @struct DiscoveryConfig
 * @brief Configuration for one discovery run.
 */
struct LIGHTSCOUT_CORE_API DiscoveryConfig {
    std::string bind_host;          ///< Local address to bind (empty = any)
    uint16_t bind_port;             ///< Local port, also the probe destination port
    std::string multicast_host;     ///< Probe destination address
    size_t reply_limit;             ///< Distinct devices needed to finish early (>= 1)
    int64_t timeout_ms;             ///< Run timeout, 0 = never time out
    bool debug;                     ///< Log every received datagram
    int poll_interval_ms;           ///< Completion policy tick

    DiscoveryConfig()
        : bind_port(1982)
        , multicast_host("239.255.255.250")
        , reply_limit(1)
        , timeout_ms(10000)
        , debug(true)
        , poll_interval_ms(200)
    {}
};

/**
 * @enum RunState
 * @brief Lifecycle of a DiscoveryEngine.
 *
 * IDLE -> BOUND -> SENDING -> POLLING -> SUCCEEDED | FAILED.
 * DESTROYED is reachable from every state and is terminal.
 */
enum class RunState {
    IDLE,
    BOUND,
    SENDING,
    POLLING,
    SUCCEEDED,
    FAILED,
    DESTROYED
};

inline const char* runStateToString(RunState state) {
    switch (state) {
        case RunState::IDLE: return "idle";
        case RunState::BOUND: return "bound";
        case RunState::SENDING: return "sending";
        case RunState::POLLING: return "polling";
        case RunState::SUCCEEDED: return "succeeded";
        case RunState::FAILED: return "failed";
        case RunState::DESTROYED: return "destroyed";
        default: return "unknown";
    }
}

/**
 * @brief Callback fired for every registered reply, including updates
 * of an already known device. Runs on the receiver thread.
 */
using DeviceAddedCallback = std::function<void(const DeviceInfo& device)>;

using ListenerId = uint64_t;

/**
 * @class DiscoveryEngine
 * @brief Sends one probe and aggregates bulb replies until done.
 *
 * start() blocks the caller while a receiver thread handles datagrams.
 * An engine runs at most once; create a new engine to search again.
 * After the run completes the endpoint keeps listening, so late replies
 * still update devices() and fire deviceAdded, until destroy().
 *
 * Usage:
 * @code
 * DiscoveryConfig config;
 * config.reply_limit = 3;
 * config.timeout_ms = 5000;
 *
 * DiscoveryEngine engine(config);
 * engine.onDeviceAdded([](const DeviceInfo& d) {
 *     LOG_INFO("App", "Found {} at {}", d.id, d.endpoint());
 * });
 *
 * DiscoveryResult result = engine.start();
 * engine.destroy();
 * @endcode
 */
class LIGHTSCOUT_CORE_API DiscoveryEngine {
public:
    using Clock = std::chrono::steady_clock;

    explicit DiscoveryEngine(const DiscoveryConfig& config = DiscoveryConfig());

    /**
     * @brief Destructor - destroys the engine if still alive.
     */
    ~DiscoveryEngine();

    // Non-copyable
    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    /**
     * @brief Subscribe to deviceAdded notifications.
     * @return Id to pass to removeListener().
     */
    ListenerId onDeviceAdded(DeviceAddedCallback callback);

    /**
     * @brief Unsubscribe one listener.
     * @return True if the listener was registered.
     */
    bool removeListener(ListenerId id);

    size_t listenerCount() const;

    /**
     * @brief Run discovery and wait for the outcome.
     *
     * Binds, sends the probe and polls the completion policy every
     * poll_interval_ms. Fails with ALREADY_STARTED on a second call and
     * with ALREADY_DESTROYED after destroy(). A destroy() while this call
     * is pending makes it return DESTROYED.
     */
    DiscoveryResult start();

    /**
     * @brief Run start() on a separate thread.
     */
    std::future<DiscoveryResult> startAsync();

    /**
     * @brief Release the endpoint and drop all listeners.
     *
     * Idempotent. When called from outside a deviceAdded callback no
     * further callbacks fire once it returns. From inside a callback the
     * endpoint is released when the engine is destroyed.
     */
    void destroy();

    RunState state() const;

    /**
     * @brief Snapshot of the devices registered so far.
     */
    std::vector<DeviceInfo> devices() const { return registry_.snapshot(); }

    /**
     * @brief Local port of the endpoint (0 when not bound).
     */
    uint16_t getLocalPort() const;

    const DiscoveryConfig& config() const { return config_; }

private:
    DiscoveryConfig config_;
    DeviceRegistry registry_;

    std::unique_ptr<net::UdpSocket> socket_;
    mutable std::mutex socketMutex_;

    // Serialises endpoint setup in start() against teardown in destroy()
    std::mutex lifecycleMutex_;

    mutable std::mutex stateMutex_;
    std::condition_variable stateCv_;
    RunState state_;
    bool started_;
    int activeStarts_;  ///< start() calls still running; the destructor waits for 0

    std::atomic<bool> running_{false};
    std::thread receiverThread_;

    mutable std::mutex listenerMutex_;
    std::vector<std::pair<ListenerId, DeviceAddedCallback>> listeners_;
    ListenerId nextListenerId_;

    // Lowers activeStarts_ when a start() call unwinds, on every path
    class ActiveStart {
    public:
        explicit ActiveStart(DiscoveryEngine& engine) : engine_(engine) {}
        ~ActiveStart() { engine_.endStart(); }

        ActiveStart(const ActiveStart&) = delete;
        ActiveStart& operator=(const ActiveStart&) = delete;

    private:
        DiscoveryEngine& engine_;
    };

    void beginStart();
    void endStart();

    DiscoveryResult runStart();

    bool validateConfig(std::string& reason) const;

    // Move to `next` unless the engine was destroyed meanwhile
    void setState(RunState next);

    DiscoveryResult fail(DiscoveryStatus status, const std::string& message,
                         int errorCode = 0);

    DiscoveryResult pollUntilComplete(Clock::time_point sentAt);

    void receiverLoop();

    void handleDatagram(const char* data, size_t length,
                        const net::SocketAddress& sender);

    void notifyDeviceAdded(const DeviceInfo& device);

    void releaseSocket();
};

}  // namespace core
}  // namespace lightscout
