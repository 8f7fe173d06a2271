/**
 * @file test_discovery_engine.cpp
 * @brief Unit tests for the discovery engine over the loopback interface
 *
 * The engine binds 127.0.0.1 and probes 127.0.0.1, so it receives its own
 * probe (which the parser ignores) and any replies the test sends to it.
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <lightscout/core/discovery_engine.hpp>
#include <lightscout/utils/logger.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace lightscout::core;
using lightscout::net::SocketAddress;
using lightscout::net::UdpSocket;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

uint16_t findFreePort() {
    UdpSocket probe;
    if (!probe.bind(0, "127.0.0.1")) {
        return 0;
    }
    return probe.getLocalPort();
}

std::string makeReply(const std::string& id, const std::string& model = "color") {
    return "HTTP/1.1 200 OK\r\n"
           "Cache-Control: max-age=3600\r\n"
           "Location: yeelight://127.0.0.1:55443\r\n"
           "id: " + id + "\r\n"
           "model: " + model + "\r\n"
           "fw_ver: 18\r\n"
           "support: get_prop set_power toggle\r\n"
           "power: on\r\n";
}

void sendTo(uint16_t port, const std::string& payload) {
    UdpSocket sender;
    sender.sendTo(SocketAddress("127.0.0.1", port), payload.data(), payload.size());
}

bool waitForState(const DiscoveryEngine& engine, RunState expected,
                  std::chrono::milliseconds limit = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (engine.state() == expected) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return engine.state() == expected;
}

std::vector<std::string> ids(const std::vector<DeviceInfo>& devices) {
    std::vector<std::string> result;
    for (const auto& device : devices) {
        result.push_back(device.id);
    }
    return result;
}

}  // namespace

class DiscoveryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        lightscout::utils::Logger::instance().setLevel(lightscout::utils::LogLevel::OFF);
        port_ = findFreePort();
        ASSERT_NE(port_, 0);
    }

    void TearDown() override {
        lightscout::utils::Logger::instance().resetSink();
        lightscout::utils::Logger::instance().setLevel(lightscout::utils::LogLevel::INFO);
    }

    DiscoveryConfig loopbackConfig(size_t limit, int64_t timeout_ms) const {
        DiscoveryConfig config;
        config.bind_host = "127.0.0.1";
        config.bind_port = port_;
        config.multicast_host = "127.0.0.1";
        config.reply_limit = limit;
        config.timeout_ms = timeout_ms;
        config.debug = false;
        config.poll_interval_ms = 20;
        return config;
    }

    uint16_t port_ = 0;
};

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(DiscoveryEngineTest, DefaultConfiguration) {
    DiscoveryConfig config;
    EXPECT_EQ(config.bind_host, "");
    EXPECT_EQ(config.bind_port, 1982);
    EXPECT_EQ(config.multicast_host, "239.255.255.250");
    EXPECT_EQ(config.reply_limit, 1u);
    EXPECT_EQ(config.timeout_ms, 10000);
    EXPECT_TRUE(config.debug);

    DiscoveryEngine engine;
    EXPECT_EQ(engine.state(), RunState::IDLE);
    EXPECT_EQ(engine.getLocalPort(), 0);
    EXPECT_TRUE(engine.devices().empty());
}

TEST_F(DiscoveryEngineTest, DestroyBeforeStart) {
    DiscoveryEngine engine(loopbackConfig(1, 500));

    engine.destroy();
    engine.destroy();
    EXPECT_EQ(engine.state(), RunState::DESTROYED);

    DiscoveryResult result = engine.start();
    EXPECT_EQ(result.status, DiscoveryStatus::ALREADY_DESTROYED);
    EXPECT_FALSE(result.isTransportError());
    EXPECT_EQ(engine.getLocalPort(), 0);
}

TEST_F(DiscoveryEngineTest, SecondStartIsRejectedWithoutDisturbingTheFirst) {
    DiscoveryEngine engine(loopbackConfig(1, 3000));

    auto pending = engine.startAsync();
    ASSERT_TRUE(waitForState(engine, RunState::POLLING));

    DiscoveryResult second = engine.start();
    EXPECT_EQ(second.status, DiscoveryStatus::ALREADY_STARTED);

    sendTo(port_, makeReply("abc"));

    DiscoveryResult first = pending.get();
    ASSERT_TRUE(first.ok());
    EXPECT_THAT(ids(first.devices), ElementsAre("abc"));
}

TEST_F(DiscoveryEngineTest, StartAfterCompletionIsRejected) {
    DiscoveryEngine engine(loopbackConfig(1, 100));

    EXPECT_EQ(engine.start().status, DiscoveryStatus::NO_DEVICE_FOUND);
    EXPECT_EQ(engine.start().status, DiscoveryStatus::ALREADY_STARTED);
}

TEST_F(DiscoveryEngineTest, InvalidConfigIsRejectedBeforeBinding) {
    DiscoveryConfig config = loopbackConfig(0, 500);
    DiscoveryEngine engine(config);

    DiscoveryResult result = engine.start();
    EXPECT_EQ(result.status, DiscoveryStatus::INVALID_CONFIG);
    EXPECT_EQ(engine.state(), RunState::FAILED);
    EXPECT_EQ(engine.getLocalPort(), 0);

    config = loopbackConfig(1, -1);
    DiscoveryEngine negative(config);
    EXPECT_EQ(negative.start().status, DiscoveryStatus::INVALID_CONFIG);
}

// =============================================================================
// Completion
// =============================================================================

TEST_F(DiscoveryEngineTest, ResolvesOnFirstReplyWithLimitOne) {
    DiscoveryEngine engine(loopbackConfig(1, 1000));

    auto pending = engine.startAsync();
    ASSERT_TRUE(waitForState(engine, RunState::POLLING));
    sendTo(port_, makeReply("abc"));

    DiscoveryResult result = pending.get();
    ASSERT_TRUE(result.ok());
    EXPECT_THAT(ids(result.devices), ElementsAre("abc"));
    EXPECT_LT(result.elapsed.count(), 1000);
    EXPECT_EQ(engine.state(), RunState::SUCCEEDED);
    EXPECT_EQ(result.devices[0].model, "color");
    EXPECT_EQ(result.devices[0].port, 55443);
}

TEST_F(DiscoveryEngineTest, ReturnsDevicesInFirstSeenOrder) {
    DiscoveryEngine engine(loopbackConfig(3, 5000));

    auto pending = engine.startAsync();
    ASSERT_TRUE(waitForState(engine, RunState::POLLING));

    UdpSocket bulbs;
    for (const char* id : {"c", "a", "b"}) {
        std::string reply = makeReply(id);
        bulbs.sendTo(SocketAddress("127.0.0.1", port_), reply.data(), reply.size());
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    DiscoveryResult result = pending.get();
    ASSERT_TRUE(result.ok());
    EXPECT_THAT(ids(result.devices), ElementsAre("c", "a", "b"));
}

TEST_F(DiscoveryEngineTest, TimeoutWithSomeDevicesSucceeds) {
    DiscoveryEngine engine(loopbackConfig(2, 500));

    auto pending = engine.startAsync();
    ASSERT_TRUE(waitForState(engine, RunState::POLLING));
    sendTo(port_, makeReply("a"));

    DiscoveryResult result = pending.get();
    ASSERT_TRUE(result.ok());
    EXPECT_THAT(ids(result.devices), ElementsAre("a"));
    EXPECT_GE(result.elapsed.count(), 500);
}

TEST_F(DiscoveryEngineTest, TimeoutWithoutDevicesIsNoDeviceFound) {
    DiscoveryEngine engine(loopbackConfig(1, 300));

    DiscoveryResult result = engine.start();
    EXPECT_EQ(result.status, DiscoveryStatus::NO_DEVICE_FOUND);
    EXPECT_FALSE(result.isTransportError());
    EXPECT_GE(result.elapsed.count(), 300);
    EXPECT_THAT(result.message, HasSubstr("no device found"));
    EXPECT_TRUE(result.devices.empty());
    EXPECT_EQ(engine.state(), RunState::FAILED);
}

TEST_F(DiscoveryEngineTest, ZeroTimeoutWaitsUntilDestroyed) {
    DiscoveryEngine engine(loopbackConfig(1, 0));

    auto pending = engine.startAsync();
    ASSERT_TRUE(waitForState(engine, RunState::POLLING));

    EXPECT_EQ(pending.wait_for(std::chrono::milliseconds(600)), std::future_status::timeout);

    engine.destroy();

    DiscoveryResult result = pending.get();
    EXPECT_EQ(result.status, DiscoveryStatus::DESTROYED);
    EXPECT_EQ(engine.state(), RunState::DESTROYED);
    EXPECT_EQ(engine.getLocalPort(), 0);
}

TEST_F(DiscoveryEngineTest, IgnoresMalformedDatagrams) {
    DiscoveryEngine engine(loopbackConfig(1, 3000));

    auto pending = engine.startAsync();
    ASSERT_TRUE(waitForState(engine, RunState::POLLING));

    sendTo(port_, "garbage");
    sendTo(port_, "HTTP/1.1 200 OK\r\nLocation: yeelight://127.0.0.1:55443\r\n");
    sendTo(port_, "HTTP/1.1 200 OK\r\nid: no-location\r\n");
    sendTo(port_, makeReply("good"));

    DiscoveryResult result = pending.get();
    ASSERT_TRUE(result.ok());
    EXPECT_THAT(ids(result.devices), ElementsAre("good"));
}

// =============================================================================
// Transport errors
// =============================================================================

TEST_F(DiscoveryEngineTest, BindErrorWhenPortIsTaken) {
    UdpSocket blocker;
    ASSERT_TRUE(blocker.bind(port_, "127.0.0.1"));

    DiscoveryEngine engine(loopbackConfig(1, 500));
    DiscoveryResult result = engine.start();

    EXPECT_EQ(result.status, DiscoveryStatus::BIND_ERROR);
    EXPECT_TRUE(result.isTransportError());
    EXPECT_NE(result.errorCode, 0);
    EXPECT_EQ(engine.state(), RunState::FAILED);
    EXPECT_EQ(engine.getLocalPort(), 0);
}

TEST_F(DiscoveryEngineTest, SendErrorReleasesEndpoint) {
    DiscoveryConfig config = loopbackConfig(1, 500);
    config.multicast_host = "not-an-address";
    DiscoveryEngine engine(config);

    DiscoveryResult result = engine.start();
    EXPECT_EQ(result.status, DiscoveryStatus::SEND_ERROR);
    EXPECT_TRUE(result.isTransportError());
    EXPECT_EQ(engine.state(), RunState::FAILED);
    EXPECT_EQ(engine.getLocalPort(), 0);

    UdpSocket rebind;
    EXPECT_TRUE(rebind.bind(port_, "127.0.0.1"));
}

// =============================================================================
// Listeners
// =============================================================================

TEST_F(DiscoveryEngineTest, DeviceAddedFiresForEveryValidReply) {
    DiscoveryEngine engine(loopbackConfig(2, 600));

    std::mutex mutex;
    std::vector<std::string> models;
    engine.onDeviceAdded([&](const DeviceInfo& device) {
        std::lock_guard<std::mutex> lock(mutex);
        models.push_back(device.model);
    });

    auto pending = engine.startAsync();
    ASSERT_TRUE(waitForState(engine, RunState::POLLING));

    UdpSocket bulb;
    std::string first = makeReply("a", "color");
    std::string second = makeReply("a", "mono");
    bulb.sendTo(SocketAddress("127.0.0.1", port_), first.data(), first.size());
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    bulb.sendTo(SocketAddress("127.0.0.1", port_), second.data(), second.size());

    DiscoveryResult result = pending.get();
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.devices.size(), 1u);
    EXPECT_EQ(result.devices[0].model, "mono");

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_THAT(models, ElementsAre("color", "mono"));
}

TEST_F(DiscoveryEngineTest, RemovedListenerIsNotCalled) {
    DiscoveryEngine engine(loopbackConfig(1, 2000));

    std::atomic<int> kept{0};
    std::atomic<int> removed{0};
    engine.onDeviceAdded([&](const DeviceInfo&) { ++kept; });
    ListenerId id = engine.onDeviceAdded([&](const DeviceInfo&) { ++removed; });

    EXPECT_EQ(engine.listenerCount(), 2u);
    EXPECT_TRUE(engine.removeListener(id));
    EXPECT_FALSE(engine.removeListener(id));
    EXPECT_EQ(engine.listenerCount(), 1u);

    auto pending = engine.startAsync();
    ASSERT_TRUE(waitForState(engine, RunState::POLLING));
    sendTo(port_, makeReply("abc"));

    ASSERT_TRUE(pending.get().ok());
    EXPECT_EQ(kept.load(), 1);
    EXPECT_EQ(removed.load(), 0);
}

TEST_F(DiscoveryEngineTest, ThrowingListenerDoesNotStopOthers) {
    DiscoveryEngine engine(loopbackConfig(1, 2000));

    std::atomic<int> calls{0};
    engine.onDeviceAdded([](const DeviceInfo&) { throw std::runtime_error("boom"); });
    engine.onDeviceAdded([&](const DeviceInfo&) { ++calls; });

    auto pending = engine.startAsync();
    ASSERT_TRUE(waitForState(engine, RunState::POLLING));
    sendTo(port_, makeReply("abc"));

    ASSERT_TRUE(pending.get().ok());
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(DiscoveryEngineTest, KeepsListeningAfterCompletionUntilDestroyed) {
    DiscoveryEngine engine(loopbackConfig(1, 2000));

    std::atomic<int> calls{0};
    engine.onDeviceAdded([&](const DeviceInfo&) { ++calls; });

    auto pending = engine.startAsync();
    ASSERT_TRUE(waitForState(engine, RunState::POLLING));
    sendTo(port_, makeReply("a"));
    ASSERT_TRUE(pending.get().ok());

    sendTo(port_, makeReply("late"));
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(2000);
    while (calls.load() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(engine.devices().size(), 2u);

    engine.destroy();
    EXPECT_EQ(engine.listenerCount(), 0u);
    EXPECT_EQ(engine.getLocalPort(), 0);

    sendTo(port_, makeReply("after-destroy"));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(calls.load(), 2);

    UdpSocket rebind;
    EXPECT_TRUE(rebind.bind(port_, "127.0.0.1"));
}

TEST_F(DiscoveryEngineTest, DestroyFromListenerCancelsPendingStart) {
    DiscoveryEngine engine(loopbackConfig(5, 0));

    engine.onDeviceAdded([&engine](const DeviceInfo&) { engine.destroy(); });

    auto pending = engine.startAsync();
    ASSERT_TRUE(waitForState(engine, RunState::POLLING));
    sendTo(port_, makeReply("abc"));

    ASSERT_EQ(pending.wait_for(std::chrono::milliseconds(3000)), std::future_status::ready);
    EXPECT_EQ(pending.get().status, DiscoveryStatus::DESTROYED);
    EXPECT_EQ(engine.state(), RunState::DESTROYED);
}

TEST_F(DiscoveryEngineTest, DeletingEngineCancelsPendingStart) {
    for (int round = 0; round < 5; ++round) {
        auto engine = std::make_unique<DiscoveryEngine>(loopbackConfig(5, 0));

        auto pending = engine->startAsync();
        ASSERT_TRUE(waitForState(*engine, RunState::POLLING));

        engine.reset();

        ASSERT_EQ(pending.wait_for(std::chrono::milliseconds(3000)), std::future_status::ready);
        EXPECT_EQ(pending.get().status, DiscoveryStatus::DESTROYED);

        UdpSocket rebind;
        EXPECT_TRUE(rebind.bind(port_, "127.0.0.1"));
    }
}

TEST_F(DiscoveryEngineTest, DeletingEngineRightAfterStartAsync) {
    auto engine = std::make_unique<DiscoveryEngine>(loopbackConfig(5, 0));

    auto pending = engine->startAsync();
    engine.reset();

    ASSERT_EQ(pending.wait_for(std::chrono::milliseconds(3000)), std::future_status::ready);
    DiscoveryResult result = pending.get();
    EXPECT_TRUE(result.status == DiscoveryStatus::DESTROYED ||
                result.status == DiscoveryStatus::ALREADY_DESTROYED)
        << discoveryStatusToString(result.status);
}

// =============================================================================
// Debug logging
// =============================================================================

TEST_F(DiscoveryEngineTest, DebugModeLogsRawDatagrams) {
    std::mutex mutex;
    std::vector<std::string> lines;
    lightscout::utils::Logger::instance().setLevel(lightscout::utils::LogLevel::INFO);
    lightscout::utils::Logger::instance().setSink(
        [&](lightscout::utils::LogLevel, const std::string&, const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex);
            lines.push_back(line);
        });

    DiscoveryConfig config = loopbackConfig(1, 2000);
    config.debug = true;
    DiscoveryEngine engine(config);

    auto pending = engine.startAsync();
    ASSERT_TRUE(waitForState(engine, RunState::POLLING));
    sendTo(port_, makeReply("abc"));
    ASSERT_TRUE(pending.get().ok());
    engine.destroy();
    lightscout::utils::Logger::instance().resetSink();

    std::lock_guard<std::mutex> lock(mutex);
    bool sawReply = false;
    for (const auto& line : lines) {
        if (line.find("Datagram from") != std::string::npos &&
            line.find("id: abc") != std::string::npos) {
            sawReply = true;
        }
    }
    EXPECT_TRUE(sawReply);
}
