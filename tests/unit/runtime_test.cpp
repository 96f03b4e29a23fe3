/**
 * runtime_test.cpp - runtime lifecycle and shutdown signalling
 *
 * Tests:
 * 1. Configured devices with a fixed connection type are connected at startup
 * 2. Poll cycle counts failed refreshes
 * 3. Shutdown disconnects devices and writes the recipe cache
 * 4. A bad recipe cache aborts initialization
 * 5. SignalHandler waits and the main loop stopping on a signal
 */

#include "runtime/runtime.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>

#include "mocks/fake_protocol.hpp"
#include "mocks/test_device.hpp"
#include "recipe_cache.pb.h"
#include "runtime/signal_handler.hpp"

namespace fs = std::filesystem;
using namespace kasa;
using namespace kasa::runtime;
using namespace kasa::tests;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Factory handing out TestDevices with a "dimmer" module
 *
 * Keeps each device's FakeProtocol reachable so tests can break refreshes.
 */
class StubFactory : public device::DeviceFactory {
public:
    std::shared_ptr<device::Device> connect(const connection::DeviceConfig& config, Status& status) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (config.host == unreachable_host) {
            status = Status::error(StatusCode::CONNECTION_ERROR, "Connection refused");
            return nullptr;
        }

        auto protocol = std::make_unique<FakeProtocol>(config.host);
        protocol->answer("get_level", {{"level", 30}});
        protocols_[config.host] = protocol.get();

        device::ModuleCatalog catalog;
        add_test_module(catalog, "dimmer", "dimmer", {"get_level"});
        auto created = std::make_shared<TestDevice>(config, std::move(protocol), std::move(catalog),
                                                    std::map<std::string, int>{{"dimmer", 1}},
                                                    nlohmann::json{{"model", "KS225"}});
        status = created->refresh();
        if (!status.ok()) {
            return nullptr;
        }
        devices_.push_back(created);
        return created;
    }

    FakeProtocol* protocol_for(const std::string& host) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = protocols_.find(host);
        return it == protocols_.end() ? nullptr : it->second;
    }

    std::string unreachable_host;

private:
    mutable std::mutex mutex_;
    mutable std::map<std::string, FakeProtocol*> protocols_;
    mutable std::vector<std::shared_ptr<device::Device>> devices_;
};

connection::DeviceConfig fixed_device(const std::string& host) {
    connection::DeviceConfig config;
    config.host = host;
    config.connection_type =
        connection::ConnectionRecipe(connection::DeviceFamily::SMART_TAPOPLUG, connection::TransportKind::KLAP);
    return config;
}

}  // namespace

class RuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "kasa_runtime_test";
        fs::create_directories(temp_dir);
        SignalHandler::reset();

        factory = std::make_shared<StubFactory>();
        config.devices.push_back(fixed_device("10.0.0.1"));
        config.devices.push_back(fixed_device("10.0.0.2"));
        config.polling.interval_ms = 100;
    }

    void TearDown() override {
        SignalHandler::reset();
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    fs::path temp_dir;
    std::shared_ptr<StubFactory> factory;
    RuntimeConfig config;
};

// ============================================================================
// Startup and polling
// ============================================================================

TEST_F(RuntimeTest, ConnectsConfiguredDevices) {
    Runtime runtime(config, factory);
    std::string error;
    ASSERT_TRUE(runtime.initialize(error)) << error;

    EXPECT_EQ(runtime.devices().size(), 2u);
    auto device = runtime.get_device("10.0.0.2");
    ASSERT_NE(device, nullptr);
    EXPECT_EQ(device->model(), "KS225");
    EXPECT_NE(device->get_module("dimmer"), nullptr);
    EXPECT_EQ(runtime.get_device("10.0.0.3"), nullptr);
}

TEST_F(RuntimeTest, UnreachableDeviceIsSkipped) {
    factory->unreachable_host = "10.0.0.1";
    Runtime runtime(config, factory);
    std::string error;
    ASSERT_TRUE(runtime.initialize(error)) << error;

    EXPECT_EQ(runtime.devices().size(), 1u);
    EXPECT_EQ(runtime.get_device("10.0.0.1"), nullptr);
}

TEST_F(RuntimeTest, PollCountsFailedRefreshes) {
    Runtime runtime(config, factory);
    std::string error;
    ASSERT_TRUE(runtime.initialize(error)) << error;
    EXPECT_EQ(runtime.poll_once(), 0u);

    FakeProtocol* protocol = factory->protocol_for("10.0.0.1");
    ASSERT_NE(protocol, nullptr);
    protocol->fail_with(Status::error(StatusCode::CONNECTION_ERROR, "Host unreachable"));

    EXPECT_EQ(runtime.poll_once(), 1u);
}

TEST_F(RuntimeTest, NoEventsWithoutDiscovery) {
    Runtime runtime(config, factory);
    std::string error;
    ASSERT_TRUE(runtime.initialize(error)) << error;
    EXPECT_EQ(runtime.drain_events(), 0u);
}

// ============================================================================
// Shutdown and recipe cache
// ============================================================================

TEST_F(RuntimeTest, ShutdownDisconnectsAndSavesCache) {
    config.cache.path = (temp_dir / "recipes.bin").string();
    Runtime runtime(config, factory);
    std::string error;
    ASSERT_TRUE(runtime.initialize(error)) << error;

    auto device = runtime.get_device("10.0.0.1");
    ASSERT_NE(device, nullptr);
    runtime.shutdown();

    EXPECT_TRUE(runtime.devices().empty());
    FakeProtocol* protocol = factory->protocol_for("10.0.0.1");
    ASSERT_NE(protocol, nullptr);
    EXPECT_TRUE(protocol->closed());
    EXPECT_TRUE(fs::exists(config.cache.path));

    // Second shutdown (destructor) is a no-op
    runtime.shutdown();
}

TEST_F(RuntimeTest, UnreadableCacheFailsInitialization) {
    config.cache.path = (temp_dir / "recipes.bin").string();
    kasa::cache::v1::RecipeCacheFile file;
    file.set_version(99);
    std::ofstream out(config.cache.path, std::ios::binary);
    ASSERT_TRUE(file.SerializeToOstream(&out));
    out.close();

    Runtime runtime(config, factory);
    std::string error;
    EXPECT_FALSE(runtime.initialize(error));
    EXPECT_NE(error.find("Recipe cache load failed"), std::string::npos);
}

// ============================================================================
// Signals
// ============================================================================

TEST_F(RuntimeTest, WaitRunsFullTimeoutWithoutSignal) {
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(SignalHandler::wait_for(60));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
    EXPECT_EQ(SignalHandler::last_signal(), 0);
}

TEST_F(RuntimeTest, WaitEndsEarlyOnShutdownRequest) {
    SignalHandler::request_shutdown(SIGTERM);
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(SignalHandler::wait_for(5000));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
    EXPECT_TRUE(SignalHandler::is_shutdown_requested());
    EXPECT_EQ(SignalHandler::last_signal(), SIGTERM);
}

TEST_F(RuntimeTest, MainLoopStopsOnSignal) {
    Runtime runtime(config, factory);
    std::string error;
    ASSERT_TRUE(runtime.initialize(error)) << error;

    std::thread signaller([]() {
        std::this_thread::sleep_for(250ms);
        SignalHandler::request_shutdown(SIGINT);
    });
    runtime.run();
    signaller.join();

    // At least the first cycle plus one more at the 100ms interval
    FakeProtocol* protocol = factory->protocol_for("10.0.0.1");
    ASSERT_NE(protocol, nullptr);
    EXPECT_GE(protocol->requests().size(), 3u);
}
