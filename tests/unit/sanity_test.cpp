#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

// Test critical dependencies and infrastructure
#include <atomic>
#include <nlohmann/json.hpp>
#include <thread>

#include "recipe_cache.pb.h"

/**
 * @brief Infrastructure tests verify build system, dependencies, and basic features work.
 * These are not feature tests - they validate the foundation the codebase depends on.
 */

TEST(InfrastructureTest, ProtobufSerializationWorks) {
    // The recipe cache is persisted as a RecipeCacheFile message
    kasa::cache::v1::RecipeCacheFile file;
    file.set_version(1);
    auto* entry = file.add_entries();
    entry->set_host("192.168.1.20");
    entry->set_device_family("SMART.TAPOPLUG");
    entry->set_encryption_type("KLAP");
    entry->set_login_version(2);

    std::string serialized;
    ASSERT_TRUE(file.SerializeToString(&serialized));
    EXPECT_FALSE(serialized.empty());

    kasa::cache::v1::RecipeCacheFile deserialized;
    ASSERT_TRUE(deserialized.ParseFromString(serialized));
    ASSERT_EQ(deserialized.entries_size(), 1);
    EXPECT_EQ(deserialized.entries(0).host(), "192.168.1.20");
    EXPECT_TRUE(deserialized.entries(0).has_login_version());
    EXPECT_FALSE(deserialized.entries(0).has_http_port());
}

TEST(InfrastructureTest, JsonParsingWorks) {
    // Wire payloads of every protocol are JSON documents
    const char* json_str = R"({"system":{"get_sysinfo":{"relay_state":1,"alias":"Lamp"}}})";

    auto parsed = nlohmann::json::parse(json_str);
    EXPECT_EQ(parsed["system"]["get_sysinfo"]["relay_state"], 1);
    EXPECT_EQ(parsed["system"]["get_sysinfo"]["alias"], "Lamp");

    nlohmann::json created = {{"method", "get_device_info"}, {"request_time_milis", 1700000000000LL}};
    EXPECT_EQ(created["method"], "get_device_info");
    EXPECT_TRUE(created.contains("request_time_milis"));
}

TEST(InfrastructureTest, YamlParsingWorks) {
    YAML::Node node = YAML::Load("discovery:\n  enabled: true\n  timeout_ms: 3000\n");
    EXPECT_TRUE(node["discovery"]["enabled"].as<bool>());
    EXPECT_EQ(node["discovery"]["timeout_ms"].as<int>(), 3000);
}

TEST(InfrastructureTest, ThreadingAndAtomicsWork) {
    // Discovery classifies replies on worker threads
    std::atomic<int> counter{0};
    std::atomic<bool> flag{false};

    std::thread t1([&counter]() {
        for (int i = 0; i < 1000; ++i) {
            counter.fetch_add(1, std::memory_order_relaxed);
        }
    });

    std::thread t2([&counter, &flag]() {
        for (int i = 0; i < 1000; ++i) {
            counter.fetch_add(1, std::memory_order_relaxed);
        }
        flag.store(true, std::memory_order_release);
    });

    t1.join();
    t2.join();

    EXPECT_EQ(counter.load(), 2000);
    EXPECT_TRUE(flag.load(std::memory_order_acquire));
}
