/**
 * discovery_test.cpp - Discovery tests
 *
 * Tests:
 * 1. ConcurrencyLimiter bound and deadlines
 * 2. Probe payloads and reply decoding (legacy XOR and 20002 replies)
 * 3. Recipe selection from discovery replies
 * 4. Single-host discovery over a scripted datagram channel
 * 5. Broadcast classification, concurrency bound and late hosts
 */

#include "discovery/discoverer.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "discovery/concurrency_limiter.hpp"
#include "discovery/discovery_result.hpp"
#include "mocks/fake_protocol.hpp"
#include "mocks/test_device.hpp"
#include "transport/xor_transport.hpp"

using namespace kasa;
using namespace kasa::discovery;
using namespace kasa::tests;
using namespace std::chrono_literals;

namespace {

std::vector<uint8_t> legacy_reply(const nlohmann::json& sysinfo) {
    nlohmann::json reply = {{"system", {{"get_sysinfo", sysinfo}}}};
    return transport::XorCipher::encrypt_unframed(reply.dump());
}

std::vector<uint8_t> tdp_reply(const nlohmann::json& result) {
    std::vector<uint8_t> payload(kDiscoveryHeaderSize, 0);
    payload[0] = 2;
    std::string body = nlohmann::json{{"error_code", 0}, {"result", result}}.dump();
    payload.insert(payload.end(), body.begin(), body.end());
    return payload;
}

nlohmann::json plug_sysinfo() {
    return {{"alias", "Kettle"},
            {"model", "HS110(EU)"},
            {"type", "IOT.SMARTPLUGSWITCH"},
            {"deviceId", "8006ABCD"},
            {"mac", "50:C7:BF:00:11:22"},
            {"sw_ver", "1.5.4"},
            {"hw_ver", "4.0"}};
}

nlohmann::json tapo_result(const std::string& encrypt_type) {
    nlohmann::json result = {{"device_type", "SMART.TAPOPLUG"},
                             {"device_model", "P110(EU)"},
                             {"device_id", "80221A"},
                             {"mac", "3C-52-A1-00-11-22"},
                             {"firmware_version", "1.3.0"},
                             {"hardware_version", "1.0"}};
    if (!encrypt_type.empty()) {
        result["mgt_encrypt_schm"] = {
            {"is_support_https", false}, {"encrypt_type", encrypt_type}, {"http_port", 80}, {"lv", 2}};
    }
    return result;
}

Datagram datagram(const std::string& host, int port, std::vector<uint8_t> payload) {
    Datagram d;
    d.host = host;
    d.port = port;
    d.payload = std::move(payload);
    return d;
}

// Shared between a test and the channels the discoverer creates
struct ChannelScript {
    std::mutex mutex;
    std::deque<Datagram> replies;  // delivered reply_delay after the first probe went out
    std::chrono::milliseconds reply_delay{0};
    std::chrono::steady_clock::time_point first_send;
    std::vector<std::pair<std::string, int>> sends;
    bool fail_open = false;
    int opens = 0;
    int closes = 0;

    void add_reply(Datagram reply) {
        std::lock_guard<std::mutex> lock(mutex);
        replies.push_back(std::move(reply));
    }
};

class ScriptedChannel : public IDatagramChannel {
public:
    explicit ScriptedChannel(std::shared_ptr<ChannelScript> script) : script_(std::move(script)) {}

    bool open(Status& status) override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        ++script_->opens;
        if (script_->fail_open) {
            status = Status::error(StatusCode::CONNECTION_ERROR, "Address already in use");
            return false;
        }
        return true;
    }

    bool send_to(const std::string& host, int port, const std::vector<uint8_t>& payload, Status& status) override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        if (script_->sends.empty()) {
            script_->first_send = std::chrono::steady_clock::now();
        }
        script_->sends.emplace_back(host, port);
        return true;
    }

    std::optional<Datagram> receive(int timeout_ms, Status& status) override {
        {
            std::lock_guard<std::mutex> lock(script_->mutex);
            if (!script_->sends.empty() && !script_->replies.empty() &&
                std::chrono::steady_clock::now() >= script_->first_send + script_->reply_delay) {
                Datagram next = std::move(script_->replies.front());
                script_->replies.pop_front();
                status = Status::success();
                return next;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(timeout_ms, 10)));
        status = Status::error(StatusCode::TIMEOUT, "No datagram");
        return std::nullopt;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        ++script_->closes;
    }

private:
    std::shared_ptr<ChannelScript> script_;
};

DatagramChannelFactory channels_for(const std::shared_ptr<ChannelScript>& script) {
    return [script](const std::string&) { return std::make_unique<ScriptedChannel>(script); };
}

// Connects every host after a delay, recording how many connect at once
class SlowFactory : public device::DeviceFactory {
public:
    std::shared_ptr<device::Device> connect(const connection::DeviceConfig& config, Status& status) const override {
        int now = ++in_flight_;
        int peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
        }
        std::this_thread::sleep_for(delay);
        --in_flight_;

        std::lock_guard<std::mutex> lock(mutex_);
        connected_.push_back(config);
        if (config.host == reject_host) {
            status = Status::error(StatusCode::AUTHENTICATION_ERROR, "Rejected credentials");
            return nullptr;
        }
        status = Status::success();
        auto created = std::make_shared<TestDevice>(config, std::make_unique<FakeProtocol>(config.host),
                                                    device::ModuleCatalog{});
        devices_.push_back(created);
        return created;
    }

    int peak() const { return peak_.load(); }
    int in_flight() const { return in_flight_.load(); }

    std::vector<connection::DeviceConfig> connected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    std::vector<std::shared_ptr<device::Device>> devices() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return devices_;
    }

    std::chrono::milliseconds delay{0};
    std::string reject_host;

private:
    mutable std::atomic<int> in_flight_{0};
    mutable std::atomic<int> peak_{0};
    mutable std::mutex mutex_;
    mutable std::vector<connection::DeviceConfig> connected_;
    mutable std::vector<std::shared_ptr<device::Device>> devices_;
};

std::vector<events::Event> drain(events::Subscription& subscription) {
    std::vector<events::Event> drained;
    while (auto event = subscription.try_pop()) {
        drained.push_back(std::move(*event));
    }
    return drained;
}

}  // namespace

// ============================================================================
// ConcurrencyLimiter
// ============================================================================

TEST(ConcurrencyLimiterTest, NeverExceedsLimit) {
    ConcurrencyLimiter limiter(3);

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&limiter]() {
            auto permit = limiter.acquire();
            EXPECT_LE(limiter.in_flight(), 3u);
            std::this_thread::sleep_for(10ms);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_LE(limiter.peak(), 3u);
    EXPECT_GE(limiter.peak(), 1u);
    EXPECT_EQ(limiter.in_flight(), 0u);
}

TEST(ConcurrencyLimiterTest, ZeroLimitAdmitsOne) {
    ConcurrencyLimiter limiter(0);
    EXPECT_EQ(limiter.limit(), 1u);
}

TEST(ConcurrencyLimiterTest, AcquireUntilGivesUpAtDeadline) {
    ConcurrencyLimiter limiter(1);
    auto held = limiter.acquire();

    auto start = ConcurrencyLimiter::Clock::now();
    auto permit = limiter.acquire_until(start + 30ms);

    EXPECT_FALSE(permit.has_value());
    EXPECT_GE(ConcurrencyLimiter::Clock::now() - start, 30ms);
}

TEST(ConcurrencyLimiterTest, MovedPermitReleasesOnce) {
    ConcurrencyLimiter limiter(2);
    {
        auto first = limiter.acquire();
        ConcurrencyLimiter::Permit moved(std::move(first));
        EXPECT_FALSE(first.valid());
        EXPECT_TRUE(moved.valid());
        EXPECT_EQ(limiter.in_flight(), 1u);
    }
    EXPECT_EQ(limiter.in_flight(), 0u);

    auto permit = limiter.acquire_until(ConcurrencyLimiter::Clock::now() + 10ms);
    ASSERT_TRUE(permit.has_value());
    permit->release();
    EXPECT_EQ(limiter.in_flight(), 0u);
}

// ============================================================================
// Probes and reply decoding
// ============================================================================

TEST(DiscoveryProbeTest, LegacyProbeIsXorSysinfoQuery) {
    std::vector<uint8_t> probe = legacy_discovery_query();
    std::string text = transport::XorCipher::decrypt(probe.data(), probe.size());
    EXPECT_EQ(nlohmann::json::parse(text), (nlohmann::json{{"system", {{"get_sysinfo", nlohmann::json::object()}}}}));
}

TEST(DiscoveryProbeTest, TdpProbeHeader) {
    std::vector<uint8_t> probe = discovery_query();
    const std::string body = R"({"params":{}})";

    ASSERT_EQ(probe.size(), kDiscoveryHeaderSize + body.size());
    EXPECT_EQ(probe[0], 2);
    EXPECT_EQ(probe[1], 0);
    EXPECT_EQ((probe[2] << 8) | probe[3], 1);
    EXPECT_EQ((probe[4] << 8) | probe[5], static_cast<int>(body.size()));
    EXPECT_EQ(probe[6], 17);
    EXPECT_EQ(std::string(probe.begin() + kDiscoveryHeaderSize, probe.end()), body);
}

TEST(DiscoveryReplyTest, DecodesLegacyReply) {
    nlohmann::json out;
    Status status;
    ASSERT_TRUE(decode_discovery_reply(legacy_reply(plug_sysinfo()), 9999, 9999, out, status));
    EXPECT_EQ(out["system"]["get_sysinfo"]["alias"], "Kettle");
}

TEST(DiscoveryReplyTest, DecodesTdpReply) {
    nlohmann::json out;
    Status status;
    ASSERT_TRUE(decode_discovery_reply(tdp_reply(tapo_result("KLAP")), kDiscoveryPort, 9999, out, status));
    EXPECT_EQ(out["result"]["device_model"], "P110(EU)");
}

TEST(DiscoveryReplyTest, RejectsMalformedReplies) {
    nlohmann::json out;
    Status status;

    EXPECT_FALSE(decode_discovery_reply(std::vector<uint8_t>(8, 0), kDiscoveryPort, 9999, out, status));
    EXPECT_EQ(status.code, StatusCode::UNSUPPORTED_DEVICE);

    std::string garbage = "not json";
    std::vector<uint8_t> payload(kDiscoveryHeaderSize, 0);
    payload.insert(payload.end(), garbage.begin(), garbage.end());
    EXPECT_FALSE(decode_discovery_reply(payload, kDiscoveryPort, 9999, out, status));
    EXPECT_EQ(status.code, StatusCode::UNSUPPORTED_DEVICE);

    EXPECT_FALSE(decode_discovery_reply(legacy_reply(plug_sysinfo()), 1234, 9999, out, status));
    EXPECT_NE(status.message.find("unexpected port"), std::string::npos);
}

TEST(DiscoveryReplyTest, CustomLegacyPort) {
    nlohmann::json out;
    Status status;
    EXPECT_TRUE(decode_discovery_reply(legacy_reply(plug_sysinfo()), 19999, 19999, out, status));
}

// ============================================================================
// Result parsing and recipe selection
// ============================================================================

TEST(DiscoveryResultTest, LegacyReplyImpliesXor) {
    nlohmann::json reply = {{"system", {{"get_sysinfo", plug_sysinfo()}}}};
    DiscoveryResult result;
    Status status;
    ASSERT_TRUE(parse_discovery_result(reply, "10.0.0.5", 9999, true, result, status));

    EXPECT_EQ(result.device_type, "IOT.SMARTPLUGSWITCH");
    EXPECT_EQ(result.device_model, "HS110(EU)");
    EXPECT_EQ(result.device_id, "8006ABCD");
    EXPECT_EQ(result.firmware_version, "1.5.4");
    EXPECT_TRUE(result.legacy);

    connection::ConnectionRecipe recipe;
    bool ambiguous = true;
    ASSERT_TRUE(recipe_for_result(result, recipe, ambiguous, status));
    EXPECT_FALSE(ambiguous);
    EXPECT_EQ(recipe, connection::ConnectionRecipe(connection::DeviceFamily::IOT_SMARTPLUGSWITCH,
                                                   connection::TransportKind::XOR));
}

TEST(DiscoveryResultTest, LegacyMicTypeWins) {
    nlohmann::json info = {{"mic_type", "IOT.SMARTBULB"}, {"mic_mac", "50C7BF001122"}, {"model", "KL130"}};
    DiscoveryResult result;
    Status status;
    ASSERT_TRUE(
        parse_discovery_result({{"system", {{"get_sysinfo", info}}}}, "10.0.0.6", 9999, true, result, status));
    EXPECT_EQ(result.device_type, "IOT.SMARTBULB");
    EXPECT_EQ(result.mac, "50C7BF001122");
}

TEST(DiscoveryResultTest, LegacyWithoutSysinfoIsUnsupported) {
    DiscoveryResult result;
    Status status;
    EXPECT_FALSE(parse_discovery_result({{"system", {{"err_code", -1}}}}, "10.0.0.6", 9999, true, result, status));
    EXPECT_EQ(status.code, StatusCode::UNSUPPORTED_DEVICE);
}

TEST(DiscoveryResultTest, TdpReplyNamesRecipe) {
    nlohmann::json reply = {{"error_code", 0}, {"result", tapo_result("KLAP")}};
    DiscoveryResult result;
    Status status;
    ASSERT_TRUE(parse_discovery_result(reply, "10.0.0.7", kDiscoveryPort, false, result, status));

    ASSERT_TRUE(result.mgt_encrypt_schm.has_value());
    EXPECT_EQ(result.mgt_encrypt_schm->encrypt_type, "KLAP");
    ASSERT_TRUE(result.mgt_encrypt_schm->login_version.has_value());
    EXPECT_EQ(*result.mgt_encrypt_schm->login_version, 2);

    connection::ConnectionRecipe recipe;
    bool ambiguous = true;
    ASSERT_TRUE(recipe_for_result(result, recipe, ambiguous, status));
    EXPECT_EQ(recipe, connection::ConnectionRecipe(connection::DeviceFamily::SMART_TAPOPLUG,
                                                   connection::TransportKind::KLAP, false, 2, 80));
}

TEST(DiscoveryResultTest, EncryptTypeListSuppliesLoginVersion) {
    nlohmann::json body = tapo_result("");
    body["encrypt_info"] = {{"sym_schm", "AES"}};
    body["encrypt_type"] = {"1", "2"};
    DiscoveryResult result;
    Status status;
    ASSERT_TRUE(parse_discovery_result({{"result", body}}, "10.0.0.8", kDiscoveryPort, false, result, status));

    connection::ConnectionRecipe recipe;
    bool ambiguous = true;
    ASSERT_TRUE(recipe_for_result(result, recipe, ambiguous, status));
    EXPECT_EQ(recipe.transport, connection::TransportKind::AES);
    ASSERT_TRUE(recipe.login_version.has_value());
    EXPECT_EQ(*recipe.login_version, 2);
}

TEST(DiscoveryResultTest, MissingIdentityIsUnsupported) {
    nlohmann::json body = tapo_result("KLAP");
    body.erase("mac");
    DiscoveryResult result;
    Status status;
    EXPECT_FALSE(parse_discovery_result({{"result", body}}, "10.0.0.9", kDiscoveryPort, false, result, status));
    EXPECT_EQ(status.code, StatusCode::UNSUPPORTED_DEVICE);
    EXPECT_NE(status.message.find("10.0.0.9"), std::string::npos);
}

TEST(DiscoveryResultTest, NoEncryptionIsAmbiguous) {
    DiscoveryResult result;
    Status status;
    ASSERT_TRUE(parse_discovery_result({{"result", tapo_result("")}}, "10.0.0.10", kDiscoveryPort, false, result,
                                       status));

    connection::ConnectionRecipe recipe;
    bool ambiguous = false;
    EXPECT_FALSE(recipe_for_result(result, recipe, ambiguous, status));
    EXPECT_TRUE(ambiguous);
}

TEST(DiscoveryResultTest, UnknownFamilyOrSchemeIsUnsupported) {
    connection::ConnectionRecipe recipe;
    bool ambiguous = true;
    Status status;

    DiscoveryResult toaster;
    nlohmann::json body = tapo_result("KLAP");
    body["device_type"] = "SMART.TOASTER";
    ASSERT_TRUE(parse_discovery_result({{"result", body}}, "10.0.0.11", kDiscoveryPort, false, toaster, status));
    EXPECT_FALSE(recipe_for_result(toaster, recipe, ambiguous, status));
    EXPECT_FALSE(ambiguous);
    EXPECT_EQ(status.code, StatusCode::UNSUPPORTED_DEVICE);

    DiscoveryResult rot13;
    ASSERT_TRUE(parse_discovery_result({{"result", tapo_result("ROT13")}}, "10.0.0.12", kDiscoveryPort, false, rot13,
                                       status));
    EXPECT_FALSE(recipe_for_result(rot13, recipe, ambiguous, status));
    EXPECT_FALSE(ambiguous);
    EXPECT_NE(status.message.find("ROT13"), std::string::npos);
}

TEST(DiscoveryResultTest, ToJsonKeepsIdentityAndRaw) {
    nlohmann::json reply = {{"result", tapo_result("KLAP")}};
    DiscoveryResult result;
    Status status;
    ASSERT_TRUE(parse_discovery_result(reply, "10.0.0.7", kDiscoveryPort, false, result, status));

    nlohmann::json j = to_json(result);
    EXPECT_EQ(j["ip"], "10.0.0.7");
    EXPECT_EQ(j["device_type"], "SMART.TAPOPLUG");
    EXPECT_EQ(j["mgt_encrypt_schm"]["lv"], 2);
    EXPECT_EQ(j["raw"], reply);
}

// ============================================================================
// Single host
// ============================================================================

class DiscoverSingleTest : public ::testing::Test {
protected:
    void SetUp() override {
        script = std::make_shared<ChannelScript>();
        factory = std::make_shared<SlowFactory>();
        emitter = std::make_shared<events::EventEmitter>();
        subscription = emitter->subscribe();
        discoverer = std::make_unique<Discoverer>(factory, nullptr, emitter, channels_for(script));

        options.discovery_timeout_ms = 200;
        options.discovery_packets = 2;
    }

    std::shared_ptr<ChannelScript> script;
    std::shared_ptr<SlowFactory> factory;
    std::shared_ptr<events::EventEmitter> emitter;
    std::unique_ptr<events::Subscription> subscription;
    std::unique_ptr<Discoverer> discoverer;
    DiscoveryOptions options;
};

TEST_F(DiscoverSingleTest, SilentHostTimesOut) {
    auto start = std::chrono::steady_clock::now();
    HostResult result = discoverer->discover_single("127.0.0.1", options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status.code, StatusCode::UNSUPPORTED_DEVICE);
    EXPECT_NE(result.status.message.find("Timed out"), std::string::npos);
    EXPECT_GE(elapsed, 200ms);
    EXPECT_LT(elapsed, 1000ms);

    EXPECT_EQ(script->opens, 1);
    EXPECT_EQ(script->closes, 1);
    ASSERT_GE(script->sends.size(), 2u);
    EXPECT_EQ(script->sends[0], std::make_pair(std::string("127.0.0.1"), kLegacyDiscoveryPort));
    EXPECT_EQ(script->sends[1], std::make_pair(std::string("127.0.0.1"), kDiscoveryPort));
    EXPECT_LE(script->sends.size(), 4u);

    auto events = drain(*subscription);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<events::DeviceUnsupportedEvent>(events[0]));
}

TEST_F(DiscoverSingleTest, LegacyReplyConnectsWithXor) {
    script->add_reply(datagram("127.0.0.1", kLegacyDiscoveryPort, legacy_reply(plug_sysinfo())));

    HostResult result = discoverer->discover_single("127.0.0.1", options);

    ASSERT_TRUE(result.ok()) << result.status.message;
    ASSERT_TRUE(result.discovery.has_value());
    EXPECT_EQ(result.discovery->device_model, "HS110(EU)");

    auto connected = factory->connected();
    ASSERT_EQ(connected.size(), 1u);
    ASSERT_TRUE(connected[0].connection_type.has_value());
    EXPECT_EQ(connected[0].connection_type->transport, connection::TransportKind::XOR);

    auto events = drain(*subscription);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<events::RawDiscoveryEvent>(events[0]));
    ASSERT_TRUE(std::holds_alternative<events::DeviceDiscoveredEvent>(events[1]));
    EXPECT_TRUE(std::get<events::DeviceDiscoveredEvent>(events[1]).device == result.device);
}

TEST_F(DiscoverSingleTest, OptionsReachDeviceConfig) {
    options.port = 19999;
    options.timeout_s = 7;
    options.credentials = connection::Credentials{"user@example.com", "secret"};
    script->add_reply(datagram("127.0.0.1", 19999, legacy_reply(plug_sysinfo())));

    HostResult result = discoverer->discover_single("127.0.0.1", options);

    ASSERT_TRUE(result.ok()) << result.status.message;
    EXPECT_EQ(script->sends[0].second, 19999);
    auto config = factory->connected().at(0);
    ASSERT_TRUE(config.port_override.has_value());
    EXPECT_EQ(*config.port_override, 19999);
    EXPECT_EQ(config.timeout_s, 7);
    ASSERT_TRUE(config.credentials.has_value());
    EXPECT_EQ(config.credentials->username, "user@example.com");
}

TEST_F(DiscoverSingleTest, ReplyFromOtherHostIsIgnored) {
    script->add_reply(datagram("127.0.0.2", kLegacyDiscoveryPort, legacy_reply(plug_sysinfo())));

    HostResult result = discoverer->discover_single("127.0.0.1", options);

    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(factory->connected().empty());
}

TEST_F(DiscoverSingleTest, UnsupportedReplyCarriesDiscovery) {
    nlohmann::json body = tapo_result("KLAP");
    body["device_type"] = "SMART.TOASTER";
    script->add_reply(datagram("127.0.0.1", kDiscoveryPort, tdp_reply(body)));

    HostResult result = discoverer->discover_single("127.0.0.1", options);

    EXPECT_EQ(result.status.code, StatusCode::UNSUPPORTED_DEVICE);
    ASSERT_TRUE(result.discovery.has_value());
    EXPECT_EQ(result.discovery->device_type, "SMART.TOASTER");

    auto events = drain(*subscription);
    ASSERT_EQ(events.size(), 2u);
    ASSERT_TRUE(std::holds_alternative<events::DeviceUnsupportedEvent>(events[1]));
    EXPECT_EQ(std::get<events::DeviceUnsupportedEvent>(events[1]).discovery["result"]["device_type"],
              "SMART.TOASTER");
}

TEST_F(DiscoverSingleTest, RejectedCredentialsAreReported) {
    factory->reject_host = "127.0.0.1";
    script->add_reply(datagram("127.0.0.1", kDiscoveryPort, tdp_reply(tapo_result("KLAP"))));

    HostResult result = discoverer->discover_single("127.0.0.1", options);

    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.auth_failed());
}

TEST_F(DiscoverSingleTest, AmbiguousReplyIsNegotiated) {
    auto negotiator = std::make_shared<connection::Negotiator>(factory);
    negotiator->set_candidates(
        {connection::ConnectionRecipe(connection::DeviceFamily::SMART_TAPOPLUG, connection::TransportKind::AES, false,
                                      2)});
    Discoverer negotiating(factory, negotiator, emitter, channels_for(script));
    script->add_reply(datagram("127.0.0.1", kDiscoveryPort, tdp_reply(tapo_result(""))));

    HostResult result = negotiating.discover_single("127.0.0.1", options);

    ASSERT_TRUE(result.ok()) << result.status.message;
    EXPECT_EQ(factory->connected().at(0).connection_type->transport, connection::TransportKind::AES);
}

TEST_F(DiscoverSingleTest, NegotiationSharesTheDiscoveryWindow) {
    auto negotiator = std::make_shared<connection::Negotiator>(factory);
    negotiator->set_candidates(
        {connection::ConnectionRecipe(connection::DeviceFamily::SMART_TAPOPLUG, connection::TransportKind::AES, false,
                                      2),
         connection::ConnectionRecipe(connection::DeviceFamily::SMART_TAPOPLUG, connection::TransportKind::KLAP, false,
                                      2)});
    Discoverer negotiating(factory, negotiator, emitter, channels_for(script));
    options.discovery_timeout_ms = 300;
    script->reply_delay = 200ms;
    factory->delay = 200ms;
    factory->reject_host = "127.0.0.1";
    script->add_reply(datagram("127.0.0.1", kDiscoveryPort, tdp_reply(tapo_result(""))));

    auto start = std::chrono::steady_clock::now();
    HostResult result = negotiating.discover_single("127.0.0.1", options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    // The reply came at 200ms, the first attempt ran past 300ms, the second never started
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(factory->connected().size(), 1u);
    EXPECT_LT(elapsed, 550ms);
}

TEST_F(DiscoverSingleTest, SocketFailureIsReported) {
    script->fail_open = true;

    HostResult result = discoverer->discover_single("127.0.0.1", options);

    EXPECT_EQ(result.status.code, StatusCode::CONNECTION_ERROR);
    EXPECT_TRUE(script->sends.empty());
}

// ============================================================================
// Broadcast
// ============================================================================

class BroadcastTest : public DiscoverSingleTest {};

TEST_F(BroadcastTest, ClassifiesEveryHostOnce) {
    options.discovery_timeout_ms = 500;
    script->add_reply(datagram("10.0.0.1", kLegacyDiscoveryPort, legacy_reply(plug_sysinfo())));
    script->add_reply(datagram("10.0.0.1", kDiscoveryPort, tdp_reply(tapo_result("KLAP"))));
    script->add_reply(datagram("10.0.0.2", kDiscoveryPort, tdp_reply(tapo_result("KLAP"))));
    nlohmann::json toaster = tapo_result("KLAP");
    toaster["device_type"] = "SMART.TOASTER";
    script->add_reply(datagram("10.0.0.3", kDiscoveryPort, tdp_reply(toaster)));
    script->add_reply(datagram("10.0.0.4", 5353, {0x00}));
    factory->reject_host = "10.0.0.2";

    BroadcastResult result = discoverer->discover(options);

    EXPECT_TRUE(result.status.ok());
    ASSERT_EQ(result.devices.size(), 1u);
    EXPECT_EQ(result.devices.count("10.0.0.1"), 1u);
    EXPECT_EQ(result.auth_failed.count("10.0.0.2"), 1u);
    EXPECT_EQ(result.unsupported.count("10.0.0.3"), 1u);
    EXPECT_EQ(result.unsupported.count("10.0.0.4"), 0u);
    EXPECT_EQ(factory->connected().size(), 2u);
    EXPECT_EQ(script->sends.front().first, "255.255.255.255");

    int discovered = 0;
    int unsupported = 0;
    for (const auto& event : drain(*subscription)) {
        if (std::holds_alternative<events::DeviceDiscoveredEvent>(event)) {
            ++discovered;
        } else if (std::holds_alternative<events::DeviceUnsupportedEvent>(event)) {
            ++unsupported;
        }
    }
    EXPECT_EQ(discovered, 1);
    EXPECT_EQ(unsupported, 2);
}

TEST_F(BroadcastTest, ConcurrencyStaysWithinLimit) {
    options.discovery_timeout_ms = 1500;
    options.concurrency_limit = 2;
    factory->delay = 50ms;
    for (int i = 1; i <= 6; ++i) {
        script->add_reply(datagram("10.0.1." + std::to_string(i), kLegacyDiscoveryPort, legacy_reply(plug_sysinfo())));
    }

    BroadcastResult result = discoverer->discover(options);

    EXPECT_EQ(result.devices.size(), 6u);
    EXPECT_LE(factory->peak(), 2);
    EXPECT_GE(factory->peak(), 1);
}

TEST_F(BroadcastTest, LateHostIsTimedOutAndDropped) {
    options.discovery_timeout_ms = 150;
    factory->delay = 400ms;
    script->add_reply(datagram("10.0.2.1", kLegacyDiscoveryPort, legacy_reply(plug_sysinfo())));

    BroadcastResult result = discoverer->discover(options);

    EXPECT_TRUE(result.devices.empty());
    ASSERT_EQ(result.unsupported.count("10.0.2.1"), 1u);
    EXPECT_EQ(result.unsupported.at("10.0.2.1").status.code, StatusCode::TIMEOUT);

    // The worker has finished and closed its device before discover() returned
    EXPECT_EQ(factory->in_flight(), 0);
    auto devices = factory->devices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_TRUE(static_cast<FakeProtocol&>(devices[0]->protocol()).closed());

    int outcomes = 0;
    for (const auto& event : drain(*subscription)) {
        if (!std::holds_alternative<events::RawDiscoveryEvent>(event)) {
            ++outcomes;
        }
    }
    EXPECT_EQ(outcomes, 1);
}

TEST_F(BroadcastTest, SocketFailureIsReported) {
    script->fail_open = true;

    BroadcastResult result = discoverer->discover(options);

    EXPECT_EQ(result.status.code, StatusCode::CONNECTION_ERROR);
    EXPECT_TRUE(result.devices.empty());
}
