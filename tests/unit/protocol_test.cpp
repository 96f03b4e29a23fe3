/**
 * protocol_test.cpp - Protocol framing, batching, retry and redaction tests
 *
 * Tests:
 * 1. SMART single requests, multipleRequest batching and pagination
 * 2. Batch fallback when a device rejects multipleRequest
 * 3. Retry loop in BaseProtocol
 * 4. IOT per-module error fragments
 * 5. control_child wrapping for hub children
 * 6. Payload redaction
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "mocks/fake_protocol.hpp"
#include "mocks/mock_transport.hpp"
#include "protocol/child_protocol_wrapper.hpp"
#include "protocol/iot_protocol.hpp"
#include "protocol/redaction.hpp"
#include "protocol/smart_protocol.hpp"
#include "protocol/smartcam_protocol.hpp"

using namespace kasa;
using namespace kasa::tests;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

// SMART device answering from a method -> handler table
class SmartResponder {
public:
    using Handler = std::function<nlohmann::json(const nlohmann::json& params)>;

    void result(const std::string& method, nlohmann::json data) {
        handlers_[method] = [data](const nlohmann::json&) { return data; };
    }
    void handler(const std::string& method, Handler handler) { handlers_[method] = std::move(handler); }
    void error(const std::string& method, protocol::SmartErrorCode code) { errors_[method] = static_cast<int>(code); }
    void reject_batches(protocol::SmartErrorCode code) { batch_error_ = static_cast<int>(code); }
    void omit_from_batches(const std::string& method) { omitted_.push_back(method); }

    bool handle(const std::string& raw, nlohmann::json& reply) {
        nlohmann::json document = nlohmann::json::parse(raw);
        documents_.push_back(document);
        std::string method = document["method"].get<std::string>();

        if (method == "multipleRequest") {
            if (batch_error_ != 0) {
                reply = {{"error_code", batch_error_}};
                return true;
            }
            nlohmann::json responses = nlohmann::json::array();
            for (const auto& entry : document["params"]["requests"]) {
                std::string inner = entry["method"].get<std::string>();
                if (std::find(omitted_.begin(), omitted_.end(), inner) != omitted_.end()) {
                    continue;
                }
                nlohmann::json item = answer(inner, entry.value("params", nlohmann::json()));
                item["method"] = inner;
                responses.push_back(item);
            }
            reply = {{"error_code", 0}, {"result", {{"responses", responses}}}};
            return true;
        }
        reply = answer(method, document.value("params", nlohmann::json()));
        return true;
    }

    const std::vector<nlohmann::json>& documents() const { return documents_; }

    size_t count(const std::string& method) const {
        size_t n = 0;
        for (const auto& document : documents_) {
            if (document["method"] == method) {
                ++n;
            }
        }
        return n;
    }

private:
    nlohmann::json answer(const std::string& method, const nlohmann::json& params) {
        auto error = errors_.find(method);
        if (error != errors_.end()) {
            return {{"error_code", error->second}};
        }
        auto found = handlers_.find(method);
        if (found == handlers_.end()) {
            return {{"error_code", static_cast<int>(protocol::SmartErrorCode::UNKNOWN_METHOD_ERROR)}};
        }
        return {{"error_code", 0}, {"result", found->second(params)}};
    }

    std::map<std::string, Handler> handlers_;
    std::map<std::string, int> errors_;
    std::vector<std::string> omitted_;
    int batch_error_ = 0;
    std::vector<nlohmann::json> documents_;
};

}  // namespace

// ============================================================================
// SmartProtocol
// ============================================================================

class SmartProtocolTest : public ::testing::Test {
protected:
    void SetUp() override { build(protocol::SmartProtocol::kDefaultBatchSize); }

    void build(int batch_size) {
        auto owned = std::make_unique<NiceMock<MockTransport>>();
        wire = owned.get();
        wire->stub_status();
        ON_CALL(*wire, send(_, _)).WillByDefault(Invoke([this](const std::string& raw, nlohmann::json& reply) {
            return responder.handle(raw, reply);
        }));
        proto = std::make_unique<protocol::SmartProtocol>(std::move(owned), "10.0.0.3", batch_size);
        proto->set_backoff(std::chrono::milliseconds(0));
    }

    SmartResponder responder;
    NiceMock<MockTransport>* wire = nullptr;
    std::unique_ptr<protocol::SmartProtocol> proto;
};

TEST_F(SmartProtocolTest, SingleMethodSendsPlainEnvelope) {
    responder.result("get_device_info", {{"device_on", true}});

    protocol::QueryResponse response;
    ASSERT_TRUE(proto->query({{"get_device_info", nullptr}}, response));

    ASSERT_EQ(responder.documents().size(), 1u);
    const auto& document = responder.documents()[0];
    EXPECT_EQ(document["method"], "get_device_info");
    EXPECT_FALSE(document.contains("params"));
    EXPECT_TRUE(document.contains("request_time_milis"));
    EXPECT_TRUE(document["terminal_uuid"].is_string());

    ASSERT_EQ(response.count("get_device_info"), 1u);
    EXPECT_FALSE(response["get_device_info"].is_error());
    EXPECT_EQ(response["get_device_info"].data["device_on"], true);
}

TEST_F(SmartProtocolTest, ParamsAreForwarded) {
    responder.handler("get_auto_off_config", [](const nlohmann::json& params) {
        return nlohmann::json{{"echo", params}};
    });

    protocol::QueryResponse response;
    ASSERT_TRUE(proto->query({{"get_auto_off_config", {{"start_index", 0}}}}, response));
    EXPECT_EQ(responder.documents()[0]["params"]["start_index"], 0);
}

TEST_F(SmartProtocolTest, SingleMethodDeviceErrorBecomesFragment) {
    responder.error("get_device_usage", protocol::SmartErrorCode::PARAMS_ERROR);

    protocol::QueryResponse response;
    ASSERT_TRUE(proto->query({{"get_device_usage", nullptr}}, response));
    ASSERT_TRUE(response["get_device_usage"].is_error());
    EXPECT_EQ(response["get_device_usage"].error_code, static_cast<int>(protocol::SmartErrorCode::PARAMS_ERROR));
}

TEST_F(SmartProtocolTest, AuthenticationErrorIsNotRetried) {
    responder.error("get_device_info", protocol::SmartErrorCode::LOGIN_ERROR);
    EXPECT_CALL(*wire, reset()).Times(1);

    protocol::QueryResponse response;
    EXPECT_FALSE(proto->query({{"get_device_info", nullptr}}, response));
    EXPECT_EQ(proto->last_status().code, StatusCode::AUTHENTICATION_ERROR);
    EXPECT_EQ(proto->last_status().device_error_code, static_cast<int>(protocol::SmartErrorCode::LOGIN_ERROR));
    EXPECT_EQ(responder.documents().size(), 1u);
}

TEST_F(SmartProtocolTest, SeveralMethodsShareOneBatch) {
    responder.result("get_device_info", {{"device_on", true}});
    responder.result("get_device_time", {{"timestamp", 1700000000}});
    responder.result("get_connect_cloud_state", {{"status", 0}});

    protocol::QueryResponse response;
    ASSERT_TRUE(proto->query(
        {{"get_device_info", nullptr}, {"get_device_time", nullptr}, {"get_connect_cloud_state", nullptr}}, response));

    ASSERT_EQ(responder.documents().size(), 1u);
    EXPECT_EQ(responder.documents()[0]["method"], "multipleRequest");
    EXPECT_EQ(responder.documents()[0]["params"]["requests"].size(), 3u);
    EXPECT_EQ(response.size(), 3u);
    EXPECT_EQ(response["get_device_time"].data["timestamp"], 1700000000);
}

TEST_F(SmartProtocolTest, LargeRequestIsSplitIntoBatches) {
    nlohmann::json request = nlohmann::json::object();
    for (int i = 0; i < 7; ++i) {
        std::string method = "get_thing_" + std::to_string(i);
        responder.result(method, {{"index", i}});
        request[method] = nullptr;
    }

    protocol::QueryResponse response;
    ASSERT_TRUE(proto->query(request, response));

    ASSERT_EQ(responder.documents().size(), 2u);
    EXPECT_EQ(responder.documents()[0]["params"]["requests"].size(), 5u);
    EXPECT_EQ(responder.documents()[1]["params"]["requests"].size(), 2u);
    EXPECT_EQ(response.size(), 7u);
}

TEST_F(SmartProtocolTest, ConfiguredBatchSizeIsHonored) {
    build(2);
    nlohmann::json request = nlohmann::json::object();
    for (int i = 0; i < 5; ++i) {
        std::string method = "get_thing_" + std::to_string(i);
        responder.result(method, nlohmann::json::object());
        request[method] = nullptr;
    }

    protocol::QueryResponse response;
    ASSERT_TRUE(proto->query(request, response));
    EXPECT_EQ(proto->batch_size(), 2);
    EXPECT_EQ(responder.count("multipleRequest"), 3u);
}

TEST_F(SmartProtocolTest, ForceSingleMethodsAreSentAlone) {
    responder.result("get_device_info", nlohmann::json::object());
    responder.result("get_device_time", nlohmann::json::object());
    responder.result("getConnectStatus", {{"status", 2}});

    protocol::QueryResponse response;
    ASSERT_TRUE(proto->query(
        {{"get_device_info", nullptr}, {"get_device_time", nullptr}, {"getConnectStatus", nullptr}}, response));

    EXPECT_EQ(responder.count("multipleRequest"), 1u);
    EXPECT_EQ(responder.count("getConnectStatus"), 1u);
    EXPECT_EQ(responder.documents()[0]["params"]["requests"].size(), 2u);
    EXPECT_EQ(response["getConnectStatus"].data["status"], 2);
}

TEST_F(SmartProtocolTest, MethodErrorInsideBatchIsFragment) {
    responder.result("get_device_info", nlohmann::json::object());
    responder.error("get_energy_usage", protocol::SmartErrorCode::UNKNOWN_METHOD_ERROR);

    protocol::QueryResponse response;
    ASSERT_TRUE(proto->query({{"get_device_info", nullptr}, {"get_energy_usage", nullptr}}, response));
    EXPECT_FALSE(response["get_device_info"].is_error());
    EXPECT_EQ(response["get_energy_usage"].error_code,
              static_cast<int>(protocol::SmartErrorCode::UNKNOWN_METHOD_ERROR));
}

TEST_F(SmartProtocolTest, MissingBatchResponseIsQueriedSingly) {
    responder.result("get_device_info", nlohmann::json::object());
    responder.result("get_device_time", {{"timestamp", 1}});
    responder.omit_from_batches("get_device_time");

    protocol::QueryResponse response;
    ASSERT_TRUE(proto->query({{"get_device_info", nullptr}, {"get_device_time", nullptr}}, response));

    EXPECT_EQ(responder.count("multipleRequest"), 1u);
    EXPECT_EQ(responder.count("get_device_time"), 1u);
    EXPECT_EQ(response["get_device_time"].data["timestamp"], 1);
}

TEST_F(SmartProtocolTest, RejectedBatchSwitchesToSingleRequests) {
    responder.result("get_device_info", nlohmann::json::object());
    responder.result("get_device_time", nlohmann::json::object());
    responder.reject_batches(protocol::SmartErrorCode::JSON_DECODE_FAIL_ERROR);

    protocol::QueryResponse response;
    ASSERT_TRUE(proto->query({{"get_device_info", nullptr}, {"get_device_time", nullptr}}, response));

    EXPECT_EQ(proto->batch_size(), 1);
    EXPECT_EQ(responder.count("multipleRequest"), 1u);
    EXPECT_EQ(responder.count("get_device_info"), 1u);
    EXPECT_EQ(responder.count("get_device_time"), 1u);
    EXPECT_EQ(response.size(), 2u);
}

TEST_F(SmartProtocolTest, PaginatedListIsCompleted) {
    responder.handler("get_child_device_list", [](const nlohmann::json& params) {
        int start = params.is_object() ? params.value("start_index", 0) : 0;
        nlohmann::json list = nlohmann::json::array();
        for (int i = start; i < std::min(start + 2, 5); ++i) {
            list.push_back({{"device_id", "child-" + std::to_string(i)}});
        }
        return nlohmann::json{{"child_device_list", list}, {"start_index", start}, {"sum", 5}};
    });

    protocol::QueryResponse response;
    ASSERT_TRUE(proto->query({{"get_child_device_list", nullptr}}, response));

    const auto& children = response["get_child_device_list"].data["child_device_list"];
    ASSERT_EQ(children.size(), 5u);
    EXPECT_EQ(children[4]["device_id"], "child-4");
    EXPECT_EQ(responder.count("get_child_device_list"), 3u);
}

TEST_F(SmartProtocolTest, EmptyPageStopsPagination) {
    responder.handler("get_child_device_list", [](const nlohmann::json& params) {
        int start = params.is_object() ? params.value("start_index", 0) : 0;
        nlohmann::json list = nlohmann::json::array();
        if (start == 0) {
            list.push_back({{"device_id", "child-0"}});
        }
        return nlohmann::json{{"child_device_list", list}, {"start_index", start}, {"sum", 4}};
    });

    protocol::QueryResponse response;
    ASSERT_TRUE(proto->query({{"get_child_device_list", nullptr}}, response));
    EXPECT_EQ(response["get_child_device_list"].data["child_device_list"].size(), 1u);
    EXPECT_EQ(responder.count("get_child_device_list"), 2u);
}

TEST_F(SmartProtocolTest, EmptyRequestIsInvalid) {
    protocol::QueryResponse response;
    EXPECT_FALSE(proto->query(nlohmann::json::object(), response));
    EXPECT_EQ(proto->last_status().code, StatusCode::INVALID_ARGUMENT);
}

TEST(SmartCamProtocolTest, SingleMethodTravelsAsMultipleRequest) {
    SmartResponder responder;
    responder.result("getDeviceInfo", {{"device_info", {{"basic_info", {{"device_model", "C210"}}}}}});

    auto owned = std::make_unique<NiceMock<MockTransport>>();
    owned->stub_status();
    ON_CALL(*owned, send(_, _)).WillByDefault(Invoke([&responder](const std::string& raw, nlohmann::json& reply) {
        return responder.handle(raw, reply);
    }));
    protocol::SmartCamProtocol proto(std::move(owned), "10.0.0.9");

    protocol::QueryResponse response;
    ASSERT_TRUE(proto.query({{"getDeviceInfo", {{"device_info", {{"name", {"basic_info"}}}}}}}, response));
    EXPECT_EQ(responder.count("multipleRequest"), 1u);
    EXPECT_EQ(response["getDeviceInfo"].data["device_info"]["basic_info"]["device_model"], "C210");
}

// ============================================================================
// Retry loop
// ============================================================================

class RetryTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto owned = std::make_unique<NiceMock<MockTransport>>();
        wire = owned.get();
        wire->stub_status();
        proto = std::make_unique<protocol::IotProtocol>(std::move(owned), "10.0.0.4");
        proto->set_backoff(std::chrono::milliseconds(0));
        proto->set_retry_count(2);
    }

    NiceMock<MockTransport>* wire = nullptr;
    std::unique_ptr<protocol::IotProtocol> proto;
};

TEST_F(RetryTest, RetryableErrorIsRetriedUpToLimit) {
    wire->_status = Status::error(StatusCode::CONNECTION_ERROR, "reset by peer", true);
    EXPECT_CALL(*wire, send(_, _)).Times(3).WillRepeatedly(Return(false));
    EXPECT_CALL(*wire, reset()).Times(3);

    protocol::QueryResponse response;
    EXPECT_FALSE(proto->query({{"system", {{"get_sysinfo", nullptr}}}}, response));
    EXPECT_EQ(proto->last_status().code, StatusCode::CONNECTION_ERROR);
}

TEST_F(RetryTest, TimeoutIsRetried) {
    wire->_status = Status::error(StatusCode::TIMEOUT, "no reply");
    nlohmann::json reply = {{"system", {{"get_sysinfo", {{"relay_state", 1}}}}}};
    EXPECT_CALL(*wire, send(_, _)).WillOnce(Return(false)).WillOnce(ReplyWith(reply));

    protocol::QueryResponse response;
    ASSERT_TRUE(proto->query({{"system", {{"get_sysinfo", nullptr}}}}, response));
    EXPECT_TRUE(proto->last_status().ok());
    EXPECT_EQ(response["system"].data["get_sysinfo"]["relay_state"], 1);
}

TEST_F(RetryTest, NonRetryableErrorStopsImmediately) {
    wire->_status = Status::error(StatusCode::CONNECTION_ERROR, "connection refused", false);
    EXPECT_CALL(*wire, send(_, _)).Times(1).WillOnce(Return(false));
    EXPECT_CALL(*wire, reset()).Times(1);

    protocol::QueryResponse response;
    EXPECT_FALSE(proto->query({{"system", {{"get_sysinfo", nullptr}}}}, response));
    EXPECT_FALSE(proto->last_status().retryable);
}

TEST_F(RetryTest, AuthenticationErrorStopsImmediately) {
    wire->_status = Status::error(StatusCode::AUTHENTICATION_ERROR, "bad credentials");
    EXPECT_CALL(*wire, send(_, _)).Times(1).WillOnce(Return(false));

    protocol::QueryResponse response;
    EXPECT_FALSE(proto->query({{"system", {{"get_sysinfo", nullptr}}}}, response));
    EXPECT_EQ(proto->last_status().code, StatusCode::AUTHENTICATION_ERROR);
}

TEST_F(RetryTest, NonObjectReplyIsRetryable) {
    EXPECT_CALL(*wire, send(_, _))
        .WillOnce(ReplyWith(nlohmann::json::array()))
        .WillOnce(ReplyWith(nlohmann::json{{"system", nlohmann::json::object()}}));

    protocol::QueryResponse response;
    EXPECT_TRUE(proto->query({{"system", {{"get_sysinfo", nullptr}}}}, response));
}

TEST_F(RetryTest, CloseClosesTransport) {
    EXPECT_CALL(*wire, close()).Times(1);
    proto->close();
}

// ============================================================================
// IotProtocol
// ============================================================================

TEST_F(RetryTest, IotRequestIsSentVerbatim) {
    nlohmann::json request = {{"system", {{"get_sysinfo", nullptr}}}, {"emeter", {{"get_realtime", nullptr}}}};
    std::string sent;
    EXPECT_CALL(*wire, send(_, _)).WillOnce(Invoke([&sent](const std::string& raw, nlohmann::json& reply) {
        sent = raw;
        reply = {{"system", {{"get_sysinfo", {{"relay_state", 0}}}}}, {"emeter", {{"get_realtime", {{"power", 1.5}}}}}};
        return true;
    }));

    protocol::QueryResponse response;
    ASSERT_TRUE(proto->query(request, response));
    EXPECT_EQ(nlohmann::json::parse(sent), request);
    EXPECT_EQ(response.size(), 2u);
}

TEST_F(RetryTest, IotModuleErrorBecomesFragment) {
    nlohmann::json reply = {
        {"system", {{"get_sysinfo", {{"relay_state", 1}}}}},
        {"emeter", {{"get_realtime", {{"err_code", -1}, {"err_msg", "module not support"}}}}},
    };
    EXPECT_CALL(*wire, send(_, _)).WillOnce(ReplyWith(reply));

    protocol::QueryResponse response;
    ASSERT_TRUE(proto->query({{"system", {{"get_sysinfo", nullptr}}}, {"emeter", {{"get_realtime", nullptr}}}},
                             response));
    EXPECT_FALSE(response["system"].is_error());
    ASSERT_TRUE(response["emeter"].is_error());
    EXPECT_EQ(response["emeter"].error_code, -1);
    EXPECT_EQ(response["emeter"].data["get_realtime"]["err_msg"], "module not support");
}

TEST(IotErrorCodeTest, FindsTopLevelAndNestedCodes) {
    EXPECT_EQ(protocol::iot_error_code({{"err_code", -2}}), -2);
    EXPECT_EQ(protocol::iot_error_code({{"get_time", {{"err_code", -3}}}}), -3);
    EXPECT_EQ(protocol::iot_error_code({{"get_time", {{"err_code", 0}, {"hour", 1}}}}), 0);
    EXPECT_EQ(protocol::iot_error_code(nlohmann::json::array()), 0);
}

// ============================================================================
// ChildProtocolWrapper
// ============================================================================

TEST(ChildProtocolTest, SingleMethodWrap) {
    FakeProtocol parent;
    protocol::ChildProtocolWrapper child("80200000000000000000000000000000000000FF", parent);

    auto wrapped = child.wrap({{"get_device_info", nullptr}});
    EXPECT_EQ(wrapped["control_child"]["device_id"], "80200000000000000000000000000000000000FF");
    EXPECT_EQ(wrapped["control_child"]["requestData"]["method"], "get_device_info");
    EXPECT_TRUE(wrapped["control_child"]["requestData"]["params"].is_null());
}

TEST(ChildProtocolTest, SeveralMethodsWrapAsMultipleRequest) {
    FakeProtocol parent;
    protocol::ChildProtocolWrapper child("child-1", parent);

    auto wrapped = child.wrap({{"get_device_info", nullptr}, {"set_device_info", {{"device_on", true}}}});
    const auto& data = wrapped["control_child"]["requestData"];
    EXPECT_EQ(data["method"], "multipleRequest");
    ASSERT_EQ(data["params"]["requests"].size(), 2u);
    EXPECT_FALSE(data["params"]["requests"][0].contains("params"));
    EXPECT_EQ(data["params"]["requests"][1]["params"]["device_on"], true);
}

TEST(ChildProtocolTest, SingleReplyIsUnwrapped) {
    FakeProtocol parent;
    parent.answer("control_child", {{"responseData", {{"error_code", 0}, {"result", {{"device_on", false}}}}}});
    protocol::ChildProtocolWrapper child("child-1", parent);

    protocol::QueryResponse response;
    ASSERT_TRUE(child.query({{"get_device_info", nullptr}}, response));
    EXPECT_EQ(response["get_device_info"].data["device_on"], false);
    EXPECT_TRUE(parent.last_request().contains("control_child"));
}

TEST(ChildProtocolTest, BatchedRepliesAreSplitPerMethod) {
    FakeProtocol parent;
    nlohmann::json responses = nlohmann::json::array(
        {{{"method", "get_device_info"}, {"error_code", 0}, {"result", {{"device_on", true}}}},
         {{"method", "get_device_usage"}, {"error_code", -1002}}});
    parent.answer("control_child", {{"responseData", {{"result", {{"responses", responses}}}}}});
    protocol::ChildProtocolWrapper child("child-1", parent);

    protocol::QueryResponse response;
    ASSERT_TRUE(child.query({{"get_device_info", nullptr}, {"get_device_usage", nullptr}}, response));
    EXPECT_EQ(response["get_device_info"].data["device_on"], true);
    EXPECT_EQ(response["get_device_usage"].error_code,
              static_cast<int>(protocol::SmartErrorCode::UNKNOWN_METHOD_ERROR));
}

TEST(ChildProtocolTest, EnvelopeErrorIsSharedByEveryKey) {
    FakeProtocol parent;
    parent.answer_error("control_child", protocol::SmartErrorCode::DEVICE_ERROR);
    protocol::ChildProtocolWrapper child("child-1", parent);

    protocol::QueryResponse response;
    ASSERT_TRUE(child.query({{"get_device_info", nullptr}, {"get_device_usage", nullptr}}, response));
    EXPECT_EQ(response["get_device_info"].error_code, static_cast<int>(protocol::SmartErrorCode::DEVICE_ERROR));
    EXPECT_EQ(response["get_device_usage"].error_code, static_cast<int>(protocol::SmartErrorCode::DEVICE_ERROR));
}

TEST(ChildProtocolTest, ParentFailurePropagates) {
    FakeProtocol parent;
    parent.fail_with(Status::error(StatusCode::TIMEOUT, "hub timed out"));
    protocol::ChildProtocolWrapper child("child-1", parent);

    protocol::QueryResponse response;
    EXPECT_FALSE(child.query({{"get_device_info", nullptr}}, response));
    EXPECT_EQ(child.last_status().code, StatusCode::TIMEOUT);
}

TEST(ChildProtocolTest, CloseLeavesParentOpen) {
    FakeProtocol parent("10.0.0.2");
    protocol::ChildProtocolWrapper child("child-1", parent);
    child.close();
    EXPECT_FALSE(parent.closed());
    EXPECT_EQ(child.host(), "10.0.0.2");
}

// ============================================================================
// Redaction
// ============================================================================

TEST(RedactionTest, MaskMac) {
    EXPECT_EQ(protocol::mask_mac("AA:BB:CC:DD:EE:FF"), "AA:BB:CC:00:00:00");
    EXPECT_EQ(protocol::mask_mac("AA-BB-CC-DD-EE-FF"), "AA-BB-CC-00-00-00");
    EXPECT_EQ(protocol::mask_mac("AABBCCDDEEFF"), "AABBCC000000");
}

TEST(RedactionTest, SmartFields) {
    nlohmann::json data = {
        {"device_id", "0123456789ABCDEF"},
        {"nickname", "TGl2aW5nIFJvb20="},
        {"mac", "AA-BB-CC-DD-EE-FF"},
        {"latitude", 52.1},
        {"model", "P110"},
        {"password", "hunter2"},
    };
    auto redacted = protocol::redact_data(data, protocol::smart_redactors());

    EXPECT_EQ(redacted["device_id"], "REDACTED_9ABCDEF");
    EXPECT_EQ(redacted["nickname"], "I01BU0tFRF9OQU1FIw==");
    EXPECT_EQ(redacted["mac"], "AA-BB-CC-00-00-00");
    EXPECT_EQ(redacted["latitude"], 0);
    EXPECT_EQ(redacted["model"], "P110");
    EXPECT_EQ(redacted["password"], "**REDACTED**");
}

TEST(RedactionTest, WalksNestedObjectsAndArrays) {
    nlohmann::json data = {
        {"result", {{"child_device_list", {{{"device_id", "0123456789child"}}, {{"device_id", "0123456789other"}}}}}}};
    auto redacted = protocol::redact_data(data, protocol::smart_redactors());
    EXPECT_EQ(redacted["result"]["child_device_list"][0]["device_id"], "REDACTED_9child");
    EXPECT_EQ(redacted["result"]["child_device_list"][1]["device_id"], "REDACTED_9other");
}

TEST(RedactionTest, EmptyAndNullValuesAreKept) {
    nlohmann::json data = {{"nickname", ""}, {"device_id", nullptr}};
    auto redacted = protocol::redact_data(data, protocol::smart_redactors());
    EXPECT_EQ(redacted, data);
}

TEST(RedactionTest, FailingRedactorMarksField) {
    nlohmann::json data = {{"device_id", 12345}};
    auto redacted = protocol::redact_data(data, protocol::smart_redactors());
    EXPECT_EQ(redacted["device_id"], "**REDACTEX**");
}

TEST(RedactionTest, IotChildrenAreScrubbed) {
    nlohmann::json data = {{"system",
                            {{"get_sysinfo",
                              {{"alias", "Power Strip"},
                               {"children", {{{"id", "00"}, {"alias", "Lamp"}}, {{"id", "01"}, {"alias", ""}}}}}}}}};
    auto redacted = protocol::redact_data(data, protocol::iot_redactors());
    const auto& sysinfo = redacted["system"]["get_sysinfo"];
    EXPECT_EQ(sysinfo["alias"], "#MASKED_NAME#");
    EXPECT_EQ(sysinfo["children"][0]["id"], "SCRUBBED_CHILD_DEVICE_ID_1");
    EXPECT_EQ(sysinfo["children"][0]["alias"], "#MASKED_NAME# 1");
    EXPECT_EQ(sysinfo["children"][1]["alias"], "");
}
