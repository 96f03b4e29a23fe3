#include "child_protocol_wrapper.hpp"

#include "logging/logger.hpp"

namespace kasa {
namespace protocol {

namespace {

const char kControlChild[] = "control_child";

int reply_error_code(const nlohmann::json& reply) {
    auto raw = reply.find("error_code");
    if (raw == reply.end() || !raw->is_number_integer()) {
        return 0;
    }
    return raw->get<int>();
}

}  // namespace

ChildProtocolWrapper::ChildProtocolWrapper(const std::string& device_id, IProtocol& parent)
    : device_id_(device_id), parent_(parent) {}

nlohmann::json ChildProtocolWrapper::wrap(const nlohmann::json& request) const {
    nlohmann::json request_data;
    if (request.size() == 1) {
        auto it = request.begin();
        request_data["method"] = it.key();
        request_data["params"] = it.value();
    } else {
        nlohmann::json requests = nlohmann::json::array();
        for (auto it = request.begin(); it != request.end(); ++it) {
            nlohmann::json entry = {{"method", it.key()}};
            if (!it.value().is_null() && !(it.value().is_object() && it.value().empty())) {
                entry["params"] = it.value();
            }
            requests.push_back(entry);
        }
        request_data["method"] = "multipleRequest";
        request_data["params"] = {{"requests", requests}};
    }
    return {{kControlChild, {{"device_id", device_id_}, {"requestData", request_data}}}};
}

bool ChildProtocolWrapper::query(const nlohmann::json& request, QueryResponse& response) {
    if (!request.is_object() || request.empty()) {
        status_ = Status::error(StatusCode::INVALID_ARGUMENT, "Child request must be a non-empty object");
        return false;
    }

    QueryResponse parent_response;
    if (!parent_.query(wrap(request), parent_response)) {
        status_ = parent_.last_status();
        return false;
    }
    status_ = Status::success();

    std::string method = request.size() == 1 ? request.begin().key() : "multipleRequest";
    auto envelope = parent_response.find(kControlChild);
    if (envelope == parent_response.end()) {
        LOG_DEBUG("[ChildProtocol] No control_child reply for " << device_id_);
        return true;
    }

    // The envelope itself failed, every requested key shares the error
    if (envelope->second.is_error()) {
        for (auto it = request.begin(); it != request.end(); ++it) {
            response[it.key()] = envelope->second;
        }
        return true;
    }

    const nlohmann::json& data = envelope->second.data;
    if (!data.is_object() || !data.contains("responseData") || !data["responseData"].is_object()) {
        response[method] = ReplyFragment::ok(data);
        return true;
    }

    const nlohmann::json& response_data = data["responseData"];
    nlohmann::json result = response_data.value("result", nlohmann::json());
    if (result.is_object() && result.contains("responses") && result["responses"].is_array()) {
        for (const auto& item : result["responses"]) {
            if (!item.is_object() || !item.contains("method")) {
                continue;
            }
            int code = reply_error_code(item);
            if (code != 0) {
                response[item["method"].get<std::string>()] = ReplyFragment::error(smart_error_code_from_int(code));
            } else {
                response[item["method"].get<std::string>()] = ReplyFragment::ok(item.value("result", nlohmann::json()));
            }
        }
        return true;
    }

    int code = reply_error_code(response_data);
    if (code != 0) {
        SmartErrorCode error = smart_error_code_from_int(code);
        if (is_authentication_error(error) || is_retryable_error(error)) {
            status_ = status_from_error_code(error, "Error querying child " + device_id_);
            return false;
        }
        response[method] = ReplyFragment::error(error);
        return true;
    }

    response[method] = ReplyFragment::ok(result);
    return true;
}

}  // namespace protocol
}  // namespace kasa
