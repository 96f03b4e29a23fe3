#include "smart_protocol.hpp"

#include <chrono>
#include <random>

#include "common/base64.hpp"
#include "logging/logger.hpp"
#include "redaction.hpp"

namespace kasa {
namespace protocol {

namespace {

const char kMultipleRequest[] = "multipleRequest";

std::string random_terminal_uuid() {
    std::random_device rd;
    std::string bytes(16, '\0');
    for (auto& b : bytes) {
        b = static_cast<char>(rd() & 0xFF);
    }
    return base64_encode(bytes);
}

bool has_params(const nlohmann::json& params) {
    return !params.is_null() && !(params.is_object() && params.empty());
}

int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

SmartProtocol::SmartProtocol(std::unique_ptr<transport::ITransport> transport, const std::string& host,
                             int batch_size)
    : BaseProtocol(std::move(transport), host),
      terminal_uuid_(random_terminal_uuid()),
      batch_size_(batch_size > 0 ? batch_size : kDefaultBatchSize) {}

const std::set<std::string>& SmartProtocol::force_single_methods() {
    static const std::set<std::string> methods = {"getConnectStatus", "scanApList"};
    return methods;
}

nlohmann::json SmartProtocol::make_request(const std::string& method, const nlohmann::json& params) const {
    nlohmann::json request;
    request["method"] = method;
    request["request_time_milis"] = now_millis();
    request["terminal_uuid"] = terminal_uuid_;
    if (has_params(params)) {
        request["params"] = params;
    }
    return request;
}

nlohmann::json SmartProtocol::redact_for_log(const nlohmann::json& data) const {
    return redact_data(data, smart_redactors());
}

bool SmartProtocol::classify(const nlohmann::json& reply, const std::string& method, bool strict,
                             ReplyFragment& fragment, Status& status) {
    SmartErrorCode code = SmartErrorCode::INTERNAL_UNKNOWN_ERROR;
    auto raw = reply.find("error_code");
    if (raw != reply.end() && raw->is_number_integer()) {
        code = smart_error_code_from_int(raw->get<int>());
        if (code == SmartErrorCode::INTERNAL_UNKNOWN_ERROR) {
            LOG_WARN("[SmartProtocol] Device " << host() << " returned unknown error code: " << raw->get<int>());
        }
    }

    if (code == SmartErrorCode::SUCCESS) {
        fragment = ReplyFragment::ok(reply.value("result", nlohmann::json()));
        return true;
    }

    if (strict && (is_authentication_error(code) || is_retryable_error(code))) {
        status = status_from_error_code(code, "Error querying device " + host() + " for method " + method);
        return false;
    }

    fragment = ReplyFragment::error(code);
    return true;
}

bool SmartProtocol::execute(const nlohmann::json& request, QueryResponse& response, Status& status) {
    if (!request.is_object() || request.empty()) {
        status = Status::error(StatusCode::INVALID_ARGUMENT, "SMART request must be a non-empty object");
        return false;
    }

    if (request.size() == 1 && !always_multiple()) {
        auto it = request.begin();
        return execute_single(it.key(), it.value(), true, true, response, status);
    }
    return execute_multiple(request, response, status);
}

bool SmartProtocol::execute_single(const std::string& method, const nlohmann::json& params, bool strict,
                                   bool paginate, QueryResponse& response, Status& status) {
    nlohmann::json reply;
    if (!send_document(make_request(method, params), reply, status, method)) {
        return false;
    }

    ReplyFragment fragment;
    if (!classify(reply, method, strict, fragment, status)) {
        return false;
    }
    if (paginate && !fragment.is_error() && !fragment.data.is_null()) {
        if (!fetch_remaining_pages(method, fragment.data, status)) {
            return false;
        }
    }
    response[method] = std::move(fragment);
    return true;
}

bool SmartProtocol::execute_multiple(const nlohmann::json& request, QueryResponse& response, Status& status) {
    // Only a lone method may abort the query on its own error code
    bool strict = request.size() == 1;

    nlohmann::json entries = nlohmann::json::array();
    for (auto it = request.begin(); it != request.end(); ++it) {
        if (force_single_methods().count(it.key()) > 0) {
            continue;
        }
        nlohmann::json entry = {{"method", it.key()}};
        if (has_params(it.value())) {
            entry["params"] = it.value();
        }
        entries.push_back(entry);
    }

    int step = batch_size_.load();
    if (step == 1) {
        for (const auto& entry : entries) {
            std::string method = entry["method"].get<std::string>();
            if (!execute_single(method, entry.value("params", nlohmann::json()), strict, true, response, status)) {
                return false;
            }
        }
    } else {
        size_t total = entries.size();
        size_t batches = (total + step - 1) / step;
        for (size_t batch = 0; batch < batches; ++batch) {
            nlohmann::json batch_entries = nlohmann::json::array();
            for (size_t i = batch * step; i < total && i < (batch + 1) * step; ++i) {
                batch_entries.push_back(entries[i]);
            }
            std::string batch_name =
                "multi-request-batch-" + std::to_string(batch + 1) + "-of-" + std::to_string(batches);

            nlohmann::json reply;
            if (!send_document(make_request(kMultipleRequest, {{"requests", batch_entries}}), reply, status,
                               batch_name)) {
                return false;
            }

            int raw_code = reply.value("error_code", static_cast<int>(SmartErrorCode::INTERNAL_UNKNOWN_ERROR));
            SmartErrorCode code = smart_error_code_from_int(raw_code);
            if (code != SmartErrorCode::SUCCESS) {
                // Some devices reject batches outright, fall back to one method per request
                if ((code == SmartErrorCode::JSON_DECODE_FAIL_ERROR ||
                     code == SmartErrorCode::INTERNAL_UNKNOWN_ERROR) &&
                    batch_size_.load() != 1) {
                    batch_size_.store(1);
                    status = Status::device_error(StatusCode::CONNECTION_ERROR,
                                                  "JSON decode failure, multi requests disabled", raw_code, true);
                    return false;
                }
                status = status_from_error_code(code, "Error querying device " + host() + " for " + batch_name);
                return false;
            }

            const nlohmann::json* responses = nullptr;
            auto result = reply.find("result");
            if (result != reply.end() && result->is_object()) {
                auto found = result->find("responses");
                if (found != result->end() && found->is_array()) {
                    responses = &(*found);
                }
            }
            if (responses == nullptr) {
                continue;
            }

            for (const auto& item : *responses) {
                if (!item.is_object()) {
                    continue;
                }
                std::string method = item.value("method", "");
                if (method.empty()) {
                    if (!method_missing_logged_) {
                        method_missing_logged_ = true;
                        LOG_ERROR("[SmartProtocol] No method key in response for " << host() << ", skipping");
                    }
                    continue;
                }
                ReplyFragment fragment;
                if (!classify(item, method, strict, fragment, status)) {
                    return false;
                }
                if (!fragment.is_error() && !fragment.data.is_null()) {
                    if (!fetch_remaining_pages(method, fragment.data, status)) {
                        return false;
                    }
                }
                response[method] = std::move(fragment);
            }
        }
    }

    // Batches stop at the first failing method, query whatever is missing one at a time
    for (auto it = request.begin(); it != request.end(); ++it) {
        if (response.count(it.key()) > 0) {
            continue;
        }
        if (!execute_single(it.key(), it.value(), strict, false, response, status)) {
            return false;
        }
    }
    return true;
}

bool SmartProtocol::fetch_remaining_pages(const std::string& method, nlohmann::json& result, Status& status) {
    if (!result.is_object() || !result.contains("start_index") || !result.contains("sum") ||
        !result["sum"].is_number_integer()) {
        return true;
    }
    size_t sum = result["sum"].get<size_t>();

    std::string list_name;
    for (auto it = result.begin(); it != result.end(); ++it) {
        if (it.value().is_array()) {
            list_name = it.key();
            break;
        }
    }
    if (list_name.empty()) {
        return true;
    }

    while (result[list_name].size() < sum) {
        QueryResponse page;
        nlohmann::json params = {{"start_index", result[list_name].size()}};
        if (!execute_single(method, params, true, false, page, status)) {
            return false;
        }
        const ReplyFragment& next = page[method];
        if (next.is_error() || !next.data.is_object() || !next.data.contains(list_name) ||
            !next.data[list_name].is_array() || next.data[list_name].empty()) {
            LOG_ERROR("[SmartProtocol] Device " << host() << " returned empty results list for method " << method);
            break;
        }
        for (const auto& item : next.data[list_name]) {
            result[list_name].push_back(item);
        }
    }
    return true;
}

}  // namespace protocol
}  // namespace kasa
