#include "iot_protocol.hpp"

#include "logging/logger.hpp"
#include "redaction.hpp"

namespace kasa {
namespace protocol {

int iot_error_code(const nlohmann::json& reply) {
    if (!reply.is_object()) {
        return 0;
    }
    auto err = reply.find("err_code");
    if (err != reply.end() && err->is_number_integer() && err->get<int>() != 0) {
        return err->get<int>();
    }
    for (auto it = reply.begin(); it != reply.end(); ++it) {
        if (it.value().is_object()) {
            auto nested = it.value().find("err_code");
            if (nested != it.value().end() && nested->is_number_integer() && nested->get<int>() != 0) {
                return nested->get<int>();
            }
        }
    }
    return 0;
}

bool IotProtocol::execute(const nlohmann::json& request, QueryResponse& response, Status& status) {
    nlohmann::json reply;
    if (!send_document(request, reply, status, "iot")) {
        return false;
    }
    for (auto it = reply.begin(); it != reply.end(); ++it) {
        int code = iot_error_code(it.value());
        if (code != 0) {
            LOG_DEBUG("[IotProtocol] " << host() << " module " << it.key() << " err_code " << code);
            ReplyFragment fragment;
            fragment.error_code = code;
            fragment.data = it.value();
            response[it.key()] = fragment;
        } else {
            response[it.key()] = ReplyFragment::ok(it.value());
        }
    }
    return true;
}

nlohmann::json IotProtocol::redact_for_log(const nlohmann::json& data) const {
    return redact_data(data, iot_redactors());
}

}  // namespace protocol
}  // namespace kasa
