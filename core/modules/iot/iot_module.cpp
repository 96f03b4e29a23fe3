#include "iot_module.hpp"

#include "logging/logger.hpp"
#include "protocol/smart_error_code.hpp"

namespace kasa {
namespace modules {

IotModule::IotModule(device::Device& device, const std::string& name, const std::string& required_component,
                     const std::string& module_key)
    : device::Module(device, name, required_component), module_key_(module_key) {}

nlohmann::json IotModule::query_for_command(const std::string& command, const nlohmann::json& params,
                                            nlohmann::json request) const {
    request[module_key_][command] = params.is_null() ? nlohmann::json::object() : params;
    return request;
}

nlohmann::json IotModule::command_data(const std::string& command) const {
    nlohmann::json data = this->data();
    if (data.is_object() && data.contains(command)) {
        return data[command];
    }
    return nullptr;
}

Status IotModule::call(const std::string& method, const nlohmann::json& params, nlohmann::json* result) {
    nlohmann::json payload = {{method, params.is_null() ? nlohmann::json::object() : params}};
    nlohmann::json reply;
    Status status = device_.query_key(module_key_, payload, &reply);
    reset_update_time();
    if (!status.ok()) {
        LOG_WARN("[Module] " << name() << " call " << module_key_ << "." << method << " failed: " << status.message);
        return status;
    }
    if (result != nullptr) {
        *result = reply.is_object() && reply.contains(method) ? reply[method] : reply;
    }
    return status;
}

bool IotModule::is_supported() const {
    auto update = device_.last_update();
    auto it = update->find(module_key_);
    if (it == update->end()) {
        return true;
    }
    const protocol::ReplyFragment& fragment = it->second;
    return !fragment.is_error() ||
           fragment.error_code == static_cast<int>(protocol::SmartErrorCode::INTERNAL_QUERY_ERROR);
}

}  // namespace modules
}  // namespace kasa
