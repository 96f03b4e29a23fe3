#include "smart_module.hpp"

namespace kasa {
namespace modules {

SmartModule::SmartModule(device::Device& device, const std::string& name, const std::string& required_component,
                         const std::string& query_getter)
    : device::Module(device, name, required_component), query_getter_(query_getter) {}

nlohmann::json SmartModule::query() const {
    nlohmann::json request = nlohmann::json::object();
    if (!query_getter_.empty()) {
        request[query_getter_] = nullptr;
    }
    return request;
}

nlohmann::json SmartModule::response(const std::string& key) const {
    nlohmann::json data = this->data();
    if (query().size() <= 1) {
        return data;
    }
    if (data.is_object() && data.contains(key)) {
        return data[key];
    }
    return nullptr;
}

nlohmann::json sys_info_field(const device::Device& device, const std::string& key) {
    nlohmann::json info = device.sys_info();
    if (info.is_object() && info.contains(key)) {
        return info[key];
    }
    return nullptr;
}

}  // namespace modules
}  // namespace kasa
