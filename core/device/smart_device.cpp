#include "smart_device.hpp"

#include "common/base64.hpp"
#include "logging/logger.hpp"
#include "protocol/child_protocol_wrapper.hpp"
#include "protocol/smart_error_code.hpp"

namespace kasa {
namespace device {

namespace {

// Fails the negotiation step when key is missing or errored
bool take_fragment(const protocol::QueryResponse& response, const std::string& key, const std::string& host,
                   nlohmann::json& data, Status& status) {
    auto it = response.find(key);
    if (it == response.end()) {
        status = Status::error(StatusCode::DEVICE_ERROR, host + " did not answer " + key);
        return false;
    }
    if (it->second.is_error()) {
        status = protocol::status_from_error_code(protocol::smart_error_code_from_int(it->second.error_code),
                                                  key + " on " + host);
        status.device_error_code = it->second.error_code;
        return false;
    }
    data = it->second.data;
    return true;
}

connection::DeviceConfig child_config(const connection::DeviceConfig& parent_config) {
    connection::DeviceConfig config = parent_config;
    config.connection_type.reset();
    return config;
}

}  // namespace

std::map<std::string, int> parse_component_list(const nlohmann::json& component_list) {
    std::map<std::string, int> components;
    if (!component_list.is_array()) {
        return components;
    }
    for (const auto& component : component_list) {
        if (!component.is_object() || !component.contains("id")) {
            continue;
        }
        const auto& version = component.value("ver_code", nlohmann::json(0));
        components[component["id"].get<std::string>()] =
            version.is_string() ? std::stoi(version.get<std::string>()) : version.get<int>();
    }
    return components;
}

std::string SmartDevice::alias() const {
    nlohmann::json info = sys_info();
    auto it = info.find("nickname");
    if (it == info.end() || !it->is_string()) {
        return "";
    }
    auto decoded = base64_decode(it->get<std::string>());
    return decoded ? *decoded : it->get<std::string>();
}

Status SmartDevice::set_state(bool on) { return query_key("set_device_info", {{"device_on", on}}); }

bool SmartDevice::is_hub() const {
    nlohmann::json info = sys_info();
    std::string type = info.value("type", std::string());
    return type == "SMART.TAPOHUB" || type == "SMART.KASAHUB";
}

bool SmartDevice::negotiate(Status& status) {
    nlohmann::json request = {
        {"component_nego", nullptr}, {"get_device_info", nullptr}, {"get_connect_cloud_state", nullptr}};
    protocol::QueryResponse response;
    if (!protocol().query(request, response)) {
        status = protocol().last_status();
        return false;
    }

    nlohmann::json components;
    nlohmann::json info;
    if (!take_fragment(response, "component_nego", host(), components, status) ||
        !take_fragment(response, "get_device_info", host(), info, status)) {
        return false;
    }
    try {
        set_components(parse_component_list(components.at("component_list")));
    } catch (const std::exception& e) {
        status = Status::error(StatusCode::UNSUPPORTED_DEVICE,
                               "Malformed component list from " + host() + ": " + e.what());
        return false;
    }
    set_sys_info(info);
    LOG_INFO("[Device " << host() << "] " << model() << " advertises " << this->components().size()
                        << " components");

    if (has_component("child_device") && children().empty()) {
        return create_children(status);
    }
    return true;
}

bool SmartDevice::create_children(Status& status) {
    nlohmann::json request = {{"get_child_device_component_list", nullptr}, {"get_child_device_list", nullptr}};
    protocol::QueryResponse response;
    if (!protocol().query(request, response)) {
        status = protocol().last_status();
        return false;
    }

    nlohmann::json component_lists;
    nlohmann::json child_list;
    if (!take_fragment(response, "get_child_device_component_list", host(), component_lists, status) ||
        !take_fragment(response, "get_child_device_list", host(), child_list, status)) {
        return false;
    }

    try {
        std::map<std::string, std::map<std::string, int>> child_components;
        for (const auto& entry : component_lists.at("child_component_list")) {
            child_components[entry.at("device_id").get<std::string>()] =
                parse_component_list(entry.at("component_list"));
        }
        for (const auto& info : child_list.at("child_device_list")) {
            std::string device_id = info.at("device_id").get<std::string>();
            auto it = child_components.find(device_id);
            if (it == child_components.end()) {
                LOG_WARN("[Device " << host() << "] No component list for child " << device_id << ", skipping");
                continue;
            }
            add_child(std::make_shared<SmartChildDevice>(*this, info, it->second, catalog()));
        }
    } catch (const std::exception& e) {
        status = Status::error(StatusCode::UNSUPPORTED_DEVICE, "Malformed child list from " + host() + ": " + e.what());
        return false;
    }
    LOG_DEBUG("[Device " << host() << "] Created " << children().size() << " children");
    return true;
}

void SmartDevice::add_refresh_keys(nlohmann::json& request) const {
    if (has_component("child_device")) {
        request["get_child_device_list"] = nullptr;
    }
}

void SmartDevice::apply_update(const protocol::QueryResponse& update) {
    auto info = update.find("get_device_info");
    if (info != update.end() && !info->second.is_error()) {
        set_sys_info(info->second.data);
    }

    auto child_list = update.find("get_child_device_list");
    if (child_list == update.end() || child_list->second.is_error() || !child_list->second.data.is_object()) {
        return;
    }
    auto entries = child_list->second.data.find("child_device_list");
    if (entries == child_list->second.data.end() || !entries->is_array()) {
        return;
    }
    for (const auto& entry : *entries) {
        if (!entry.is_object() || !entry.contains("device_id") || !entry["device_id"].is_string()) {
            continue;
        }
        auto child = std::dynamic_pointer_cast<SmartChildDevice>(get_child(entry["device_id"].get<std::string>()));
        if (child) {
            child->update_info(entry);
        }
    }
}

SmartChildDevice::SmartChildDevice(Device& parent, const nlohmann::json& info, std::map<std::string, int> components,
                                   const ModuleCatalog& catalog)
    : SmartDevice(child_config(parent.config()),
                  std::make_unique<protocol::ChildProtocolWrapper>(info.at("device_id").get<std::string>(),
                                                                   parent.protocol()),
                  catalog) {
    set_parent(&parent);
    set_sys_info(info);
    set_components(std::move(components));
}

}  // namespace device
}  // namespace kasa
