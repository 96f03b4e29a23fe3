#include "smartcam_device.hpp"

#include "logging/logger.hpp"
#include "protocol/smart_error_code.hpp"

namespace kasa {
namespace device {

namespace {

const nlohmann::json& lens_mask_request() {
    static const nlohmann::json request = {{"lens_mask", {{"name", nlohmann::json::array({"lens_mask_info"})}}}};
    return request;
}

nlohmann::json basic_info(const nlohmann::json& device_info_reply) {
    if (device_info_reply.is_object() && device_info_reply.contains("device_info") &&
        device_info_reply["device_info"].is_object() && device_info_reply["device_info"].contains("basic_info")) {
        return device_info_reply["device_info"]["basic_info"];
    }
    return nullptr;
}

}  // namespace

std::string SmartCamDevice::info_field(const char* key) const {
    nlohmann::json info = sys_info();
    auto it = info.find(key);
    if (it == info.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::string SmartCamDevice::alias() const { return info_field("device_alias"); }

std::string SmartCamDevice::model() const { return info_field("device_model"); }

std::string SmartCamDevice::device_id() const { return info_field("dev_id"); }

std::string SmartCamDevice::hw_version() const { return info_field("hw_version"); }

std::string SmartCamDevice::fw_version() const { return info_field("sw_version"); }

Status SmartCamDevice::set_state(bool on) {
    nlohmann::json params = {{"lens_mask", {{"lens_mask_info", {{"enabled", on ? "off" : "on"}}}}}};
    return query_key("setLensMaskConfig", params);
}

bool SmartCamDevice::negotiate(Status& status) {
    nlohmann::json request = {
        {"getAppComponentList", {{"app_component", {{"name", "app_component_list"}}}}},
        {"getDeviceInfo", {{"device_info", {{"name", nlohmann::json::array({"basic_info"})}}}}}};
    protocol::QueryResponse response;
    if (!protocol().query(request, response)) {
        status = protocol().last_status();
        return false;
    }

    for (const char* key : {"getAppComponentList", "getDeviceInfo"}) {
        auto it = response.find(key);
        if (it == response.end() || it->second.is_error()) {
            int code = it == response.end() ? static_cast<int>(protocol::SmartErrorCode::INTERNAL_QUERY_ERROR)
                                            : it->second.error_code;
            status = protocol::status_from_error_code(protocol::smart_error_code_from_int(code),
                                                      std::string(key) + " on " + host());
            status.device_error_code = code;
            return false;
        }
    }

    const nlohmann::json& app_component = response["getAppComponentList"].data;
    nlohmann::json info = basic_info(response["getDeviceInfo"].data);
    if (!app_component.is_object() || !app_component.contains("app_component") ||
        !app_component["app_component"].is_object() || !info.is_object()) {
        status = Status::error(StatusCode::UNSUPPORTED_DEVICE, "Malformed camera info from " + host());
        return false;
    }

    std::map<std::string, int> components;
    const nlohmann::json& list = app_component["app_component"].value("app_component_list", nlohmann::json::array());
    for (const auto& component : list) {
        if (component.is_object() && component.contains("name") && component["name"].is_string()) {
            components[component["name"].get<std::string>()] = component.value("version", 0);
        }
    }
    set_components(std::move(components));
    set_sys_info(info);
    LOG_INFO("[Device " << host() << "] Camera " << model() << " advertises " << this->components().size()
                        << " components");
    return true;
}

void SmartCamDevice::add_refresh_keys(nlohmann::json& request) const {
    if (has_component("lensMask")) {
        request["getLensMaskConfig"] = lens_mask_request();
    }
}

void SmartCamDevice::apply_update(const protocol::QueryResponse& update) {
    auto device_info = update.find("getDeviceInfo");
    if (device_info != update.end() && !device_info->second.is_error()) {
        nlohmann::json info = basic_info(device_info->second.data);
        if (info.is_object()) {
            set_sys_info(info);
        }
    }
    read_lens_mask(update);
}

void SmartCamDevice::read_lens_mask(const protocol::QueryResponse& response) {
    auto it = response.find("getLensMaskConfig");
    if (it == response.end() || it->second.is_error()) {
        return;
    }
    const nlohmann::json& data = it->second.data;
    if (!data.is_object() || !data.contains("lens_mask") || !data["lens_mask"].is_object() ||
        !data["lens_mask"].contains("lens_mask_info")) {
        return;
    }
    const nlohmann::json& mask = data["lens_mask"]["lens_mask_info"];
    lens_mask_enabled_.store(mask.is_object() && mask.value("enabled", std::string("off")) == "on");
}

}  // namespace device
}  // namespace kasa
