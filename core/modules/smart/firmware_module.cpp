#include "firmware_module.hpp"

#include "cloud_module.hpp"

namespace kasa {
namespace modules {

nlohmann::json FirmwareModule::query() const {
    nlohmann::json request = {{"get_latest_fw", nullptr}};
    if (supported_version() > 1) {
        request["get_auto_update_info"] = nullptr;
    }
    return request;
}

bool FirmwareModule::cloud_connected() const {
    auto cloud = device_.get_module_as<CloudModule>("Cloud");
    return cloud && cloud->is_connected();
}

std::optional<bool> FirmwareModule::update_available() const {
    if (!cloud_connected()) {
        return std::nullopt;
    }
    nlohmann::json latest = response("get_latest_fw");
    return latest.is_object() && latest.value("type", 0) != 0;
}

std::string FirmwareModule::latest_version() const {
    nlohmann::json latest = response("get_latest_fw");
    if (!latest.is_object()) {
        return "";
    }
    return latest.value("fw_ver", std::string());
}

bool FirmwareModule::auto_update_enabled() const {
    nlohmann::json info = response("get_auto_update_info");
    return info.is_object() && info.value("enable", false);
}

Status FirmwareModule::set_auto_update_enabled(bool enabled) {
    nlohmann::json params = response("get_auto_update_info");
    if (!params.is_object()) {
        params = nlohmann::json::object();
    }
    params["enable"] = enabled;
    return call("set_auto_update_info", params);
}

void FirmwareModule::initialize_features() {
    if (supported_version() > 1) {
        device::FeatureDescriptor auto_update;
        auto_update.id = "auto_update_enabled";
        auto_update.name = "Auto update enabled";
        auto_update.type = device::FeatureType::SWITCH;
        auto_update.getter = [](const device::Module& module) -> device::FeatureValue {
            return static_cast<const FirmwareModule&>(module).auto_update_enabled();
        };
        auto_update.setter = [](device::Module& module, const device::FeatureValue& value) {
            return static_cast<FirmwareModule&>(module).set_auto_update_enabled(std::get<bool>(value));
        };
        add_feature(auto_update);
    }

    device::FeatureDescriptor available;
    available.id = "update_available";
    available.name = "Update available";
    available.type = device::FeatureType::BINARY_SENSOR;
    available.category = device::FeatureCategory::INFO;
    available.getter = [](const device::Module& module) -> device::FeatureValue {
        auto available = static_cast<const FirmwareModule&>(module).update_available();
        if (!available) {
            return std::monostate{};
        }
        return *available;
    };
    add_feature(available);
}

}  // namespace modules
}  // namespace kasa
