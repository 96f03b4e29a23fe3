#include "device_module.hpp"

#include "common/base64.hpp"

namespace kasa {
namespace modules {

bool DeviceModule::is_hub_child() const {
    return device_.parent() != nullptr && device_.parent()->is_hub();
}

nlohmann::json DeviceModule::query() const {
    nlohmann::json request = nlohmann::json::object();
    if (is_hub_child()) {
        return request;
    }
    request["get_device_info"] = nullptr;
    if (supported_version() >= 2) {
        request["get_device_usage"] = nullptr;
    }
    return request;
}

void DeviceModule::initialize_features() {
    device::FeatureDescriptor device_id;
    device_id.id = "device_id";
    device_id.name = "Device ID";
    device_id.category = device::FeatureCategory::DEBUG;
    device_id.getter = [](const device::Module& module) -> device::FeatureValue {
        return module.device().device_id();
    };
    add_feature(device_id);

    if (device_.sys_info().contains("device_on")) {
        device::FeatureDescriptor state;
        state.id = "state";
        state.name = "State";
        state.type = device::FeatureType::SWITCH;
        state.category = device::FeatureCategory::PRIMARY;
        state.getter = [](const device::Module& module) -> device::FeatureValue {
            return module.device().is_on();
        };
        state.setter = [](device::Module& module, const device::FeatureValue& value) {
            return module.device().set_state(std::get<bool>(value));
        };
        add_feature(state);
    }

    if (device_.sys_info().contains("rssi")) {
        device::FeatureDescriptor rssi;
        rssi.id = "rssi";
        rssi.name = "RSSI";
        rssi.unit = "dBm";
        rssi.icon = "mdi:signal";
        rssi.category = device::FeatureCategory::DEBUG;
        rssi.getter = [](const device::Module& module) -> device::FeatureValue {
            auto value = module.device().rssi();
            if (!value) {
                return std::monostate{};
            }
            return static_cast<int64_t>(*value);
        };
        add_feature(rssi);
    }

    if (device_.sys_info().contains("ssid")) {
        device::FeatureDescriptor ssid;
        ssid.id = "ssid";
        ssid.name = "SSID";
        ssid.icon = "mdi:wifi";
        ssid.category = device::FeatureCategory::DEBUG;
        ssid.getter = [](const device::Module& module) -> device::FeatureValue {
            std::string encoded = module.device().sys_info().at("ssid").get<std::string>();
            auto decoded = base64_decode(encoded);
            return decoded ? *decoded : encoded;
        };
        add_feature(ssid);
    }

    if (device_.sys_info().contains("signal_level")) {
        device::FeatureDescriptor signal_level;
        signal_level.id = "signal_level";
        signal_level.name = "Signal Level";
        signal_level.icon = "mdi:signal";
        signal_level.category = device::FeatureCategory::INFO;
        signal_level.getter = [](const device::Module& module) -> device::FeatureValue {
            return module.device().sys_info().at("signal_level").get<int64_t>();
        };
        add_feature(signal_level);
    }
}

}  // namespace modules
}  // namespace kasa
