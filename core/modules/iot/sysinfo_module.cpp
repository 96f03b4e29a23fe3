#include "sysinfo_module.hpp"

namespace kasa {
namespace modules {

SysInfoModule::SysInfoModule(device::Device& device, const std::string& name, const std::string& required_component)
    : IotModule(device, name, required_component, "system") {}

bool SysInfoModule::led_enabled() const { return device_.sys_info().value("led_off", 0) == 0; }

Status SysInfoModule::set_led_enabled(bool enabled) { return call("set_led_off", {{"off", enabled ? 0 : 1}}); }

void SysInfoModule::initialize_features() {
    nlohmann::json info = device_.sys_info();

    device::FeatureDescriptor device_id;
    device_id.id = "device_id";
    device_id.name = "Device ID";
    device_id.category = device::FeatureCategory::DEBUG;
    device_id.getter = [](const device::Module& module) -> device::FeatureValue {
        return module.device().device_id();
    };
    add_feature(device_id);

    if (info.contains("relay_state")) {
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

    if (info.contains("rssi")) {
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

    if (info.contains("led_off")) {
        device::FeatureDescriptor led;
        led.id = "led";
        led.name = "LED";
        led.icon = "mdi:led-on";
        led.type = device::FeatureType::SWITCH;
        led.getter = [](const device::Module& module) -> device::FeatureValue {
            return static_cast<const SysInfoModule&>(module).led_enabled();
        };
        led.setter = [](device::Module& module, const device::FeatureValue& value) {
            return static_cast<SysInfoModule&>(module).set_led_enabled(std::get<bool>(value));
        };
        add_feature(led);
    }
}

}  // namespace modules
}  // namespace kasa
