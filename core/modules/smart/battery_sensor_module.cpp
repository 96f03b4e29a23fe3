#include "battery_sensor_module.hpp"

namespace kasa {
namespace modules {

int BatterySensorModule::battery_level() const { return data().at("battery_percentage").get<int>(); }

bool BatterySensorModule::battery_low() const {
    nlohmann::json info = data();
    if (info.contains("at_low_battery")) {
        return info["at_low_battery"].get<bool>();
    }
    return info.at("is_low").get<bool>();
}

void BatterySensorModule::initialize_features() {
    nlohmann::json info = device_.sys_info();

    if (info.contains("at_low_battery") || info.contains("is_low")) {
        device::FeatureDescriptor low;
        low.id = "battery_low";
        low.name = "Battery low";
        low.icon = "mdi:alert";
        low.type = device::FeatureType::BINARY_SENSOR;
        low.category = device::FeatureCategory::DEBUG;
        low.getter = [](const device::Module& module) -> device::FeatureValue {
            return static_cast<const BatterySensorModule&>(module).battery_low();
        };
        add_feature(low);
    }

    if (info.contains("battery_percentage")) {
        device::FeatureDescriptor level;
        level.id = "battery_level";
        level.name = "Battery level";
        level.icon = "mdi:battery";
        level.unit = "%";
        level.category = device::FeatureCategory::INFO;
        level.getter = [](const device::Module& module) -> device::FeatureValue {
            return static_cast<int64_t>(static_cast<const BatterySensorModule&>(module).battery_level());
        };
        add_feature(level);
    }
}

}  // namespace modules
}  // namespace kasa
