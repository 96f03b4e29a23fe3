#include "auto_off_module.hpp"

namespace kasa {
namespace modules {

AutoOffModule::AutoOffModule(device::Device& device, const std::string& name, const std::string& required_component)
    : SmartModule(device, name, required_component, "get_auto_off_config") {}

nlohmann::json AutoOffModule::query() const { return {{query_getter(), {{"start_index", 0}}}}; }

bool AutoOffModule::enabled() const { return data().at("enable").get<bool>(); }

Status AutoOffModule::set_enabled(bool enable) {
    return call("set_auto_off_config", {{"enable", enable}, {"delay_min", delay_minutes()}});
}

int AutoOffModule::delay_minutes() const { return data().at("delay_min").get<int>(); }

Status AutoOffModule::set_delay_minutes(int delay) {
    return call("set_auto_off_config", {{"delay_min", delay}, {"enable", enabled()}});
}

std::optional<int> AutoOffModule::remaining_seconds() const {
    nlohmann::json info = device_.sys_info();
    if (info.value("auto_off_status", std::string()) != "on") {
        return std::nullopt;
    }
    return info.value("auto_off_remain_time", 0);
}

void AutoOffModule::initialize_features() {
    device::FeatureDescriptor enabled;
    enabled.id = "auto_off_enabled";
    enabled.name = "Auto off enabled";
    enabled.type = device::FeatureType::SWITCH;
    enabled.getter = [](const device::Module& module) -> device::FeatureValue {
        return static_cast<const AutoOffModule&>(module).enabled();
    };
    enabled.setter = [](device::Module& module, const device::FeatureValue& value) {
        return static_cast<AutoOffModule&>(module).set_enabled(std::get<bool>(value));
    };
    add_feature(enabled);

    device::FeatureDescriptor minutes;
    minutes.id = "auto_off_minutes";
    minutes.name = "Auto off minutes";
    minutes.type = device::FeatureType::NUMBER;
    minutes.unit = "min";
    minutes.minimum_value = 0;
    minutes.maximum_value = 10080;
    minutes.getter = [](const device::Module& module) -> device::FeatureValue {
        return static_cast<int64_t>(static_cast<const AutoOffModule&>(module).delay_minutes());
    };
    minutes.setter = [](device::Module& module, const device::FeatureValue& value) {
        int delay = std::holds_alternative<int64_t>(value) ? static_cast<int>(std::get<int64_t>(value))
                                                           : static_cast<int>(std::get<double>(value));
        return static_cast<AutoOffModule&>(module).set_delay_minutes(delay);
    };
    add_feature(minutes);

    device::FeatureDescriptor remaining;
    remaining.id = "auto_off_remaining";
    remaining.name = "Auto off remaining";
    remaining.unit = "s";
    remaining.category = device::FeatureCategory::INFO;
    remaining.getter = [](const device::Module& module) -> device::FeatureValue {
        auto seconds = static_cast<const AutoOffModule&>(module).remaining_seconds();
        if (!seconds) {
            return std::monostate{};
        }
        return static_cast<int64_t>(*seconds);
    };
    add_feature(remaining);
}

}  // namespace modules
}  // namespace kasa
