#include "emeter_module.hpp"

namespace kasa {
namespace modules {

EmeterModule::EmeterModule(device::Device& device, const std::string& name, const std::string& required_component)
    : IotModule(device, name, required_component, "emeter") {}

bool EmeterModule::check_supported() {
    nlohmann::json info = device_.sys_info();
    auto it = info.find("feature");
    return it != info.end() && it->is_string() && it->get<std::string>().find("ENE") != std::string::npos;
}

std::optional<double> EmeterModule::reading(const char* key, const char* scaled_key, double divisor) const {
    nlohmann::json realtime = command_data("get_realtime");
    if (!realtime.is_object()) {
        return std::nullopt;
    }
    auto it = realtime.find(key);
    if (it != realtime.end() && it->is_number()) {
        return it->get<double>();
    }
    it = realtime.find(scaled_key);
    if (it != realtime.end() && it->is_number()) {
        return it->get<double>() / divisor;
    }
    return std::nullopt;
}

std::optional<double> EmeterModule::power_w() const { return reading("power", "power_mw", 1000.0); }

std::optional<double> EmeterModule::voltage_v() const { return reading("voltage", "voltage_mv", 1000.0); }

std::optional<double> EmeterModule::current_a() const { return reading("current", "current_ma", 1000.0); }

std::optional<double> EmeterModule::total_kwh() const { return reading("total", "total_wh", 1000.0); }

namespace {

using Reader = std::optional<double> (EmeterModule::*)() const;

device::FeatureDescriptor meter_feature(const std::string& id, const std::string& name, const std::string& unit,
                                        int precision, device::FeatureCategory category, Reader reader) {
    device::FeatureDescriptor descriptor;
    descriptor.id = id;
    descriptor.name = name;
    descriptor.unit = unit;
    descriptor.precision_hint = precision;
    descriptor.category = category;
    descriptor.getter = [reader](const device::Module& module) -> device::FeatureValue {
        auto value = (static_cast<const EmeterModule&>(module).*reader)();
        if (!value) {
            return std::monostate{};
        }
        return *value;
    };
    return descriptor;
}

}  // namespace

void EmeterModule::initialize_features() {
    add_feature(meter_feature("current_power_w", "Current consumption", "W", 1, device::FeatureCategory::PRIMARY,
                              &EmeterModule::power_w));
    add_feature(meter_feature("voltage", "Voltage", "V", 1, device::FeatureCategory::PRIMARY,
                              &EmeterModule::voltage_v));
    add_feature(meter_feature("current_a", "Current", "A", 2, device::FeatureCategory::PRIMARY,
                              &EmeterModule::current_a));
    add_feature(meter_feature("total_energy_kwh", "Total consumption since reboot", "kWh", 3,
                              device::FeatureCategory::INFO, &EmeterModule::total_kwh));
}

}  // namespace modules
}  // namespace kasa
