#include "energy_module.hpp"

namespace kasa {
namespace modules {

namespace {

std::optional<double> scaled(const nlohmann::json& data, const char* key, double divisor) {
    if (!data.is_object()) {
        return std::nullopt;
    }
    auto it = data.find(key);
    if (it == data.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>() / divisor;
}

device::FeatureValue to_feature_value(const std::optional<double>& value) {
    if (!value) {
        return std::monostate{};
    }
    return *value;
}

}  // namespace

nlohmann::json EnergyModule::query() const {
    nlohmann::json request = {{"get_energy_usage", nullptr}};
    if (supported_version() > 1) {
        request["get_current_power"] = nullptr;
    }
    return request;
}

nlohmann::json EnergyModule::energy_usage() const { return response("get_energy_usage"); }

std::optional<double> EnergyModule::current_consumption() const {
    if (supported_version() > 1) {
        auto power = scaled(response("get_current_power"), "current_power", 1.0);
        if (power) {
            return power;
        }
    }
    return scaled(energy_usage(), "current_power", 1000.0);
}

std::optional<double> EnergyModule::consumption_today() const {
    return scaled(energy_usage(), "today_energy", 1000.0);
}

std::optional<double> EnergyModule::consumption_this_month() const {
    return scaled(energy_usage(), "month_energy", 1000.0);
}

void EnergyModule::initialize_features() {
    device::FeatureDescriptor power;
    power.id = "current_consumption";
    power.name = "Current consumption";
    power.unit = "W";
    power.precision_hint = 1;
    power.category = device::FeatureCategory::PRIMARY;
    power.getter = [](const device::Module& module) {
        return to_feature_value(static_cast<const EnergyModule&>(module).current_consumption());
    };
    add_feature(power);

    device::FeatureDescriptor today;
    today.id = "consumption_today";
    today.name = "Today's consumption";
    today.unit = "kWh";
    today.precision_hint = 3;
    today.category = device::FeatureCategory::INFO;
    today.getter = [](const device::Module& module) {
        return to_feature_value(static_cast<const EnergyModule&>(module).consumption_today());
    };
    add_feature(today);

    device::FeatureDescriptor month;
    month.id = "consumption_this_month";
    month.name = "This month's consumption";
    month.unit = "kWh";
    month.precision_hint = 3;
    month.category = device::FeatureCategory::INFO;
    month.getter = [](const device::Module& module) {
        return to_feature_value(static_cast<const EnergyModule&>(module).consumption_this_month());
    };
    add_feature(month);
}

}  // namespace modules
}  // namespace kasa
