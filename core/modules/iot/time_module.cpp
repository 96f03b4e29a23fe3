#include "time_module.hpp"

#include <cstdio>

namespace kasa {
namespace modules {

IotTimeModule::IotTimeModule(device::Device& device, const std::string& name, const std::string& required_component)
    : IotModule(device, name, required_component, "time") {}

nlohmann::json IotTimeModule::query() const {
    return query_for_command("get_timezone", nlohmann::json(), query_for_command("get_time"));
}

std::string IotTimeModule::local_time() const {
    nlohmann::json time = command_data("get_time");
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d", time.at("year").get<int>(),
                  time.at("month").get<int>(), time.at("mday").get<int>(), time.at("hour").get<int>(),
                  time.at("min").get<int>(), time.at("sec").get<int>());
    return buffer;
}

int IotTimeModule::timezone_index() const {
    nlohmann::json timezone = command_data("get_timezone");
    if (!timezone.is_object()) {
        return -1;
    }
    return timezone.value("index", -1);
}

void IotTimeModule::initialize_features() {
    device::FeatureDescriptor time;
    time.id = "device_time";
    time.name = "Device time";
    time.category = device::FeatureCategory::DEBUG;
    time.getter = [](const device::Module& module) -> device::FeatureValue {
        return static_cast<const IotTimeModule&>(module).local_time();
    };
    add_feature(time);
}

}  // namespace modules
}  // namespace kasa
