#include "time_module.hpp"

#include <ctime>

namespace kasa {
namespace modules {

TimeModule::TimeModule(device::Device& device, const std::string& name, const std::string& required_component)
    : SmartModule(device, name, required_component, "get_device_time") {}

bool TimeModule::check_supported() { return device_.parent() == nullptr || !device_.parent()->is_hub(); }

void TimeModule::post_update_hook() {
    nlohmann::json data = this->data();
    std::lock_guard<std::mutex> lock(mutex_);
    utc_offset_minutes_ = data.value("time_diff", 0);
    region_ = data.value("region", std::string());
}

int TimeModule::utc_offset_minutes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return utc_offset_minutes_;
}

std::string TimeModule::region() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return region_;
}

std::string TimeModule::local_time() const {
    int64_t timestamp = data().at("timestamp").get<int64_t>();
    std::time_t local = static_cast<std::time_t>(timestamp + utc_offset_minutes() * 60);
    std::tm parts{};
    gmtime_r(&local, &parts);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &parts);
    return buffer;
}

Status TimeModule::set_time(int64_t timestamp, int utc_offset_minutes, const std::string& region) {
    nlohmann::json params = {{"timestamp", timestamp}, {"time_diff", utc_offset_minutes}};
    if (!region.empty()) {
        params["region"] = region;
    }
    return call("set_device_time", params);
}

void TimeModule::initialize_features() {
    device::FeatureDescriptor time;
    time.id = "device_time";
    time.name = "Device time";
    time.category = device::FeatureCategory::DEBUG;
    time.getter = [](const device::Module& module) -> device::FeatureValue {
        return static_cast<const TimeModule&>(module).local_time();
    };
    add_feature(time);
}

}  // namespace modules
}  // namespace kasa
