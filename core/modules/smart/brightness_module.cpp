#include "brightness_module.hpp"

namespace kasa {
namespace modules {

bool BrightnessModule::check_supported() { return device_.sys_info().contains("brightness"); }

int BrightnessModule::brightness() const { return data().at("brightness").get<int>(); }

Status BrightnessModule::set_brightness(int brightness) {
    if (brightness < kMinBrightness || brightness > kMaxBrightness) {
        return Status::error(StatusCode::INVALID_ARGUMENT,
                             "Invalid brightness value: " + std::to_string(brightness) + " (valid range: 0-100%)");
    }
    if (brightness == 0) {
        return device_.set_state(false);
    }
    return call("set_device_info", {{"brightness", brightness}});
}

void BrightnessModule::initialize_features() {
    device::FeatureDescriptor level;
    level.id = "brightness";
    level.name = "Brightness";
    level.type = device::FeatureType::NUMBER;
    level.category = device::FeatureCategory::PRIMARY;
    level.unit = "%";
    level.minimum_value = kMinBrightness;
    level.maximum_value = kMaxBrightness;
    level.getter = [](const device::Module& module) -> device::FeatureValue {
        return static_cast<int64_t>(static_cast<const BrightnessModule&>(module).brightness());
    };
    level.setter = [](device::Module& module, const device::FeatureValue& value) {
        int brightness = std::holds_alternative<int64_t>(value) ? static_cast<int>(std::get<int64_t>(value))
                                                                : static_cast<int>(std::get<double>(value));
        return static_cast<BrightnessModule&>(module).set_brightness(brightness);
    };
    add_feature(level);
}

}  // namespace modules
}  // namespace kasa
