#pragma once

#include "smart_module.hpp"

namespace kasa {
namespace modules {

// Dimmer level, read from sys_info
class BrightnessModule : public SmartModule {
public:
    static constexpr int kMinBrightness = 0;
    static constexpr int kMaxBrightness = 100;

    using SmartModule::SmartModule;

    bool check_supported() override;

    int brightness() const;

    // 0 turns the device off
    Status set_brightness(int brightness);

protected:
    void initialize_features() override;
};

}  // namespace modules
}  // namespace kasa
