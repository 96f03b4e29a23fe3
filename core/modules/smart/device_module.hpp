#pragma once

#include "smart_module.hpp"

namespace kasa {
namespace modules {

/**
 * @brief Core device information for SMART devices
 *
 * Carries get_device_info (and get_device_usage from component version 2)
 * and the device level features. Children of a hub get their info from the
 * hub's child list and query nothing themselves.
 *
 * Critical: never disabled by errors.
 */
class DeviceModule : public SmartModule {
public:
    using SmartModule::SmartModule;

    nlohmann::json query() const override;
    bool is_critical() const override { return true; }

protected:
    void initialize_features() override;

private:
    bool is_hub_child() const;
};

}  // namespace modules
}  // namespace kasa
