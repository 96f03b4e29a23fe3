#pragma once

#include <optional>

#include "smart_module.hpp"

namespace kasa {
namespace modules {

/**
 * @brief Firmware update availability
 *
 * Polled once a day. Component version 2 adds the auto-update setting.
 */
class FirmwareModule : public SmartModule {
public:
    using SmartModule::SmartModule;

    nlohmann::json query() const override;
    std::chrono::milliseconds minimum_update_interval() const override { return std::chrono::hours(24); }

    // Empty while the device is not connected to the cloud
    std::optional<bool> update_available() const;
    std::string latest_version() const;

    bool auto_update_enabled() const;
    Status set_auto_update_enabled(bool enabled);

protected:
    void initialize_features() override;

private:
    bool cloud_connected() const;
};

}  // namespace modules
}  // namespace kasa
