#pragma once

#include <optional>

#include "smart_module.hpp"

namespace kasa {
namespace modules {

// Switches the device off a configurable number of minutes after it was turned on
class AutoOffModule : public SmartModule {
public:
    AutoOffModule(device::Device& device, const std::string& name, const std::string& required_component);

    nlohmann::json query() const override;

    bool enabled() const;
    Status set_enabled(bool enable);

    int delay_minutes() const;
    Status set_delay_minutes(int delay);

    // Seconds until the running timer fires, empty when no timer runs
    std::optional<int> remaining_seconds() const;

protected:
    void initialize_features() override;
};

}  // namespace modules
}  // namespace kasa
