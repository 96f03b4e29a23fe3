#pragma once

#include <optional>

#include "smart_module.hpp"

namespace kasa {
namespace modules {

/**
 * @brief Energy monitoring
 *
 * Version 1 reports everything through get_energy_usage (power in mW);
 * later versions add get_current_power (power in W).
 */
class EnergyModule : public SmartModule {
public:
    using SmartModule::SmartModule;

    nlohmann::json query() const override;

    // Watts
    std::optional<double> current_consumption() const;
    // kWh
    std::optional<double> consumption_today() const;
    std::optional<double> consumption_this_month() const;

protected:
    void initialize_features() override;

private:
    nlohmann::json energy_usage() const;
};

}  // namespace modules
}  // namespace kasa
