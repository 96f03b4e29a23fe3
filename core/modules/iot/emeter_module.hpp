#pragma once

#include <optional>

#include "iot_module.hpp"

namespace kasa {
namespace modules {

/**
 * @brief Realtime energy readings of IOT plugs with metering
 *
 * Older firmware reports power/voltage/current/total in base units,
 * newer firmware power_mw/voltage_mv/current_ma/total_wh.
 */
class EmeterModule : public IotModule {
public:
    EmeterModule(device::Device& device, const std::string& name, const std::string& required_component);

    nlohmann::json query() const override { return query_for_command("get_realtime"); }

    // Only devices whose sys_info feature list carries ENE have a meter
    bool check_supported() override;

    std::optional<double> power_w() const;
    std::optional<double> voltage_v() const;
    std::optional<double> current_a() const;
    std::optional<double> total_kwh() const;

protected:
    void initialize_features() override;

private:
    std::optional<double> reading(const char* key, const char* scaled_key, double divisor) const;
};

}  // namespace modules
}  // namespace kasa
