#pragma once

#include "iot_module.hpp"

namespace kasa {
namespace modules {

// system.get_sysinfo, the IOT device's core information; critical
class SysInfoModule : public IotModule {
public:
    SysInfoModule(device::Device& device, const std::string& name, const std::string& required_component);

    nlohmann::json query() const override { return query_for_command("get_sysinfo"); }
    bool is_critical() const override { return true; }

    bool led_enabled() const;
    Status set_led_enabled(bool enabled);

protected:
    void initialize_features() override;
};

}  // namespace modules
}  // namespace kasa
