#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "device/device.hpp"
#include "device/module.hpp"

namespace kasa {
namespace modules {

/**
 * @brief Base for SMART and SMARTCAM modules
 *
 * A module with a query getter asks for {getter: null} on every refresh;
 * one without reads straight from the device's sys_info.
 */
class SmartModule : public device::Module {
public:
    SmartModule(device::Device& device, const std::string& name, const std::string& required_component,
                const std::string& query_getter = "");

    nlohmann::json query() const override;

protected:
    const std::string& query_getter() const { return query_getter_; }

    // Reply for one key of a multi-key query; data() itself when only one key is queried
    nlohmann::json response(const std::string& key) const;

private:
    std::string query_getter_;
};

// Getter helpers for feature declarations
nlohmann::json sys_info_field(const device::Device& device, const std::string& key);

}  // namespace modules
}  // namespace kasa
