#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "device/device.hpp"
#include "device/module.hpp"

namespace kasa {
namespace modules {

/**
 * @brief Base for legacy IOT modules
 *
 * IOT requests are addressed by module key ("system", "emeter", ...), each
 * carrying one or more commands: {module_key: {command: params}}. IOT
 * devices advertise no components; a module the device does not implement
 * answers with err_code and is dropped after that refresh.
 */
class IotModule : public device::Module {
public:
    IotModule(device::Device& device, const std::string& name, const std::string& required_component,
              const std::string& module_key);

    const std::string& module_key() const { return module_key_; }

    Status call(const std::string& method, const nlohmann::json& params = nlohmann::json(),
                nlohmann::json* result = nullptr) override;

    bool is_supported() const override;

protected:
    // {module_key: {command: params}}, merged into request when given
    nlohmann::json query_for_command(const std::string& command, const nlohmann::json& params = nlohmann::json(),
                                     nlohmann::json request = nlohmann::json::object()) const;

    // Reply of one command from this module's data
    nlohmann::json command_data(const std::string& command) const;

private:
    std::string module_key_;
};

}  // namespace modules
}  // namespace kasa
