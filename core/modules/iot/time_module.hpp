#pragma once

#include <string>

#include "iot_module.hpp"

namespace kasa {
namespace modules {

// time.get_time + time.get_timezone
class IotTimeModule : public IotModule {
public:
    IotTimeModule(device::Device& device, const std::string& name, const std::string& required_component);

    nlohmann::json query() const override;

    // "YYYY-MM-DD HH:MM:SS" in device local time
    std::string local_time() const;

    // Device timezone table index, -1 when unknown
    int timezone_index() const;

protected:
    void initialize_features() override;
};

}  // namespace modules
}  // namespace kasa
