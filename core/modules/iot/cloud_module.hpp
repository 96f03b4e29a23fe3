#pragma once

#include "iot_module.hpp"

namespace kasa {
namespace modules {

// cnCloud.get_info
class IotCloudModule : public IotModule {
public:
    IotCloudModule(device::Device& device, const std::string& name, const std::string& required_component);

    nlohmann::json query() const override { return query_for_command("get_info"); }

    bool is_connected() const;

protected:
    void initialize_features() override;
};

}  // namespace modules
}  // namespace kasa
