#pragma once

#include "modules/smart/smart_module.hpp"

namespace kasa {
namespace modules {

// getDeviceInfo basic_info of a camera; critical
class CameraDeviceModule : public SmartModule {
public:
    CameraDeviceModule(device::Device& device, const std::string& name, const std::string& required_component);

    nlohmann::json query() const override;
    bool is_critical() const override { return true; }

protected:
    void initialize_features() override;
};

}  // namespace modules
}  // namespace kasa
