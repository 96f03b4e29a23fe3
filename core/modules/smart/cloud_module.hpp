#pragma once

#include "smart_module.hpp"

namespace kasa {
namespace modules {

// Cloud connection state, polled once a minute
class CloudModule : public SmartModule {
public:
    CloudModule(device::Device& device, const std::string& name, const std::string& required_component);

    std::chrono::milliseconds minimum_update_interval() const override { return std::chrono::seconds(60); }

    bool is_connected() const;

protected:
    void initialize_features() override;
};

}  // namespace modules
}  // namespace kasa
