#pragma once

#include "smart_module.hpp"

namespace kasa {
namespace modules {

// Battery level and low-battery flag of battery powered hub children
class BatterySensorModule : public SmartModule {
public:
    using SmartModule::SmartModule;

    int battery_level() const;
    bool battery_low() const;

protected:
    void initialize_features() override;
};

}  // namespace modules
}  // namespace kasa
