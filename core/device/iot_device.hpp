#pragma once

#include <string>

#include "device.hpp"

namespace kasa {
namespace device {

/**
 * @brief Legacy Kasa device speaking the IOT protocol
 *
 * IOT devices advertise no components: the info block comes from
 * system.get_sysinfo and every catalog module is created, to be dropped
 * once the device answers its query with an err_code.
 */
class IotDevice : public Device {
public:
    using Device::Device;

    std::string mac() const override;
    std::string device_id() const override;
    std::string fw_version() const override;
    bool is_on() const override;
    Status set_state(bool on) override;

protected:
    bool negotiate(Status& status) override;
    void apply_update(const protocol::QueryResponse& update) override;
};

}  // namespace device
}  // namespace kasa
