#pragma once

#include <atomic>
#include <string>

#include "device.hpp"

namespace kasa {
namespace device {

/**
 * @brief Camera speaking the SMARTCAM dialect of SMART
 *
 * Components come from getAppComponentList, the info block from
 * getDeviceInfo basic_info. "On" means the lens mask is off; the mask state
 * is read with every refresh.
 */
class SmartCamDevice : public Device {
public:
    using Device::Device;

    std::string alias() const override;
    std::string model() const override;
    std::string device_id() const override;
    std::string hw_version() const override;
    std::string fw_version() const override;
    bool is_on() const override { return !lens_mask_enabled_.load(); }
    Status set_state(bool on) override;

protected:
    bool negotiate(Status& status) override;
    void add_refresh_keys(nlohmann::json& request) const override;
    void apply_update(const protocol::QueryResponse& update) override;

private:
    std::atomic<bool> lens_mask_enabled_{false};

    std::string info_field(const char* key) const;
    void read_lens_mask(const protocol::QueryResponse& response);
};

}  // namespace device
}  // namespace kasa
