#pragma once

#include <map>
#include <memory>
#include <string>

#include "device.hpp"

namespace kasa {
namespace device {

/**
 * @brief Device speaking the SMART protocol (Tapo and newer Kasa)
 *
 * Negotiation reads component_nego, get_device_info and
 * get_connect_cloud_state. Devices advertising "child_device" also get
 * their children created from get_child_device_component_list and
 * get_child_device_list; every refresh then carries get_child_device_list
 * so child state arrives in the parent's batch.
 */
class SmartDevice : public Device {
public:
    using Device::Device;

    std::string alias() const override;
    Status set_state(bool on) override;
    bool is_hub() const override;

protected:
    bool negotiate(Status& status) override;
    void add_refresh_keys(nlohmann::json& request) const override;
    void apply_update(const protocol::QueryResponse& update) override;

private:
    bool create_children(Status& status);
};

/**
 * @brief Socket of a power strip or sensor paired with a hub
 *
 * Commands travel through the parent's protocol wrapped in control_child.
 * Refreshes send nothing: the info block comes from the parent's child list
 * and module queries resolve against the parent's last update.
 */
class SmartChildDevice : public SmartDevice {
public:
    SmartChildDevice(Device& parent, const nlohmann::json& info, std::map<std::string, int> components,
                     const ModuleCatalog& catalog);

    // Replaces the info block with the entry from the parent's child list
    void update_info(const nlohmann::json& info) { set_sys_info(info); }

protected:
    bool negotiate(Status& status) override { return true; }
    void add_refresh_keys(nlohmann::json& request) const override {}
};

// {id: ver_code} from a component_list array
std::map<std::string, int> parse_component_list(const nlohmann::json& component_list);

}  // namespace device
}  // namespace kasa
