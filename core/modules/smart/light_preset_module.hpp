#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "smart_module.hpp"

namespace kasa {
namespace modules {

struct LightState {
    int brightness = 0;
    std::optional<int> color_temp;
    std::optional<int> hue;
    std::optional<int> saturation;
};

/**
 * @brief Stored light presets
 *
 * Presets are rebuilt by the post-update hook from get_preset_rules, or
 * from sys_info "preset_state" on devices that report them there. The
 * active preset is derived from the Brightness module's current level.
 */
class LightPresetModule : public SmartModule {
public:
    static constexpr const char* kPresetNotSet = "Not set";

    LightPresetModule(device::Device& device, const std::string& name, const std::string& required_component);

    nlohmann::json query() const override;
    void post_update_hook() override;

    // kPresetNotSet followed by the preset names
    std::vector<std::string> preset_list() const;

    std::string preset() const;
    Status set_preset(const std::string& preset_name);

protected:
    void initialize_features() override;

private:
    bool state_in_sys_info_;
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, LightState>> presets_;
};

}  // namespace modules
}  // namespace kasa
