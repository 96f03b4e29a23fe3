#include "light_preset_module.hpp"

#include <algorithm>

#include "brightness_module.hpp"
#include "logging/logger.hpp"

namespace kasa {
namespace modules {

namespace {

std::optional<int> optional_int(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<int>();
}

}  // namespace

LightPresetModule::LightPresetModule(device::Device& device, const std::string& name,
                                     const std::string& required_component)
    : SmartModule(device, name, required_component, "get_preset_rules"),
      state_in_sys_info_(device.sys_info().contains("preset_state")) {}

nlohmann::json LightPresetModule::query() const {
    if (state_in_sys_info_) {
        return nlohmann::json::object();
    }
    return SmartModule::query();
}

void LightPresetModule::post_update_hook() {
    nlohmann::json data = this->data();
    std::vector<std::pair<std::string, LightState>> presets;

    const char* state_key = state_in_sys_info_ ? "preset_state" : "states";
    if (data.contains(state_key) && data[state_key].is_array() && !data[state_key].empty()) {
        for (const auto& entry : data[state_key]) {
            if (!entry.is_object()) {
                continue;
            }
            LightState state;
            state.brightness = entry.value("brightness", 0);
            state.color_temp = optional_int(entry, "color_temp");
            state.hue = optional_int(entry, "hue");
            state.saturation = optional_int(entry, "saturation");
            presets.emplace_back("Light preset " + std::to_string(presets.size() + 1), state);
        }
    } else if (data.contains("brightness") && data["brightness"].is_array()) {
        for (const auto& level : data["brightness"]) {
            if (!level.is_number()) {
                continue;
            }
            LightState state;
            state.brightness = level.get<int>();
            presets.emplace_back("Brightness preset " + std::to_string(presets.size() + 1), state);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    presets_ = std::move(presets);
}

std::vector<std::string> LightPresetModule::preset_list() const {
    std::vector<std::string> names{kPresetNotSet};
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& preset : presets_) {
        names.push_back(preset.first);
    }
    return names;
}

std::string LightPresetModule::preset() const {
    auto brightness = device_.get_module_as<BrightnessModule>("Brightness");
    if (!brightness || brightness->has_data_error()) {
        return kPresetNotSet;
    }
    int level = brightness->brightness();
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& preset : presets_) {
        if (preset.second.brightness == level) {
            return preset.first;
        }
    }
    return kPresetNotSet;
}

Status LightPresetModule::set_preset(const std::string& preset_name) {
    LightState state;
    if (preset_name == kPresetNotSet) {
        state.brightness = 100;
    } else {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(presets_.begin(), presets_.end(),
                               [&](const std::pair<std::string, LightState>& p) { return p.first == preset_name; });
        if (it == presets_.end()) {
            return Status::error(StatusCode::INVALID_ARGUMENT, preset_name + " is not a valid preset");
        }
        state = it->second;
    }

    nlohmann::json params = {{"brightness", state.brightness}};
    if (state.color_temp) {
        params["color_temp"] = *state.color_temp;
    }
    if (state.hue) {
        params["hue"] = *state.hue;
    }
    if (state.saturation) {
        params["saturation"] = *state.saturation;
    }
    LOG_DEBUG("[LightPreset] Applying " << preset_name << " on " << device_.host());
    return call("set_device_info", params);
}

void LightPresetModule::initialize_features() {
    device::FeatureDescriptor preset;
    preset.id = "light_preset";
    preset.name = "Light preset";
    preset.type = device::FeatureType::CHOICE;
    preset.category = device::FeatureCategory::CONFIG;
    preset.choices = preset_list();
    preset.getter = [](const device::Module& module) -> device::FeatureValue {
        return static_cast<const LightPresetModule&>(module).preset();
    };
    preset.setter = [](device::Module& module, const device::FeatureValue& value) {
        return static_cast<LightPresetModule&>(module).set_preset(std::get<std::string>(value));
    };
    add_feature(preset);
}

}  // namespace modules
}  // namespace kasa
