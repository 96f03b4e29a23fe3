#include "camera_device_module.hpp"

namespace kasa {
namespace modules {

CameraDeviceModule::CameraDeviceModule(device::Device& device, const std::string& name,
                                       const std::string& required_component)
    : SmartModule(device, name, required_component, "getDeviceInfo") {}

nlohmann::json CameraDeviceModule::query() const {
    return {{query_getter(), {{"device_info", {{"name", nlohmann::json::array({"basic_info"})}}}}}};
}

void CameraDeviceModule::initialize_features() {
    device::FeatureDescriptor device_id;
    device_id.id = "device_id";
    device_id.name = "Device ID";
    device_id.category = device::FeatureCategory::DEBUG;
    device_id.getter = [](const device::Module& module) -> device::FeatureValue {
        return module.device().device_id();
    };
    add_feature(device_id);

    device::FeatureDescriptor state;
    state.id = "state";
    state.name = "State";
    state.type = device::FeatureType::SWITCH;
    state.category = device::FeatureCategory::PRIMARY;
    state.getter = [](const device::Module& module) -> device::FeatureValue { return module.device().is_on(); };
    state.setter = [](device::Module& module, const device::FeatureValue& value) {
        return module.device().set_state(std::get<bool>(value));
    };
    add_feature(state);
}

}  // namespace modules
}  // namespace kasa
