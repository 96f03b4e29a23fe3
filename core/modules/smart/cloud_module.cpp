#include "cloud_module.hpp"

namespace kasa {
namespace modules {

CloudModule::CloudModule(device::Device& device, const std::string& name, const std::string& required_component)
    : SmartModule(device, name, required_component, "get_connect_cloud_state") {}

bool CloudModule::is_connected() const {
    if (has_data_error()) {
        return false;
    }
    nlohmann::json state = data();
    return state.is_object() && state.value("status", -1) == 0;
}

void CloudModule::initialize_features() {
    device::FeatureDescriptor connection;
    connection.id = "cloud_connection";
    connection.name = "Cloud connection";
    connection.icon = "mdi:cloud";
    connection.type = device::FeatureType::BINARY_SENSOR;
    connection.category = device::FeatureCategory::INFO;
    connection.getter = [](const device::Module& module) -> device::FeatureValue {
        return static_cast<const CloudModule&>(module).is_connected();
    };
    add_feature(connection);
}

}  // namespace modules
}  // namespace kasa
