#include "cloud_module.hpp"

namespace kasa {
namespace modules {

IotCloudModule::IotCloudModule(device::Device& device, const std::string& name, const std::string& required_component)
    : IotModule(device, name, required_component, "cnCloud") {}

bool IotCloudModule::is_connected() const {
    nlohmann::json info = command_data("get_info");
    return info.is_object() && info.value("binded", 0) == 1;
}

void IotCloudModule::initialize_features() {
    device::FeatureDescriptor connection;
    connection.id = "cloud_connection";
    connection.name = "Cloud connection";
    connection.icon = "mdi:cloud";
    connection.type = device::FeatureType::BINARY_SENSOR;
    connection.category = device::FeatureCategory::INFO;
    connection.getter = [](const device::Module& module) -> device::FeatureValue {
        return static_cast<const IotCloudModule&>(module).is_connected();
    };
    add_feature(connection);
}

}  // namespace modules
}  // namespace kasa
