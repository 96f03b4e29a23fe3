#include "device_factory.hpp"

#include "iot_device.hpp"
#include "logging/logger.hpp"
#include "modules/catalog.hpp"
#include "protocol/iot_protocol.hpp"
#include "protocol/smart_protocol.hpp"
#include "protocol/smartcam_protocol.hpp"
#include "smart_device.hpp"
#include "smartcam_device.hpp"

namespace kasa {
namespace device {

namespace {

// Disconnects the device on scope exit unless released
class DisconnectGuard {
public:
    explicit DisconnectGuard(std::shared_ptr<Device> device) : device_(std::move(device)) {}
    ~DisconnectGuard() {
        if (device_) {
            device_->disconnect();
        }
    }

    DisconnectGuard(const DisconnectGuard&) = delete;
    DisconnectGuard& operator=(const DisconnectGuard&) = delete;

    std::shared_ptr<Device> release() { return std::move(device_); }

private:
    std::shared_ptr<Device> device_;
};

}  // namespace

DeviceFactory::DeviceFactory(std::shared_ptr<transport::TransportFactory> transports)
    : transports_(transports ? std::move(transports) : std::make_shared<transport::TransportFactory>()) {
    catalogs_[connection::ProtocolKind::IOT] = modules::default_iot_catalog();
    catalogs_[connection::ProtocolKind::SMART] = modules::default_smart_catalog();
    catalogs_[connection::ProtocolKind::SMARTCAM] = modules::default_smartcam_catalog();
}

void DeviceFactory::set_catalog(connection::ProtocolKind kind, ModuleCatalog catalog) {
    catalogs_[kind] = std::move(catalog);
}

std::unique_ptr<protocol::IProtocol> DeviceFactory::create_protocol(const connection::DeviceConfig& config,
                                                                    const connection::ConnectionRecipe& recipe,
                                                                    Status& status) const {
    std::unique_ptr<transport::ITransport> transport = transports_->create(config, recipe, status);
    if (!transport) {
        return nullptr;
    }
    int batch_size = config.batch_size.value_or(protocol::SmartProtocol::kDefaultBatchSize);
    switch (recipe.protocol) {
        case connection::ProtocolKind::IOT:
            return std::make_unique<protocol::IotProtocol>(std::move(transport), config.host);
        case connection::ProtocolKind::SMART:
            return std::make_unique<protocol::SmartProtocol>(std::move(transport), config.host, batch_size);
        case connection::ProtocolKind::SMARTCAM:
            return std::make_unique<protocol::SmartCamProtocol>(std::move(transport), config.host, batch_size);
    }
    status = Status::error(StatusCode::UNSUPPORTED_DEVICE, "Unknown protocol for " + recipe.to_string());
    return nullptr;
}

std::shared_ptr<Device> DeviceFactory::create(const connection::DeviceConfig& config, Status& status) const {
    if (!connection::validate_device_config(config, status)) {
        return nullptr;
    }
    if (!config.connection_type) {
        status = Status::error(StatusCode::CONFIGURATION_ERROR, "No connection type for " + config.host);
        return nullptr;
    }
    const connection::ConnectionRecipe& recipe = *config.connection_type;

    std::unique_ptr<protocol::IProtocol> protocol = create_protocol(config, recipe, status);
    if (!protocol) {
        return nullptr;
    }

    ModuleCatalog catalog;
    auto it = catalogs_.find(recipe.protocol);
    if (it != catalogs_.end()) {
        catalog = it->second;
    }

    LOG_DEBUG("[DeviceFactory] Creating " << recipe.to_string() << " device for " << config.host);
    switch (recipe.protocol) {
        case connection::ProtocolKind::IOT:
            return std::make_shared<IotDevice>(config, std::move(protocol), catalog);
        case connection::ProtocolKind::SMARTCAM:
            return std::make_shared<SmartCamDevice>(config, std::move(protocol), catalog);
        case connection::ProtocolKind::SMART:
            return std::make_shared<SmartDevice>(config, std::move(protocol), catalog);
    }
    status = Status::error(StatusCode::UNSUPPORTED_DEVICE, "Unknown device class for " + recipe.to_string());
    return nullptr;
}

std::shared_ptr<Device> DeviceFactory::connect(const connection::DeviceConfig& config, Status& status) const {
    std::shared_ptr<Device> device = create(config, status);
    if (!device) {
        return nullptr;
    }
    DisconnectGuard guard(device);
    status = device->refresh();
    if (!status.ok()) {
        LOG_DEBUG("[DeviceFactory] First refresh of " << config.host << " failed: " << status.message);
        return nullptr;
    }
    return guard.release();
}

}  // namespace device
}  // namespace kasa
