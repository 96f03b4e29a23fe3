#pragma once

#include <map>
#include <memory>

#include "common/status.hpp"
#include "connection/connection_recipe.hpp"
#include "connection/device_config.hpp"
#include "device.hpp"
#include "module_catalog.hpp"
#include "protocol/protocol.hpp"
#include "transport/transport_factory.hpp"

namespace kasa {
namespace device {

/**
 * @brief Builds transport -> protocol -> device for a known recipe
 *
 * The recipe is taken from DeviceConfig::connection_type. The device class
 * follows the recipe's protocol kind; each kind gets its own module catalog.
 */
class DeviceFactory {
public:
    explicit DeviceFactory(std::shared_ptr<transport::TransportFactory> transports = nullptr);
    virtual ~DeviceFactory() = default;

    // Replaces the module catalog used for devices of one protocol kind
    void set_catalog(connection::ProtocolKind kind, ModuleCatalog catalog);

    transport::TransportFactory& transports() { return *transports_; }

    std::unique_ptr<protocol::IProtocol> create_protocol(const connection::DeviceConfig& config,
                                                         const connection::ConnectionRecipe& recipe,
                                                         Status& status) const;

    // Builds the device without talking to it
    std::shared_ptr<Device> create(const connection::DeviceConfig& config, Status& status) const;

    // create() plus the first refresh; a device that fails it is disconnected and dropped
    virtual std::shared_ptr<Device> connect(const connection::DeviceConfig& config, Status& status) const;

private:
    std::shared_ptr<transport::TransportFactory> transports_;
    std::map<connection::ProtocolKind, ModuleCatalog> catalogs_;
};

}  // namespace device
}  // namespace kasa
