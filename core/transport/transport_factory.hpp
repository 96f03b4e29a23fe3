#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

#include "common/status.hpp"
#include "connection/connection_recipe.hpp"
#include "connection/device_config.hpp"
#include "http_client.hpp"
#include "session_cipher.hpp"
#include "transport.hpp"

namespace kasa {
namespace transport {

using CipherFactory = std::function<std::unique_ptr<ISessionCipher>(const connection::DeviceConfig&,
                                                                     const connection::ConnectionRecipe&)>;

using HttpClientFactory =
    std::function<std::unique_ptr<IHttpClient>(const std::string& host, int port, bool https, int timeout_ms)>;

/**
 * @brief Builds the transport for a recipe
 *
 * XOR is built in. HTTP based schemes need a cipher registered for their
 * TransportKind; without one the recipe is reported as UNSUPPORTED_DEVICE.
 */
class TransportFactory {
public:
    TransportFactory();
    virtual ~TransportFactory() = default;

    void register_cipher(connection::TransportKind kind, CipherFactory factory);
    bool has_cipher(connection::TransportKind kind) const;

    void set_http_client_factory(HttpClientFactory factory) { http_client_factory_ = std::move(factory); }

    virtual std::unique_ptr<ITransport> create(const connection::DeviceConfig& config,
                                               const connection::ConnectionRecipe& recipe, Status& status) const;

private:
    std::map<connection::TransportKind, CipherFactory> ciphers_;
    HttpClientFactory http_client_factory_;
};

}  // namespace transport
}  // namespace kasa
