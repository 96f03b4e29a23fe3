#include "transport_factory.hpp"

#include "http_transport.hpp"
#include "logging/logger.hpp"
#include "xor_transport.hpp"

namespace kasa {
namespace transport {

TransportFactory::TransportFactory() {
    http_client_factory_ = [](const std::string& host, int port, bool https, int timeout_ms) {
        return std::unique_ptr<IHttpClient>(new HttplibClient(host, port, https, timeout_ms));
    };
}

void TransportFactory::register_cipher(connection::TransportKind kind, CipherFactory factory) {
    ciphers_[kind] = std::move(factory);
}

bool TransportFactory::has_cipher(connection::TransportKind kind) const { return ciphers_.count(kind) > 0; }

std::unique_ptr<ITransport> TransportFactory::create(const connection::DeviceConfig& config,
                                                     const connection::ConnectionRecipe& recipe,
                                                     Status& status) const {
    int port = config.port_for(recipe);
    int timeout_ms = config.timeout_s * 1000;

    if (recipe.transport == connection::TransportKind::XOR) {
        status = Status::success();
        return std::make_unique<XorTransport>(config.host, port, timeout_ms);
    }

    auto it = ciphers_.find(recipe.transport);
    if (it == ciphers_.end()) {
        status = Status::error(StatusCode::UNSUPPORTED_DEVICE, std::string("No session cipher registered for ") +
                                                                   connection::transport_kind_to_string(recipe.transport));
        return nullptr;
    }

    auto cipher = it->second(config, recipe);
    if (!cipher) {
        status = Status::error(StatusCode::UNSUPPORTED_DEVICE,
                               "Session cipher unavailable for " + recipe.to_string());
        return nullptr;
    }

    LOG_DEBUG("[TransportFactory] " << config.host << ":" << port << " using " << recipe);
    status = Status::success();
    return std::make_unique<HttpTransport>(http_client_factory_(config.host, port, recipe.https, timeout_ms),
                                           std::move(cipher), recipe.default_port());
}

}  // namespace transport
}  // namespace kasa
