#pragma once

#include <memory>
#include <string>

#include "http_client.hpp"
#include "session_cipher.hpp"
#include "transport.hpp"

namespace kasa {
namespace transport {

enum class HandshakeState { HANDSHAKE_REQUIRED, ESTABLISHED };

/**
 * @brief HTTP(S) POST transport for SMART and SMARTCAM devices
 *
 * Runs the cipher handshake lazily before the first request and again after
 * reset(). Session cookies returned by the device are replayed on every
 * later request. 401/403 replies are authentication failures; any other
 * non-200 status is a retryable connection error that forces a new
 * handshake.
 */
class HttpTransport : public ITransport {
public:
    HttpTransport(std::unique_ptr<IHttpClient> client, std::unique_ptr<ISessionCipher> cipher, int default_port);

    int default_port() const override { return default_port_; }
    std::string credentials_hash() const override { return cipher_->credentials_hash(); }

    bool send(const std::string& request, nlohmann::json& response) override;
    void close() override;
    void reset() override;

    const Status& last_status() const override { return status_; }

    HandshakeState state() const { return state_; }

private:
    std::unique_ptr<IHttpClient> client_;
    std::unique_ptr<ISessionCipher> cipher_;
    int default_port_;
    HandshakeState state_ = HandshakeState::HANDSHAKE_REQUIRED;
    std::string session_cookie_;
    Status status_;

    bool post(const std::string& path, const std::string& body, HttpHeaders headers, HttpReply& reply,
              Status& status);
    bool check_http_status(const HttpReply& reply);
};

}  // namespace transport
}  // namespace kasa
