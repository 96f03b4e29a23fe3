#pragma once

#include <functional>
#include <string>

#include "common/status.hpp"
#include "http_client.hpp"

namespace kasa {
namespace transport {

// POST helper handed to a cipher during the handshake; cookies are handled by the transport
using HandshakePost =
    std::function<bool(const std::string& path, const std::string& body, HttpReply& reply, Status& status)>;

// Request produced by a cipher for one encrypted exchange
struct EncryptedRequest {
    std::string path;
    std::string body;
    HttpHeaders headers;
};

/**
 * @brief Scheme-specific half of an HTTP transport (KLAP, AES)
 *
 * The cipher owns the key material; the transport owns the HTTP session
 * and the handshake state machine.
 */
class ISessionCipher {
public:
    virtual ~ISessionCipher() = default;

    // Negotiates session keys; AUTHENTICATION_ERROR when the device rejects the credentials
    virtual bool handshake(const HandshakePost& post, Status& status) = 0;

    virtual bool encrypt(const std::string& plaintext, EncryptedRequest& request, Status& status) = 0;

    virtual bool decrypt(const HttpReply& reply, std::string& plaintext, Status& status) = 0;

    virtual std::string credentials_hash() const = 0;

    // Forgets the session keys
    virtual void reset() = 0;
};

}  // namespace transport
}  // namespace kasa
