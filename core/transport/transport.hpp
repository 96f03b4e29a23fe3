#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "common/status.hpp"

namespace kasa {
namespace transport {

/**
 * @brief Byte-level channel to one device
 *
 * Owns the socket/session and the scheme specific encryption. Operations
 * return false on failure and leave the details in last_status():
 * - CONNECTION_ERROR (retryable when transient) / TIMEOUT
 * - AUTHENTICATION_ERROR when the handshake rejects the credentials
 * - UNSUPPORTED_DEVICE when the scheme cannot be spoken at all
 *
 * Not thread-safe; the owning protocol serializes access.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual int default_port() const = 0;

    // Hash of the credentials in use, empty for unauthenticated transports
    virtual std::string credentials_hash() const = 0;

    // Sends one request document and decodes the reply
    virtual bool send(const std::string& request, nlohmann::json& response) = 0;

    // Releases the socket/session
    virtual void close() = 0;

    // Drops session state so the next send starts over (new handshake or connection)
    virtual void reset() = 0;

    virtual const Status& last_status() const = 0;
};

}  // namespace transport
}  // namespace kasa
