#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>

#include "common/status.hpp"
#include "connection_recipe.hpp"

namespace kasa {
namespace connection {

// Username/password pair for authenticated transports
struct Credentials {
    std::string username;
    std::string password;

    bool empty() const { return username.empty() && password.empty(); }
    bool operator==(const Credentials& other) const {
        return username == other.username && password == other.password;
    }
};

// Never prints the secret
std::ostream& operator<<(std::ostream& os, const Credentials& credentials);

struct DeviceConfig {
    static constexpr int kDefaultTimeoutSeconds = 5;

    std::string host;                                 // IP address or hostname
    std::optional<int> port_override;                 // Replaces the recipe's default port
    std::optional<Credentials> credentials;           // Takes precedence over credentials_hash
    std::optional<std::string> credentials_hash;      // Opaque hash from Device::credentials_hash()
    int timeout_s = kDefaultTimeoutSeconds;           // Per-request timeout
    int discovery_timeout_s = kDefaultTimeoutSeconds; // Discovery window
    std::optional<int> batch_size;                    // multipleRequest batch size (SMART)
    std::optional<ConnectionRecipe> connection_type;  // Fixed recipe, negotiation skipped when set

    // Port the transport connects to for the given recipe
    int port_for(const ConnectionRecipe& recipe) const { return port_override ? *port_override : recipe.default_port(); }
};

// Serialization of credentials in to_json()
enum class CredentialsMode {
    INCLUDE,       // credentials and hash as stored
    EXCLUDE,       // drop credentials, keep hash
    HASH_ONLY      // drop credentials, write the supplied hash instead
};

bool validate_device_config(const DeviceConfig& config, Status& status);

nlohmann::json to_json(const DeviceConfig& config, CredentialsMode mode = CredentialsMode::INCLUDE,
                       const std::string& credentials_hash = "");

bool device_config_from_json(const nlohmann::json& j, DeviceConfig& config, Status& status);

}  // namespace connection
}  // namespace kasa
