#include "device_config.hpp"

namespace kasa {
namespace connection {

std::ostream& operator<<(std::ostream& os, const Credentials& credentials) {
    return os << "Credentials(username=<redacted>, password=<redacted>)";
}

bool validate_device_config(const DeviceConfig& config, Status& status) {
    if (config.host.empty()) {
        status = Status::error(StatusCode::CONFIGURATION_ERROR, "Device host is empty");
        return false;
    }
    if (config.port_override && (*config.port_override < 1 || *config.port_override > 65535)) {
        status = Status::error(StatusCode::CONFIGURATION_ERROR,
                               "port_override out of range: " + std::to_string(*config.port_override));
        return false;
    }
    if (config.timeout_s <= 0) {
        status = Status::error(StatusCode::CONFIGURATION_ERROR, "timeout must be positive");
        return false;
    }
    if (config.discovery_timeout_s <= 0) {
        status = Status::error(StatusCode::CONFIGURATION_ERROR, "discovery_timeout must be positive");
        return false;
    }
    if (config.batch_size && *config.batch_size < 1) {
        status = Status::error(StatusCode::CONFIGURATION_ERROR, "batch_size must be at least 1");
        return false;
    }
    if (config.connection_type && !is_valid_recipe(*config.connection_type)) {
        status = Status::error(StatusCode::CONFIGURATION_ERROR,
                               "Unsupported connection type: " + config.connection_type->to_string());
        return false;
    }
    status = Status::success();
    return true;
}

nlohmann::json to_json(const DeviceConfig& config, CredentialsMode mode, const std::string& credentials_hash) {
    nlohmann::json j;
    j["host"] = config.host;
    j["timeout"] = config.timeout_s;
    j["discovery_timeout"] = config.discovery_timeout_s;
    if (config.port_override) {
        j["port_override"] = *config.port_override;
    }
    if (config.batch_size) {
        j["batch_size"] = *config.batch_size;
    }

    switch (mode) {
        case CredentialsMode::INCLUDE:
            if (config.credentials) {
                j["credentials"] = {{"username", config.credentials->username},
                                    {"password", config.credentials->password}};
            }
            if (config.credentials_hash) {
                j["credentials_hash"] = *config.credentials_hash;
            }
            break;
        case CredentialsMode::EXCLUDE:
            if (config.credentials_hash) {
                j["credentials_hash"] = *config.credentials_hash;
            }
            break;
        case CredentialsMode::HASH_ONLY:
            // An empty hash drops both
            if (!credentials_hash.empty()) {
                j["credentials_hash"] = credentials_hash;
            }
            break;
    }

    if (config.connection_type) {
        const auto& recipe = *config.connection_type;
        nlohmann::json ct;
        ct["device_family"] = device_family_to_string(recipe.family);
        ct["encryption_type"] = transport_kind_to_string(recipe.transport);
        ct["https"] = recipe.https;
        if (recipe.login_version) {
            ct["login_version"] = *recipe.login_version;
        }
        if (recipe.http_port) {
            ct["http_port"] = *recipe.http_port;
        }
        j["connection_type"] = ct;
    }
    return j;
}

bool device_config_from_json(const nlohmann::json& j, DeviceConfig& config, Status& status) {
    if (!j.is_object()) {
        status = Status::error(StatusCode::CONFIGURATION_ERROR, "Device config must be a JSON object");
        return false;
    }

    try {
        DeviceConfig parsed;
        parsed.host = j.at("host").get<std::string>();
        parsed.timeout_s = j.value("timeout", DeviceConfig::kDefaultTimeoutSeconds);
        parsed.discovery_timeout_s = j.value("discovery_timeout", DeviceConfig::kDefaultTimeoutSeconds);
        if (j.contains("port_override") && !j["port_override"].is_null()) {
            parsed.port_override = j["port_override"].get<int>();
        }
        if (j.contains("batch_size") && !j["batch_size"].is_null()) {
            parsed.batch_size = j["batch_size"].get<int>();
        }
        if (j.contains("credentials") && j["credentials"].is_object()) {
            Credentials credentials;
            credentials.username = j["credentials"].value("username", "");
            credentials.password = j["credentials"].value("password", "");
            parsed.credentials = credentials;
        }
        if (j.contains("credentials_hash") && j["credentials_hash"].is_string()) {
            parsed.credentials_hash = j["credentials_hash"].get<std::string>();
        }
        if (j.contains("connection_type") && j["connection_type"].is_object()) {
            const auto& ct = j["connection_type"];
            std::optional<int> login_version;
            std::optional<int> http_port;
            if (ct.contains("login_version") && !ct["login_version"].is_null()) {
                login_version = ct["login_version"].get<int>();
            }
            if (ct.contains("http_port") && !ct["http_port"].is_null()) {
                http_port = ct["http_port"].get<int>();
            }
            ConnectionRecipe recipe;
            if (!recipe_from_values(ct.at("device_family").get<std::string>(),
                                    ct.at("encryption_type").get<std::string>(), ct.value("https", false),
                                    login_version, http_port, recipe, status)) {
                return false;
            }
            parsed.connection_type = recipe;
        }

        if (!validate_device_config(parsed, status)) {
            return false;
        }
        config = parsed;
        return true;
    } catch (const nlohmann::json::exception& e) {
        status = Status::error(StatusCode::CONFIGURATION_ERROR, std::string("Malformed device config: ") + e.what());
        return false;
    }
}

}  // namespace connection
}  // namespace kasa
