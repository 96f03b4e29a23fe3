#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include "logging/logger.hpp"

namespace kasa {
namespace runtime {

namespace {

bool parse_device(const YAML::Node& node, connection::DeviceConfig& device, std::string& error) {
    if (!node["host"]) {
        error = "Device entry missing 'host' field";
        return false;
    }
    device.host = node["host"].as<std::string>();
    if (node["port"]) {
        device.port_override = node["port"].as<int>();
    }
    if (node["timeout_s"]) {
        device.timeout_s = node["timeout_s"].as<int>();
    }
    if (node["batch_size"]) {
        device.batch_size = node["batch_size"].as<int>();
    }
    if (node["credentials_hash"]) {
        device.credentials_hash = node["credentials_hash"].as<std::string>();
    }

    // Fixed recipe; without it the device is located through discovery and negotiation
    if (node["connection"]) {
        const auto& ct = node["connection"];
        if (!ct["device_family"] || !ct["encryption_type"]) {
            error = "Device '" + device.host + "' connection needs device_family and encryption_type";
            return false;
        }
        std::optional<int> login_version;
        std::optional<int> http_port;
        if (ct["login_version"]) {
            login_version = ct["login_version"].as<int>();
        }
        if (ct["http_port"]) {
            http_port = ct["http_port"].as<int>();
        }
        bool https = ct["https"] ? ct["https"].as<bool>() : false;

        connection::ConnectionRecipe recipe;
        Status status;
        if (!connection::recipe_from_values(ct["device_family"].as<std::string>(),
                                            ct["encryption_type"].as<std::string>(), https, login_version, http_port,
                                            recipe, status)) {
            error = "Device '" + device.host + "': " + status.message;
            return false;
        }
        device.connection_type = recipe;
    }
    return true;
}

void apply_credential_env(RuntimeConfig& config) {
    const char* username = std::getenv("KASA_USERNAME");
    const char* password = std::getenv("KASA_PASSWORD");
    if (username == nullptr && password == nullptr) {
        return;
    }
    connection::Credentials credentials = config.credentials.value_or(connection::Credentials());
    if (username != nullptr) {
        credentials.username = username;
    }
    if (password != nullptr) {
        credentials.password = password;
    }
    config.credentials = credentials;
    LOG_INFO("[Config] Credentials taken from environment");
}

}  // namespace

bool validate_config(const RuntimeConfig& config, std::string& error) {
    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    // Validate Discovery settings
    if (config.discovery.timeout_ms < 500 || config.discovery.timeout_ms > 60000) {
        error = "discovery.timeout_ms must be between 500 and 60000";
        return false;
    }
    if (config.discovery.packets < 1 || config.discovery.packets > 20) {
        error = "discovery.packets must be between 1 and 20";
        return false;
    }
    if (config.discovery.port && (*config.discovery.port < 1 || *config.discovery.port > 65535)) {
        error = "discovery.port must be between 1 and 65535";
        return false;
    }
    if (config.discovery.concurrency_limit < 1 || config.discovery.concurrency_limit > 64) {
        error = "discovery.concurrency_limit must be between 1 and 64";
        return false;
    }

    // Validate Device settings
    if (config.devices.empty() && !config.discovery.enabled) {
        error = "Config must list at least one device or enable discovery";
        return false;
    }
    for (const auto& device : config.devices) {
        Status status;
        if (!connection::validate_device_config(device, status)) {
            error = "Device '" + device.host + "': " + status.message;
            return false;
        }
        for (const auto& other : config.devices) {
            if (&other != &device && other.host == device.host) {
                error = "Device '" + device.host + "' is listed more than once";
                return false;
            }
        }
    }

    // Validate Polling settings
    if (config.polling.interval_ms < 100) {
        error = "polling interval must be >= 100ms";
        return false;
    }

    return true;
}

bool load_config(const std::string& config_path, RuntimeConfig& config, std::string& error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"logging", "discovery", "credentials",
                                                     "devices", "polling",   "cache"};
        for (const auto& key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto& valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        // Load discovery config
        if (yaml["discovery"]) {
            const auto& discovery = yaml["discovery"];
            if (discovery["enabled"]) {
                config.discovery.enabled = discovery["enabled"].as<bool>();
            }
            if (discovery["target"]) {
                config.discovery.target = discovery["target"].as<std::string>();
            }
            if (discovery["interface"]) {
                config.discovery.interface = discovery["interface"].as<std::string>();
            }
            if (discovery["timeout_ms"]) {
                config.discovery.timeout_ms = discovery["timeout_ms"].as<int>();
            }
            if (discovery["packets"]) {
                config.discovery.packets = discovery["packets"].as<int>();
            }
            if (discovery["port"]) {
                config.discovery.port = discovery["port"].as<int>();
            }
            if (discovery["concurrency_limit"]) {
                config.discovery.concurrency_limit = discovery["concurrency_limit"].as<size_t>();
            }
            if (discovery["refresh_devices"]) {
                config.discovery.refresh_devices = discovery["refresh_devices"].as<bool>();
            }
        }

        // Load credentials
        if (yaml["credentials"]) {
            connection::Credentials credentials;
            if (yaml["credentials"]["username"]) {
                credentials.username = yaml["credentials"]["username"].as<std::string>();
            }
            if (yaml["credentials"]["password"]) {
                credentials.password = yaml["credentials"]["password"].as<std::string>();
            }
            config.credentials = credentials;
        }
        apply_credential_env(config);

        // Load devices
        if (yaml["devices"]) {
            config.devices.clear();  // Ensure idempotent parsing
            for (const auto& device_node : yaml["devices"]) {
                connection::DeviceConfig device;
                if (!parse_device(device_node, device, error)) {
                    return false;
                }
                device.credentials = config.credentials;
                device.discovery_timeout_s = std::max(1, config.discovery.timeout_ms / 1000);
                config.devices.push_back(device);
            }
        }

        // Load polling config
        if (yaml["polling"]) {
            if (yaml["polling"]["interval_ms"]) {
                config.polling.interval_ms = yaml["polling"]["interval_ms"].as<int>();
            }
        }

        // Load cache config
        if (yaml["cache"]) {
            if (yaml["cache"]["path"]) {
                config.cache.path = yaml["cache"]["path"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Loaded " << config.devices.size() << " device(s)");

        std::stringstream discovery_msg;
        discovery_msg << "[Config] Discovery: " << (config.discovery.enabled ? "enabled" : "disabled");
        if (config.discovery.enabled) {
            discovery_msg << " (" << config.discovery.target << ", " << config.discovery.timeout_ms << "ms, limit "
                          << config.discovery.concurrency_limit << ")";
        }
        LOG_INFO(discovery_msg.str());

        LOG_INFO("[Config] Polling interval: " << config.polling.interval_ms << "ms");
        LOG_INFO("[Config] Recipe cache: " << (config.cache.path.empty() ? "in-memory" : config.cache.path));
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile& e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException& e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception& e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace kasa
