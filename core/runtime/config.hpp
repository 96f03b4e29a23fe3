#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "connection/device_config.hpp"

namespace kasa {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct DiscoveryConfig {
    bool enabled = false;                   // broadcast discovery at startup
    std::string target = "255.255.255.255";  // broadcast address
    std::string interface;                  // optional network interface
    int timeout_ms = 5000;                  // discovery window (500-60000ms)
    int packets = 3;                        // probes per window (1-20)
    std::optional<int> port;                // overrides the legacy discovery port
    size_t concurrency_limit = 8;           // simultaneous device setups (1-64)
    bool refresh_devices = true;            // first refresh before reporting a device
};

struct PollingConfig {
    int interval_ms = 5000;  // Default 5s
};

struct CacheConfig {
    std::string path;  // recipe cache file; empty = in-memory only
};

struct RuntimeConfig {
    LoggingConfig logging;
    DiscoveryConfig discovery;
    std::optional<connection::Credentials> credentials;
    std::vector<connection::DeviceConfig> devices;
    PollingConfig polling;
    CacheConfig cache;
};

// Loads configuration from a YAML file; KASA_USERNAME / KASA_PASSWORD override the file's credentials
bool load_config(const std::string& config_path, RuntimeConfig& config, std::string& error);

// Validates the configuration
bool validate_config(const RuntimeConfig& config, std::string& error);

}  // namespace runtime
}  // namespace kasa
