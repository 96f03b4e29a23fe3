#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "common/status.hpp"

namespace kasa {
namespace connection {

// Application framing spoken above the transport
enum class ProtocolKind { IOT, SMART, SMARTCAM };

// Encryption scheme of the byte channel
enum class TransportKind { XOR, KLAP, AES };

enum class DeviceFamily {
    IOT_SMARTPLUGSWITCH,
    IOT_SMARTBULB,
    IOT_IPCAMERA,
    SMART_KASAPLUG,
    SMART_KASASWITCH,
    SMART_TAPOPLUG,
    SMART_TAPOBULB,
    SMART_TAPOSWITCH,
    SMART_TAPOHUB,
    SMART_KASAHUB,
    SMART_IPCAMERA,
    SMART_TAPOROBOVAC,
    SMART_TAPOCHIME,
    SMART_TAPODOORBELL
};

const char* protocol_kind_to_string(ProtocolKind kind);
const char* transport_kind_to_string(TransportKind kind);

// Wire names, e.g. "SMART.TAPOPLUG"
const char* device_family_to_string(DeviceFamily family);
std::optional<DeviceFamily> device_family_from_string(const std::string& value);
std::optional<TransportKind> transport_kind_from_string(const std::string& value);

// IOT.* -> IOT, SMART.IPCAMERA and SMART.TAPODOORBELL -> SMARTCAM, other SMART.* -> SMART
ProtocolKind protocol_for_family(DeviceFamily family);

/**
 * @brief One candidate way of talking to a device
 *
 * Immutable value; equality covers every field so a recipe can key the
 * per-host cache. login_version and http_port are hints supplied by discovery.
 */
struct ConnectionRecipe {
    ProtocolKind protocol = ProtocolKind::IOT;
    TransportKind transport = TransportKind::XOR;
    DeviceFamily family = DeviceFamily::IOT_SMARTPLUGSWITCH;
    bool https = false;
    std::optional<int> login_version;
    std::optional<int> http_port;

    ConnectionRecipe() = default;
    ConnectionRecipe(DeviceFamily family, TransportKind transport, bool https = false,
                     std::optional<int> login_version = std::nullopt, std::optional<int> http_port = std::nullopt);

    // Port used when neither the config nor discovery overrides it
    int default_port() const;

    std::string to_string() const;

    bool operator==(const ConnectionRecipe& other) const;
    bool operator!=(const ConnectionRecipe& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const ConnectionRecipe& recipe);

// Builds a recipe from the wire strings reported by discovery or stored in config
bool recipe_from_values(const std::string& family, const std::string& encryption, bool https,
                        std::optional<int> login_version, std::optional<int> http_port, ConnectionRecipe& out,
                        Status& status);

// True when the protocol/transport/family/https combination can exist on a real device
bool is_valid_recipe(const ConnectionRecipe& recipe);

// Negotiation candidates in priority order, newest schemes first
std::vector<ConnectionRecipe> candidate_recipes();

}  // namespace connection
}  // namespace kasa
