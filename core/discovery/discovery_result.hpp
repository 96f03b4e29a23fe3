#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "common/status.hpp"
#include "connection/connection_recipe.hpp"

namespace kasa {
namespace discovery {

// Legacy probe port (XOR) and the newer TDP probe port
constexpr int kLegacyDiscoveryPort = 9999;
constexpr int kDiscoveryPort = 20002;

// Replies on kDiscoveryPort start with a fixed binary header
constexpr size_t kDiscoveryHeaderSize = 16;

// mgt_encrypt_schm block of a 20002 reply
struct EncryptionScheme {
    bool is_support_https = false;
    std::string encrypt_type;        // "KLAP", "AES"; may be empty
    std::optional<int> http_port;
    std::optional<int> login_version;  // "lv"
};

/**
 * @brief Decoded discovery reply
 *
 * Built from either reply kind. For legacy replies the identity fields come
 * from system.get_sysinfo and encryption is implied (XOR). `raw` keeps the
 * decoded document for unsupported-device reports.
 */
struct DiscoveryResult {
    std::string ip;
    int port = 0;
    std::string device_type;  // wire family, e.g. "SMART.TAPOPLUG"
    std::string device_model;
    std::string device_id;
    std::string mac;
    std::string firmware_version;
    std::string hardware_version;
    std::optional<EncryptionScheme> mgt_encrypt_schm;
    std::string sym_schm;                   // encrypt_info.sym_schm
    std::vector<std::string> encrypt_type;  // top-level encrypt_type list
    bool legacy = false;
    nlohmann::json raw;
};

// XOR probe body for the legacy port, unframed
std::vector<uint8_t> legacy_discovery_query();

// 16-byte TDP header followed by the JSON probe body
std::vector<uint8_t> discovery_query();

// Turns one datagram into JSON; which decoding applies follows the source port
bool decode_discovery_reply(const std::vector<uint8_t>& payload, int port, int legacy_port, nlohmann::json& out,
                            Status& status);

// Fills result from a decoded reply; UNSUPPORTED_DEVICE when required fields are missing
bool parse_discovery_result(const nlohmann::json& reply, const std::string& ip, int port, bool legacy,
                            DiscoveryResult& result, Status& status);

/**
 * @brief Picks the ConnectionRecipe a reply advertises
 *
 * Returns false with UNSUPPORTED_DEVICE when the family or encryption is
 * unknown or the combination cannot exist. Sets `ambiguous` (and returns
 * false) when the reply names a known family but no encryption scheme; such
 * hosts are negotiated instead.
 */
bool recipe_for_result(const DiscoveryResult& result, connection::ConnectionRecipe& recipe, bool& ambiguous,
                       Status& status);

// Identity fields plus raw reply
nlohmann::json to_json(const DiscoveryResult& result);

}  // namespace discovery
}  // namespace kasa
