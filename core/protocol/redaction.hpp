#pragma once

#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace kasa {
namespace protocol {

// Replacement for one sensitive field; an empty function means "**REDACTED**"
using Redactor = std::function<nlohmann::json(const nlohmann::json&)>;
using RedactorMap = std::map<std::string, Redactor>;

/**
 * @brief Returns a copy of data with sensitive fields masked
 *
 * Walks objects and arrays recursively. Null values and empty strings are
 * left untouched. A redactor that fails on an unexpected value type yields
 * "**REDACTEX**".
 */
nlohmann::json redact_data(const nlohmann::json& data, const RedactorMap& redactors);

// Blanks the last three octets, keeping the vendor prefix
std::string mask_mac(const std::string& mac);

// Field sets for SMART/SMARTCAM and IOT payloads
const RedactorMap& smart_redactors();
const RedactorMap& iot_redactors();

}  // namespace protocol
}  // namespace kasa
