#include "redaction.hpp"

#include <cctype>
#include <exception>

namespace kasa {
namespace protocol {

namespace {

const char kMaskedNameB64[] = "I01BU0tFRF9OQU1FIw==";  // #MASKED_NAME#
const char kMaskedSsidB64[] = "I01BU0tFRF9TU0lEIw==";  // #MASKED_SSID#

nlohmann::json redact_id(const nlohmann::json& value) {
    std::string id = value.get<std::string>();
    return "REDACTED_" + (id.size() > 9 ? id.substr(9) : std::string());
}

nlohmann::json zero(const nlohmann::json&) { return 0; }

nlohmann::json masked_or_empty(const nlohmann::json& value, const std::string& mask) {
    return value.get<std::string>().empty() ? std::string() : mask;
}

nlohmann::json zero_word_chars(const nlohmann::json& value) {
    std::string s = value.get<std::string>();
    for (auto& c : s) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
            c = '0';
        }
    }
    return s;
}

nlohmann::json redact_mac(const nlohmann::json& value) { return mask_mac(value.get<std::string>()); }

nlohmann::json mask_iot_children(const nlohmann::json& value) {
    nlohmann::json children = nlohmann::json::array();
    int index = 0;
    for (const auto& child : value) {
        nlohmann::json masked = child;
        ++index;
        masked["id"] = "SCRUBBED_CHILD_DEVICE_ID_" + std::to_string(index);
        if (!child.value("alias", std::string()).empty()) {
            masked["alias"] = "#MASKED_NAME# " + std::to_string(index);
        }
        children.push_back(masked);
    }
    return children;
}

}  // namespace

std::string mask_mac(const std::string& mac) {
    if (mac.size() == 12) {
        return mac.substr(0, 6) + "000000";
    }
    char delim = mac.find(':') != std::string::npos ? ':' : '-';
    std::string rest = std::string("00") + delim + "00" + delim + "00";
    return mac.substr(0, 8) + delim + rest;
}

nlohmann::json redact_data(const nlohmann::json& data, const RedactorMap& redactors) {
    if (data.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : data) {
            out.push_back(redact_data(item, redactors));
        }
        return out;
    }
    if (!data.is_object()) {
        return data;
    }

    nlohmann::json redacted = data;
    for (auto it = redacted.begin(); it != redacted.end(); ++it) {
        const auto& value = it.value();
        if (value.is_null() || (value.is_string() && value.get<std::string>().empty())) {
            continue;
        }

        auto redactor = redactors.find(it.key());
        if (redactor != redactors.end()) {
            if (!redactor->second) {
                it.value() = "**REDACTED**";
                continue;
            }
            try {
                it.value() = redactor->second(value);
            } catch (const std::exception&) {
                it.value() = "**REDACTEX**";
            }
        } else if (value.is_object() || value.is_array()) {
            it.value() = redact_data(value, redactors);
        }
    }
    return redacted;
}

const RedactorMap& smart_redactors() {
    static const RedactorMap redactors = {
        {"latitude", zero},
        {"longitude", zero},
        {"la", zero},
        {"lo", zero},
        {"device_id", redact_id},
        {"parent_device_id", redact_id},
        {"original_device_id", redact_id},
        {"nickname", [](const nlohmann::json& v) { return masked_or_empty(v, kMaskedNameB64); }},
        {"mac", redact_mac},
        {"ssid", [](const nlohmann::json& v) { return masked_or_empty(v, kMaskedSsidB64); }},
        {"bssid", [](const nlohmann::json&) { return nlohmann::json("000000000000"); }},
        {"channel", zero},
        {"oem_id", redact_id},
        {"hw_id", redact_id},
        {"fw_id", redact_id},
        {"setup_code", zero_word_chars},
        {"setup_payload", zero_word_chars},
        {"mfi_setup_code", zero_word_chars},
        {"mfi_setup_id", zero_word_chars},
        {"mfi_token_token", zero_word_chars},
        {"mfi_token_uuid", zero_word_chars},
        {"dev_id", redact_id},
        {"ext_addr", redact_id},
        {"device_name", [](const nlohmann::json& v) { return masked_or_empty(v, "#MASKED_NAME#"); }},
        {"device_alias", [](const nlohmann::json& v) { return masked_or_empty(v, "#MASKED_NAME#"); }},
        {"alias", [](const nlohmann::json& v) { return masked_or_empty(v, "#MASKED_NAME#"); }},
        {"board_sn", [](const nlohmann::json&) { return nlohmann::json("000000000000"); }},
        {"custom_sn", [](const nlohmann::json&) { return nlohmann::json("000000000000"); }},
        {"location", [](const nlohmann::json& v) { return masked_or_empty(v, "#MASKED_NAME#"); }},
        {"username", [](const nlohmann::json&) { return nlohmann::json("user@example.com"); }},
        {"password", Redactor()},
    };
    return redactors;
}

const RedactorMap& iot_redactors() {
    static const RedactorMap redactors = {
        {"latitude", zero},
        {"longitude", zero},
        {"latitude_i", zero},
        {"longitude_i", zero},
        {"deviceId", redact_id},
        {"children", mask_iot_children},
        {"alias", [](const nlohmann::json& v) { return masked_or_empty(v, "#MASKED_NAME#"); }},
        {"mac", redact_mac},
        {"mic_mac", redact_mac},
        {"ssid", [](const nlohmann::json& v) { return masked_or_empty(v, "#MASKED_SSID#"); }},
        {"oemId", redact_id},
        {"username", [](const nlohmann::json&) { return nlohmann::json("user@example.com"); }},
        {"hwId", redact_id},
        {"password", Redactor()},
    };
    return redactors;
}

}  // namespace protocol
}  // namespace kasa
