#include "discovery_result.hpp"

#include <algorithm>
#include <array>
#include <random>
#include <stdexcept>

#include "transport/xor_transport.hpp"

namespace kasa {
namespace discovery {

namespace {

constexpr uint8_t kTdpVersion = 2;
constexpr uint8_t kTdpMessageType = 0;
constexpr uint16_t kTdpProbeOpCode = 1;
constexpr uint8_t kTdpFlags = 17;
constexpr uint32_t kTdpInitialCrc = 0x5A6B7C8D;

const std::array<uint32_t, 256>& crc32_table() {
    static const std::array<uint32_t, 256> table = [] {
        std::array<uint32_t, 256> t{};
        for (uint32_t i = 0; i < 256; ++i) {
            uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
            }
            t[i] = c;
        }
        return t;
    }();
    return table;
}

uint32_t crc32(const std::vector<uint8_t>& data) {
    uint32_t crc = 0xFFFFFFFFu;
    for (uint8_t byte : data) {
        crc = crc32_table()[(crc ^ byte) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFFu;
}

void put_u16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void put_u32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

std::string string_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::optional<int> int_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<int>();
}

// system.get_sysinfo, unwrapping the extra "system" level some cameras add
const nlohmann::json* legacy_sys_info(const nlohmann::json& reply) {
    auto system = reply.find("system");
    if (system == reply.end() || !system->is_object()) {
        return nullptr;
    }
    auto info = system->find("get_sysinfo");
    if (info == system->end() || !info->is_object()) {
        return nullptr;
    }
    auto nested = info->find("system");
    if (nested != info->end() && nested->is_object()) {
        return &*nested;
    }
    return &*info;
}

}  // namespace

std::vector<uint8_t> legacy_discovery_query() {
    nlohmann::json query = {{"system", {{"get_sysinfo", nlohmann::json::object()}}}};
    return transport::XorCipher::encrypt_unframed(query.dump());
}

std::vector<uint8_t> discovery_query() {
    std::string body = nlohmann::json{{"params", nlohmann::json::object()}}.dump();

    std::random_device rd;
    std::mt19937 gen(rd());
    uint32_t serial = std::uniform_int_distribution<uint32_t>()(gen);

    std::vector<uint8_t> query;
    query.reserve(kDiscoveryHeaderSize + body.size());
    query.push_back(kTdpVersion);
    query.push_back(kTdpMessageType);
    put_u16(query, kTdpProbeOpCode);
    put_u16(query, static_cast<uint16_t>(body.size()));
    query.push_back(kTdpFlags);
    query.push_back(0);
    put_u32(query, serial);
    put_u32(query, kTdpInitialCrc);
    query.insert(query.end(), body.begin(), body.end());

    // The checksum covers the whole datagram with the initial value in place
    uint32_t crc = crc32(query);
    query[12] = static_cast<uint8_t>((crc >> 24) & 0xFF);
    query[13] = static_cast<uint8_t>((crc >> 16) & 0xFF);
    query[14] = static_cast<uint8_t>((crc >> 8) & 0xFF);
    query[15] = static_cast<uint8_t>(crc & 0xFF);
    return query;
}

bool decode_discovery_reply(const std::vector<uint8_t>& payload, int port, int legacy_port, nlohmann::json& out,
                            Status& status) {
    std::string text;
    if (port == legacy_port) {
        text = transport::XorCipher::decrypt(payload.data(), payload.size());
    } else if (port == kDiscoveryPort) {
        if (payload.size() <= kDiscoveryHeaderSize) {
            status = Status::error(StatusCode::UNSUPPORTED_DEVICE,
                                   "Discovery reply of " + std::to_string(payload.size()) + " bytes is too short");
            return false;
        }
        text.assign(payload.begin() + kDiscoveryHeaderSize, payload.end());
    } else {
        status = Status::error(StatusCode::UNSUPPORTED_DEVICE, "Reply from unexpected port " + std::to_string(port));
        return false;
    }

    try {
        out = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        status = Status::error(StatusCode::UNSUPPORTED_DEVICE, std::string("Unable to read discovery reply: ") + e.what());
        return false;
    }
    if (!out.is_object()) {
        status = Status::error(StatusCode::UNSUPPORTED_DEVICE, "Discovery reply is not a JSON object");
        return false;
    }
    status = Status::success();
    return true;
}

bool parse_discovery_result(const nlohmann::json& reply, const std::string& ip, int port, bool legacy,
                            DiscoveryResult& result, Status& status) {
    result = DiscoveryResult();
    result.ip = ip;
    result.port = port;
    result.legacy = legacy;
    result.raw = reply;

    if (legacy) {
        const nlohmann::json* info = legacy_sys_info(reply);
        if (info == nullptr) {
            status = Status::error(StatusCode::UNSUPPORTED_DEVICE, "Legacy reply from " + ip + " has no sysinfo");
            return false;
        }
        result.device_type = string_field(*info, "mic_type");
        if (result.device_type.empty()) {
            result.device_type = string_field(*info, "type");
        }
        result.device_model = string_field(*info, "model");
        result.device_id = string_field(*info, "deviceId");
        result.mac = string_field(*info, "mac");
        if (result.mac.empty()) {
            result.mac = string_field(*info, "mic_mac");
        }
        result.firmware_version = string_field(*info, "sw_ver");
        result.hardware_version = string_field(*info, "hw_ver");
        if (result.device_type.empty()) {
            status = Status::error(StatusCode::UNSUPPORTED_DEVICE, "Legacy reply from " + ip + " has no device type");
            return false;
        }
        status = Status::success();
        return true;
    }

    auto body = reply.find("result");
    if (body == reply.end() || !body->is_object()) {
        status = Status::error(StatusCode::UNSUPPORTED_DEVICE, "Unable to parse discovery from device: " + ip);
        return false;
    }
    result.device_type = string_field(*body, "device_type");
    result.device_model = string_field(*body, "device_model");
    result.device_id = string_field(*body, "device_id");
    result.mac = string_field(*body, "mac");
    result.firmware_version = string_field(*body, "firmware_version");
    result.hardware_version = string_field(*body, "hardware_version");
    if (result.hardware_version.empty()) {
        result.hardware_version = string_field(*body, "hw_ver");
    }
    if (result.device_type.empty() || result.device_model.empty() || result.device_id.empty() ||
        result.mac.empty()) {
        status = Status::error(StatusCode::UNSUPPORTED_DEVICE,
                               "Unable to parse discovery from device: " + ip + ": missing identity fields");
        return false;
    }

    auto schm = body->find("mgt_encrypt_schm");
    if (schm != body->end() && schm->is_object()) {
        EncryptionScheme scheme;
        auto https = schm->find("is_support_https");
        scheme.is_support_https = https != schm->end() && https->is_boolean() && https->get<bool>();
        scheme.encrypt_type = string_field(*schm, "encrypt_type");
        scheme.http_port = int_field(*schm, "http_port");
        scheme.login_version = int_field(*schm, "lv");
        result.mgt_encrypt_schm = scheme;
    }

    auto info = body->find("encrypt_info");
    if (info != body->end() && info->is_object()) {
        result.sym_schm = string_field(*info, "sym_schm");
    }

    auto types = body->find("encrypt_type");
    if (types != body->end() && types->is_array()) {
        for (const auto& type : *types) {
            if (type.is_string()) {
                result.encrypt_type.push_back(type.get<std::string>());
            }
        }
    }

    status = Status::success();
    return true;
}

bool recipe_for_result(const DiscoveryResult& result, connection::ConnectionRecipe& recipe, bool& ambiguous,
                       Status& status) {
    ambiguous = false;
    const std::string& type = result.device_type;

    if (result.legacy) {
        bool camera = type == "IOT.IPCAMERA";
        std::optional<int> login_version;
        if (camera) {
            auto info = legacy_sys_info(result.raw);
            if (info != nullptr) {
                login_version = int_field(*info, "stream_version");
            }
        }
        if (!connection::recipe_from_values(type, "XOR", camera, login_version, std::nullopt, recipe, status) ||
            !connection::is_valid_recipe(recipe)) {
            status = Status::error(StatusCode::UNSUPPORTED_DEVICE,
                                   "Unsupported device " + result.ip + " of type " + type);
            return false;
        }
        return true;
    }

    if (!connection::device_family_from_string(type)) {
        status = Status::error(StatusCode::UNSUPPORTED_DEVICE, "Unsupported device " + result.ip + " of type " + type);
        return false;
    }

    std::string encryption;
    std::optional<int> login_version;
    bool https = false;
    std::optional<int> http_port;
    if (result.mgt_encrypt_schm) {
        encryption = result.mgt_encrypt_schm->encrypt_type;
        login_version = result.mgt_encrypt_schm->login_version;
        https = result.mgt_encrypt_schm->is_support_https;
        http_port = result.mgt_encrypt_schm->http_port;
    }
    if (encryption.empty()) {
        encryption = result.sym_schm;
    }
    if (!login_version && !result.encrypt_type.empty()) {
        // Known lists are ["1","2"] and ["3"]; the highest entry is passed as login version
        int highest = 0;
        for (const auto& entry : result.encrypt_type) {
            try {
                highest = std::max(highest, std::stoi(entry));
            } catch (const std::exception&) {
                continue;
            }
        }
        if (highest > 0) {
            login_version = highest;
        }
    }

    if (encryption.empty()) {
        ambiguous = true;
        status = Status::error(StatusCode::UNSUPPORTED_DEVICE,
                               "Device " + result.ip + " of type " + type + " reported no encryption type");
        return false;
    }

    if (!connection::recipe_from_values(type, encryption, https, login_version, http_port, recipe, status) ||
        !connection::is_valid_recipe(recipe)) {
        status = Status::error(StatusCode::UNSUPPORTED_DEVICE, "Unsupported device " + result.ip + " of type " + type +
                                                                   " with encrypt_type " + encryption);
        return false;
    }
    return true;
}

nlohmann::json to_json(const DiscoveryResult& result) {
    nlohmann::json j = {{"ip", result.ip},
                        {"port", result.port},
                        {"device_type", result.device_type},
                        {"device_model", result.device_model},
                        {"device_id", result.device_id},
                        {"mac", result.mac},
                        {"firmware_version", result.firmware_version},
                        {"hardware_version", result.hardware_version}};
    if (result.mgt_encrypt_schm) {
        nlohmann::json schm = {{"is_support_https", result.mgt_encrypt_schm->is_support_https},
                               {"encrypt_type", result.mgt_encrypt_schm->encrypt_type}};
        if (result.mgt_encrypt_schm->http_port) {
            schm["http_port"] = *result.mgt_encrypt_schm->http_port;
        }
        if (result.mgt_encrypt_schm->login_version) {
            schm["lv"] = *result.mgt_encrypt_schm->login_version;
        }
        j["mgt_encrypt_schm"] = schm;
    }
    j["raw"] = result.raw;
    return j;
}

}  // namespace discovery
}  // namespace kasa
