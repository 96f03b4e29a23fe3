#include "connection_recipe.hpp"

#include <sstream>
#include <utility>

namespace kasa {
namespace connection {

namespace {

const std::pair<DeviceFamily, const char*> kFamilyNames[] = {
    {DeviceFamily::IOT_SMARTPLUGSWITCH, "IOT.SMARTPLUGSWITCH"},
    {DeviceFamily::IOT_SMARTBULB, "IOT.SMARTBULB"},
    {DeviceFamily::IOT_IPCAMERA, "IOT.IPCAMERA"},
    {DeviceFamily::SMART_KASAPLUG, "SMART.KASAPLUG"},
    {DeviceFamily::SMART_KASASWITCH, "SMART.KASASWITCH"},
    {DeviceFamily::SMART_TAPOPLUG, "SMART.TAPOPLUG"},
    {DeviceFamily::SMART_TAPOBULB, "SMART.TAPOBULB"},
    {DeviceFamily::SMART_TAPOSWITCH, "SMART.TAPOSWITCH"},
    {DeviceFamily::SMART_TAPOHUB, "SMART.TAPOHUB"},
    {DeviceFamily::SMART_KASAHUB, "SMART.KASAHUB"},
    {DeviceFamily::SMART_IPCAMERA, "SMART.IPCAMERA"},
    {DeviceFamily::SMART_TAPOROBOVAC, "SMART.TAPOROBOVAC"},
    {DeviceFamily::SMART_TAPOCHIME, "SMART.TAPOCHIME"},
    {DeviceFamily::SMART_TAPODOORBELL, "SMART.TAPODOORBELL"},
};

// Families probed when nothing is known about the host
const DeviceFamily kNegotiationFamilies[] = {
    DeviceFamily::SMART_TAPOPLUG, DeviceFamily::IOT_SMARTPLUGSWITCH, DeviceFamily::SMART_IPCAMERA,
    DeviceFamily::SMART_TAPOROBOVAC, DeviceFamily::IOT_IPCAMERA,
};

const TransportKind kNegotiationTransports[] = {TransportKind::KLAP, TransportKind::AES, TransportKind::XOR};

// Login version is not part of the identity of a candidate
bool same_candidate(const ConnectionRecipe& a, const ConnectionRecipe& b) {
    return a.protocol == b.protocol && a.transport == b.transport && a.family == b.family && a.https == b.https;
}

}  // namespace

const char* protocol_kind_to_string(ProtocolKind kind) {
    switch (kind) {
        case ProtocolKind::IOT:
            return "IOT";
        case ProtocolKind::SMART:
            return "SMART";
        case ProtocolKind::SMARTCAM:
            return "SMARTCAM";
        default:
            return "UNKNOWN";
    }
}

const char* transport_kind_to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::XOR:
            return "XOR";
        case TransportKind::KLAP:
            return "KLAP";
        case TransportKind::AES:
            return "AES";
        default:
            return "UNKNOWN";
    }
}

const char* device_family_to_string(DeviceFamily family) {
    for (const auto& entry : kFamilyNames) {
        if (entry.first == family) {
            return entry.second;
        }
    }
    return "UNKNOWN";
}

std::optional<DeviceFamily> device_family_from_string(const std::string& value) {
    for (const auto& entry : kFamilyNames) {
        if (value == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

std::optional<TransportKind> transport_kind_from_string(const std::string& value) {
    if (value == "XOR") return TransportKind::XOR;
    if (value == "KLAP") return TransportKind::KLAP;
    if (value == "AES") return TransportKind::AES;
    return std::nullopt;
}

ProtocolKind protocol_for_family(DeviceFamily family) {
    switch (family) {
        case DeviceFamily::IOT_SMARTPLUGSWITCH:
        case DeviceFamily::IOT_SMARTBULB:
        case DeviceFamily::IOT_IPCAMERA:
            return ProtocolKind::IOT;
        case DeviceFamily::SMART_IPCAMERA:
        case DeviceFamily::SMART_TAPODOORBELL:
            return ProtocolKind::SMARTCAM;
        default:
            return ProtocolKind::SMART;
    }
}

ConnectionRecipe::ConnectionRecipe(DeviceFamily family_, TransportKind transport_, bool https_,
                                   std::optional<int> login_version_, std::optional<int> http_port_)
    : protocol(protocol_for_family(family_)),
      transport(transport_),
      family(family_),
      https(https_),
      login_version(login_version_),
      http_port(http_port_) {}

int ConnectionRecipe::default_port() const {
    if (http_port) {
        return *http_port;
    }
    if (transport == TransportKind::XOR) {
        return 9999;
    }
    return https ? 443 : 80;
}

std::string ConnectionRecipe::to_string() const {
    std::ostringstream oss;
    oss << protocol_kind_to_string(protocol) << "/" << transport_kind_to_string(transport) << "/"
        << device_family_to_string(family) << (https ? "/https" : "/plain");
    if (login_version) {
        oss << "/lv" << *login_version;
    }
    if (http_port) {
        oss << ":" << *http_port;
    }
    return oss.str();
}

bool ConnectionRecipe::operator==(const ConnectionRecipe& other) const {
    return same_candidate(*this, other) && login_version == other.login_version && http_port == other.http_port;
}

std::ostream& operator<<(std::ostream& os, const ConnectionRecipe& recipe) { return os << recipe.to_string(); }

bool recipe_from_values(const std::string& family, const std::string& encryption, bool https,
                        std::optional<int> login_version, std::optional<int> http_port, ConnectionRecipe& out,
                        Status& status) {
    auto parsed_family = device_family_from_string(family);
    auto parsed_transport = transport_kind_from_string(encryption);
    if (!parsed_family || !parsed_transport) {
        std::string lv = login_version ? std::to_string(*login_version) : "none";
        status = Status::error(StatusCode::CONFIGURATION_ERROR,
                               "Invalid connection parameters for " + family + "." + encryption + "." + lv);
        return false;
    }
    out = ConnectionRecipe(*parsed_family, *parsed_transport, https, login_version, http_port);
    status = Status::success();
    return true;
}

bool is_valid_recipe(const ConnectionRecipe& recipe) {
    if (recipe.protocol != protocol_for_family(recipe.family)) {
        return false;
    }

    switch (recipe.transport) {
        case TransportKind::XOR:
            return recipe.protocol == ProtocolKind::IOT && !recipe.https && !recipe.login_version;
        case TransportKind::KLAP:
            return recipe.protocol == ProtocolKind::SMART && !recipe.https &&
                   recipe.family != DeviceFamily::SMART_TAPOROBOVAC;
        case TransportKind::AES: {
            if (recipe.protocol == ProtocolKind::IOT) {
                return false;
            }
            // Cameras and vacuums only accept the TLS variant
            bool https_only =
                recipe.protocol == ProtocolKind::SMARTCAM || recipe.family == DeviceFamily::SMART_TAPOROBOVAC;
            return recipe.https == https_only;
        }
        default:
            return false;
    }
}

std::vector<ConnectionRecipe> candidate_recipes() {
    std::vector<ConnectionRecipe> candidates;
    const std::optional<int> login_versions[] = {std::nullopt, 2};

    for (TransportKind transport : kNegotiationTransports) {
        for (DeviceFamily family : kNegotiationFamilies) {
            for (bool https : {true, false}) {
                for (const auto& login_version : login_versions) {
                    ConnectionRecipe recipe(family, transport, https, login_version);
                    if (!is_valid_recipe(recipe)) {
                        continue;
                    }
                    // A later login version replaces an earlier one in place
                    bool replaced = false;
                    for (auto& existing : candidates) {
                        if (same_candidate(existing, recipe)) {
                            existing = recipe;
                            replaced = true;
                            break;
                        }
                    }
                    if (!replaced) {
                        candidates.push_back(recipe);
                    }
                }
            }
        }
    }
    return candidates;
}

}  // namespace connection
}  // namespace kasa
