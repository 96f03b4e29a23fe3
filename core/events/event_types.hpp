#pragma once

/**
 * @file event_types.hpp
 * @brief Events produced by discovery
 *
 * Discovery pushes one event per outcome into the EventEmitter; consumers
 * drain a subscription queue or register a listener.
 * Every decoded reply produces a RawDiscoveryEvent; every host then
 * produces exactly one of DeviceDiscoveredEvent or DeviceUnsupportedEvent.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

#include "common/status.hpp"

namespace kasa {
namespace device {
class Device;
}

namespace events {

inline int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// A host was identified and its device completed the first refresh
struct DeviceDiscoveredEvent {
    uint64_t event_id = 0;
    std::string host;
    std::shared_ptr<device::Device> device;
    int64_t timestamp_ms = 0;
};

// A host answered but could not be turned into a device
struct DeviceUnsupportedEvent {
    uint64_t event_id = 0;
    std::string host;
    Status reason;                // AUTHENTICATION_ERROR for rejected credentials
    nlohmann::json discovery;     // Decoded discovery reply when there was one
    int64_t timestamp_ms = 0;
};

// Decoded reply as received, before classification
struct RawDiscoveryEvent {
    uint64_t event_id = 0;
    std::string host;
    int port = 0;
    nlohmann::json payload;
    int64_t timestamp_ms = 0;
};

using Event = std::variant<DeviceDiscoveredEvent, DeviceUnsupportedEvent, RawDiscoveryEvent>;

inline uint64_t get_event_id(const Event& event) {
    return std::visit([](auto&& e) { return e.event_id; }, event);
}

inline const std::string& get_event_host(const Event& event) {
    return std::visit([](auto&& e) -> const std::string & { return e.host; }, event);
}

inline const char* event_kind_name(const Event& event) {
    switch (event.index()) {
        case 0:
            return "discovered";
        case 1:
            return "unsupported";
        default:
            return "raw";
    }
}

}  // namespace events
}  // namespace kasa
