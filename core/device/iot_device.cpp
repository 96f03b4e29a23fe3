#include "iot_device.hpp"

#include "logging/logger.hpp"
#include "protocol/smart_error_code.hpp"

namespace kasa {
namespace device {

namespace {

nlohmann::json sysinfo_from(const protocol::ReplyFragment& fragment) {
    if (fragment.is_error() || !fragment.data.is_object()) {
        return nullptr;
    }
    auto it = fragment.data.find("get_sysinfo");
    if (it == fragment.data.end() || !it->is_object()) {
        return nullptr;
    }
    return *it;
}

}  // namespace

std::string IotDevice::mac() const {
    nlohmann::json info = sys_info();
    for (const char* key : {"mac", "mic_mac", "ethernet_mac"}) {
        auto it = info.find(key);
        if (it != info.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

std::string IotDevice::device_id() const { return sys_info().value("deviceId", std::string()); }

std::string IotDevice::fw_version() const { return sys_info().value("sw_ver", std::string()); }

bool IotDevice::is_on() const { return sys_info().value("relay_state", 0) == 1; }

Status IotDevice::set_state(bool on) {
    return query_key("system", {{"set_relay_state", {{"state", on ? 1 : 0}}}});
}

bool IotDevice::negotiate(Status& status) {
    nlohmann::json request = {{"system", {{"get_sysinfo", nlohmann::json::object()}}}};
    protocol::QueryResponse response;
    if (!protocol().query(request, response)) {
        status = protocol().last_status();
        return false;
    }
    auto it = response.find("system");
    if (it == response.end()) {
        status = Status::error(StatusCode::UNSUPPORTED_DEVICE, host() + " did not answer get_sysinfo");
        return false;
    }
    if (it->second.is_error()) {
        status = Status::device_error(StatusCode::DEVICE_ERROR, "get_sysinfo failed on " + host(),
                                      it->second.error_code);
        return false;
    }
    nlohmann::json info = sysinfo_from(it->second);
    if (!info.is_object()) {
        status = Status::error(StatusCode::UNSUPPORTED_DEVICE, "Malformed sysinfo from " + host());
        return false;
    }
    set_sys_info(info);
    LOG_INFO("[Device " << host() << "] IOT " << model() << " (" << info.value("type", info.value("mic_type", ""))
                        << ")");
    return true;
}

void IotDevice::apply_update(const protocol::QueryResponse& update) {
    auto it = update.find("system");
    if (it == update.end()) {
        return;
    }
    nlohmann::json info = sysinfo_from(it->second);
    if (info.is_object()) {
        set_sys_info(info);
    }
}

}  // namespace device
}  // namespace kasa
