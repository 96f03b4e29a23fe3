#include "smart_error_code.hpp"

#include <unordered_map>

namespace kasa {
namespace protocol {

namespace {

const std::unordered_map<int, std::string>& code_names() {
    static const std::unordered_map<int, std::string> names = {
        {0, "SUCCESS"},
        {9999, "SESSION_TIMEOUT_ERROR"},
        {1200, "MULTI_REQUEST_FAILED_ERROR"},
        {1112, "HTTP_TRANSPORT_FAILED_ERROR"},
        {1111, "LOGIN_FAILED_ERROR"},
        {1100, "HAND_SHAKE_FAILED_ERROR"},
        {1003, "TRANSPORT_UNKNOWN_CREDENTIALS_ERROR"},
        {1002, "TRANSPORT_NOT_AVAILABLE_ERROR"},
        {1001, "CMD_COMMAND_CANCEL_ERROR"},
        {1000, "NULL_TRANSPORT_ERROR"},
        {-1, "COMMON_FAILED_ERROR"},
        {-1001, "UNSPECIFIC_ERROR"},
        {-1002, "UNKNOWN_METHOD_ERROR"},
        {-1003, "JSON_DECODE_FAIL_ERROR"},
        {-1004, "JSON_ENCODE_FAIL_ERROR"},
        {-1005, "AES_DECODE_FAIL_ERROR"},
        {-1006, "REQUEST_LEN_ERROR_ERROR"},
        {-1007, "CLOUD_FAILED_ERROR"},
        {-1008, "PARAMS_ERROR"},
        {-1010, "INVALID_PUBLIC_KEY_ERROR"},
        {-1101, "SESSION_PARAM_ERROR"},
        {-1201, "QUICK_SETUP_ERROR"},
        {-1301, "DEVICE_ERROR"},
        {-1302, "DEVICE_NEXT_EVENT_ERROR"},
        {-1401, "FIRMWARE_ERROR"},
        {-1402, "FIRMWARE_VER_ERROR_ERROR"},
        {-1501, "LOGIN_ERROR"},
        {-1601, "TIME_ERROR"},
        {-1602, "TIME_SYS_ERROR"},
        {-1603, "TIME_SAVE_ERROR"},
        {-1701, "WIRELESS_ERROR"},
        {-1702, "WIRELESS_UNSUPPORTED_ERROR"},
        {-1801, "SCHEDULE_ERROR"},
        {-1802, "SCHEDULE_FULL_ERROR"},
        {-1803, "SCHEDULE_CONFLICT_ERROR"},
        {-1804, "SCHEDULE_SAVE_ERROR"},
        {-1805, "SCHEDULE_INDEX_ERROR"},
        {-1901, "COUNTDOWN_ERROR"},
        {-1902, "COUNTDOWN_CONFLICT_ERROR"},
        {-1903, "COUNTDOWN_SAVE_ERROR"},
        {-2001, "ANTITHEFT_ERROR"},
        {-2002, "ANTITHEFT_CONFLICT_ERROR"},
        {-2003, "ANTITHEFT_SAVE_ERROR"},
        {-2101, "ACCOUNT_ERROR"},
        {-2201, "STAT_ERROR"},
        {-2202, "STAT_SAVE_ERROR"},
        {-2301, "DST_ERROR"},
        {-2302, "DST_SAVE_ERROR"},
        {-100000, "INTERNAL_UNKNOWN_ERROR"},
        {-100001, "INTERNAL_QUERY_ERROR"},
    };
    return names;
}

}  // namespace

SmartErrorCode smart_error_code_from_int(int value) {
    if (code_names().count(value) == 0) {
        return SmartErrorCode::INTERNAL_UNKNOWN_ERROR;
    }
    return static_cast<SmartErrorCode>(value);
}

std::string smart_error_code_name(SmartErrorCode code) {
    auto it = code_names().find(static_cast<int>(code));
    if (it == code_names().end()) {
        return "INTERNAL_UNKNOWN_ERROR";
    }
    return it->second;
}

bool is_retryable_error(SmartErrorCode code) {
    switch (code) {
        case SmartErrorCode::TRANSPORT_NOT_AVAILABLE_ERROR:
        case SmartErrorCode::HTTP_TRANSPORT_FAILED_ERROR:
        case SmartErrorCode::UNSPECIFIC_ERROR:
        case SmartErrorCode::SESSION_TIMEOUT_ERROR:
            return true;
        default:
            return false;
    }
}

bool is_authentication_error(SmartErrorCode code) {
    switch (code) {
        case SmartErrorCode::LOGIN_ERROR:
        case SmartErrorCode::LOGIN_FAILED_ERROR:
        case SmartErrorCode::AES_DECODE_FAIL_ERROR:
        case SmartErrorCode::HAND_SHAKE_FAILED_ERROR:
        case SmartErrorCode::TRANSPORT_UNKNOWN_CREDENTIALS_ERROR:
            return true;
        default:
            return false;
    }
}

Status status_from_error_code(SmartErrorCode code, const std::string& context) {
    int raw = static_cast<int>(code);
    std::string message = context + ": " + smart_error_code_name(code) + "(" + std::to_string(raw) + ")";
    if (is_authentication_error(code)) {
        return Status::device_error(StatusCode::AUTHENTICATION_ERROR, message, raw);
    }
    if (is_retryable_error(code)) {
        return Status::device_error(StatusCode::CONNECTION_ERROR, message, raw, true);
    }
    return Status::device_error(StatusCode::DEVICE_ERROR, message, raw);
}

}  // namespace protocol
}  // namespace kasa
