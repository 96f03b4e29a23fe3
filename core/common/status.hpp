#pragma once

#include <ostream>
#include <string>

namespace kasa {

/**
 * @brief Outcome codes shared by transports, protocols, devices and discovery
 *
 * Error taxonomy:
 * - CONNECTION_ERROR / TIMEOUT -> transport unreachable or too slow
 * - AUTHENTICATION_ERROR       -> credentials rejected by the device
 * - UNSUPPORTED_DEVICE         -> device answers but nothing we know matches
 * - DEVICE_ERROR               -> device-side error code for one request
 * - CONFIGURATION_ERROR        -> malformed config or conflicting modules
 * - NO_WORKING_CONNECTION      -> every negotiation candidate failed
 */
enum class StatusCode {
    OK,
    CONNECTION_ERROR,
    TIMEOUT,
    AUTHENTICATION_ERROR,
    UNSUPPORTED_DEVICE,
    DEVICE_ERROR,
    CONFIGURATION_ERROR,
    NO_WORKING_CONNECTION,
    NOT_FOUND,
    INVALID_ARGUMENT,
    INTERNAL
};

inline const char* status_code_to_string(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case StatusCode::TIMEOUT:
            return "TIMEOUT";
        case StatusCode::AUTHENTICATION_ERROR:
            return "AUTHENTICATION_ERROR";
        case StatusCode::UNSUPPORTED_DEVICE:
            return "UNSUPPORTED_DEVICE";
        case StatusCode::DEVICE_ERROR:
            return "DEVICE_ERROR";
        case StatusCode::CONFIGURATION_ERROR:
            return "CONFIGURATION_ERROR";
        case StatusCode::NO_WORKING_CONNECTION:
            return "NO_WORKING_CONNECTION";
        case StatusCode::NOT_FOUND:
            return "NOT_FOUND";
        case StatusCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case StatusCode::INTERNAL:
            return "INTERNAL";
        default:
            return "INTERNAL";
    }
}

// Status value returned (or recorded as last_status) by every fallible operation
struct Status {
    StatusCode code = StatusCode::OK;
    std::string message;
    int device_error_code = 0;  // SmartErrorCode value for DEVICE_ERROR / AUTHENTICATION_ERROR
    bool retryable = false;     // transient failure, caller may retry

    bool ok() const { return code == StatusCode::OK; }

    // Timeouts are a connection failure subtype
    bool is_connection_error() const { return code == StatusCode::CONNECTION_ERROR || code == StatusCode::TIMEOUT; }

    static Status success() { return Status{}; }

    static Status error(StatusCode code, const std::string& message, bool retryable = false) {
        Status status;
        status.code = code;
        status.message = message;
        status.retryable = retryable;
        return status;
    }

    static Status device_error(StatusCode code, const std::string& message, int device_error_code,
                               bool retryable = false) {
        Status status = error(code, message, retryable);
        status.device_error_code = device_error_code;
        return status;
    }

    std::string to_string() const {
        if (ok()) {
            return "OK";
        }
        std::string out = std::string(status_code_to_string(code)) + ": " + message;
        if (device_error_code != 0) {
            out += " (device code " + std::to_string(device_error_code) + ")";
        }
        return out;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Status& status) { return os << status.to_string(); }

}  // namespace kasa
