#pragma once

#include "protocol.hpp"

namespace kasa {
namespace protocol {

/**
 * @brief Legacy IOT framing
 *
 * The whole request document is sent as one message. Each top-level
 * module key in the reply becomes one fragment; a non-zero "err_code" at
 * module level or inside any method reply turns that key into an error
 * fragment.
 */
class IotProtocol : public BaseProtocol {
public:
    using BaseProtocol::BaseProtocol;

protected:
    bool execute(const nlohmann::json& request, QueryResponse& response, Status& status) override;
    nlohmann::json redact_for_log(const nlohmann::json& data) const override;
};

// Error code carried by an IOT module or method reply, 0 when none
int iot_error_code(const nlohmann::json& reply);

}  // namespace protocol
}  // namespace kasa
