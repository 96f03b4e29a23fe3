#pragma once

#include <string>

#include "protocol.hpp"

namespace kasa {
namespace protocol {

/**
 * @brief Routes a child device's queries through its parent's protocol
 *
 * Requests are wrapped in a "control_child" envelope addressed by the child
 * device id; nested responses are unwrapped back into per-method fragments.
 * The parent protocol is borrowed: close() does nothing.
 */
class ChildProtocolWrapper : public IProtocol {
public:
    ChildProtocolWrapper(const std::string& device_id, IProtocol& parent);

    bool query(const nlohmann::json& request, QueryResponse& response) override;
    void close() override {}

    std::string host() const override { return parent_.host(); }
    std::string credentials_hash() const override { return parent_.credentials_hash(); }
    const Status& last_status() const override { return status_; }

    const std::string& device_id() const { return device_id_; }

    // control_child payload for a request, exposed for batching by the parent
    nlohmann::json wrap(const nlohmann::json& request) const;

private:
    std::string device_id_;
    IProtocol& parent_;
    Status status_;
};

}  // namespace protocol
}  // namespace kasa
