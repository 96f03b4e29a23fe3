#pragma once

#include <atomic>
#include <set>
#include <string>

#include "protocol.hpp"

namespace kasa {
namespace protocol {

/**
 * @brief SMART framing: {method, params, request_time_milis, terminal_uuid}
 *
 * A request with several keys is sent as "multipleRequest" split into
 * batches of batch_size(). Methods that misbehave inside a batch and any
 * method missing from a batch reply are re-queried one by one. A batch
 * rejected with JSON_DECODE_FAIL or INTERNAL_UNKNOWN switches batching off
 * for the lifetime of the protocol and the query is retried.
 *
 * List results carrying "start_index"/"sum" are paged until complete.
 */
class SmartProtocol : public BaseProtocol {
public:
    static constexpr int kDefaultBatchSize = 5;

    SmartProtocol(std::unique_ptr<transport::ITransport> transport, const std::string& host,
                  int batch_size = kDefaultBatchSize);

    int batch_size() const { return batch_size_.load(); }

    // Single request envelope
    nlohmann::json make_request(const std::string& method, const nlohmann::json& params) const;

    // Methods never placed inside a multipleRequest
    static const std::set<std::string>& force_single_methods();

protected:
    bool execute(const nlohmann::json& request, QueryResponse& response, Status& status) override;
    nlohmann::json redact_for_log(const nlohmann::json& data) const override;

    // SMARTCAM sends even single methods as multipleRequest
    virtual bool always_multiple() const { return false; }

private:
    std::string terminal_uuid_;
    std::atomic<int> batch_size_;
    bool method_missing_logged_ = false;

    bool execute_single(const std::string& method, const nlohmann::json& params, bool strict, bool paginate,
                        QueryResponse& response, Status& status);
    bool execute_multiple(const nlohmann::json& request, QueryResponse& response, Status& status);
    bool fetch_remaining_pages(const std::string& method, nlohmann::json& result, Status& status);

    // Turns a reply envelope into a fragment. With strict set, authentication
    // and retryable codes abort the query instead of becoming markers.
    bool classify(const nlohmann::json& reply, const std::string& method, bool strict, ReplyFragment& fragment,
                  Status& status);
};

}  // namespace protocol
}  // namespace kasa
