#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

#include "common/status.hpp"
#include "smart_error_code.hpp"
#include "transport/transport.hpp"

namespace kasa {
namespace protocol {

// Reply for one top-level query key: data, or the device error code reported for it
struct ReplyFragment {
    nlohmann::json data;
    int error_code = 0;

    bool is_error() const { return error_code != 0; }

    static ReplyFragment ok(nlohmann::json data) {
        ReplyFragment fragment;
        fragment.data = std::move(data);
        return fragment;
    }

    static ReplyFragment error(SmartErrorCode code) {
        ReplyFragment fragment;
        fragment.error_code = static_cast<int>(code);
        return fragment;
    }

    bool operator==(const ReplyFragment& other) const {
        return error_code == other.error_code && data == other.data;
    }
};

// Demultiplexed reply keyed by the request's top-level keys
using QueryResponse = std::map<std::string, ReplyFragment>;

/**
 * @brief Request framing and batching above a transport
 *
 * query() takes a JSON object whose top-level keys are the protocol's query
 * keys (SMART method names, IOT module names) and returns one fragment per
 * key that the device answered. Per-key device errors are returned as error
 * fragments with query() still succeeding. query() fails (returns false) only
 * when the exchange itself fails: network, authentication, or an error for
 * the whole request.
 */
class IProtocol {
public:
    virtual ~IProtocol() = default;

    virtual bool query(const nlohmann::json& request, QueryResponse& response) = 0;

    virtual void close() = 0;

    virtual std::string host() const = 0;
    virtual std::string credentials_hash() const = 0;

    virtual const Status& last_status() const = 0;
};

/**
 * @brief Retry loop shared by the concrete protocols
 *
 * - AUTHENTICATION_ERROR: transport reset, no retry
 * - retryable errors and timeouts: transport reset, back off, retry
 * - anything else: transport reset, no retry
 *
 * Queries are serialized by an internal mutex.
 */
class BaseProtocol : public IProtocol {
public:
    static constexpr int kDefaultRetryCount = 3;

    BaseProtocol(std::unique_ptr<transport::ITransport> transport, const std::string& host);

    bool query(const nlohmann::json& request, QueryResponse& response) override;
    void close() override;

    std::string host() const override { return host_; }
    std::string credentials_hash() const override { return transport_->credentials_hash(); }
    const Status& last_status() const override { return status_; }

    void set_retry_count(int retry_count) { retry_count_ = retry_count; }
    void set_backoff(std::chrono::milliseconds backoff) { backoff_ = backoff; }

    // Wire payloads are logged through the redaction hook unless disabled
    void set_redact_logs(bool redact) { redact_logs_ = redact; }

protected:
    // One attempt; on failure fills status
    virtual bool execute(const nlohmann::json& request, QueryResponse& response, Status& status) = 0;

    // Sends one document through the transport, logging it at DEBUG
    bool send_document(const nlohmann::json& document, nlohmann::json& reply, Status& status,
                       const std::string& label);

    // Redacts a reply before it reaches the debug log
    virtual nlohmann::json redact_for_log(const nlohmann::json& data) const { return data; }

    transport::ITransport& transport() { return *transport_; }

private:
    std::unique_ptr<transport::ITransport> transport_;
    std::string host_;
    int retry_count_ = kDefaultRetryCount;
    std::chrono::milliseconds backoff_{1000};
    bool redact_logs_ = true;
    Status status_;
    std::mutex query_mutex_;
};

}  // namespace protocol
}  // namespace kasa
