#include "protocol.hpp"

#include <thread>

#include "logging/logger.hpp"

namespace kasa {
namespace protocol {

BaseProtocol::BaseProtocol(std::unique_ptr<transport::ITransport> transport, const std::string& host)
    : transport_(std::move(transport)), host_(host) {}

void BaseProtocol::close() { transport_->close(); }

bool BaseProtocol::send_document(const nlohmann::json& document, nlohmann::json& reply, Status& status,
                                 const std::string& label) {
    bool debug_enabled = logging::Logger::is_enabled(logging::Level::LVL_DEBUG);
    if (debug_enabled) {
        nlohmann::json logged = redact_logs_ ? redact_for_log(document) : document;
        LOG_DEBUG("[Protocol] " << host_ << " " << label << " >> " << logged.dump());
    }
    if (!transport_->send(document.dump(), reply)) {
        status = transport_->last_status();
        return false;
    }
    if (!reply.is_object()) {
        status = Status::error(StatusCode::CONNECTION_ERROR, "Unexpected reply from " + host_ + ": not an object", true);
        return false;
    }
    if (debug_enabled) {
        nlohmann::json logged = redact_logs_ ? redact_for_log(reply) : reply;
        LOG_DEBUG("[Protocol] " << host_ << " " << label << " << " << logged.dump());
    }
    return true;
}

bool BaseProtocol::query(const nlohmann::json& request, QueryResponse& response) {
    std::lock_guard<std::mutex> lock(query_mutex_);

    for (int retry = 0; retry <= retry_count_; ++retry) {
        QueryResponse attempt;
        Status status;
        if (execute(request, attempt, status)) {
            response = std::move(attempt);
            status_ = Status::success();
            return true;
        }
        status_ = status;

        if (status.code == StatusCode::AUTHENTICATION_ERROR) {
            transport_->reset();
            LOG_DEBUG("[Protocol] Unable to authenticate with " << host_ << ", not retrying: " << status.message);
            return false;
        }

        if (!status.retryable && status.code != StatusCode::TIMEOUT) {
            transport_->reset();
            LOG_DEBUG("[Protocol] Unable to query " << host_ << ", not retrying: " << status.message);
            return false;
        }

        if (retry == 0) {
            LOG_DEBUG("[Protocol] " << host_ << " got a retryable error, will retry " << retry_count_
                                    << " times: " << status.message);
        }
        transport_->reset();
        if (retry >= retry_count_) {
            LOG_DEBUG("[Protocol] Giving up on " << host_ << " after " << retry << " retries");
            return false;
        }
        if (backoff_.count() > 0) {
            std::this_thread::sleep_for(backoff_);
        }
    }
    return false;
}

}  // namespace protocol
}  // namespace kasa
