#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "protocol/protocol.hpp"

namespace kasa::tests {

/**
 * @brief Scripted IProtocol that answers from a key -> fragment table
 *
 * Requested keys missing from the table are left unanswered. Every request
 * is recorded so tests can count wire exchanges and inspect their keys.
 */
class FakeProtocol : public protocol::IProtocol {
public:
    explicit FakeProtocol(const std::string& host = "127.0.0.1") : host_(host) {}

    bool query(const nlohmann::json& request, protocol::QueryResponse& response) override {
        std::function<void(const nlohmann::json&)> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            hook = on_query_;
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        if (hook) {
            hook(request);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (failure_) {
            status_ = *failure_;
            return false;
        }
        for (auto it = request.begin(); it != request.end(); ++it) {
            auto found = answers_.find(it.key());
            if (found != answers_.end()) {
                response[it.key()] = found->second;
            }
        }
        status_ = Status::success();
        return true;
    }

    void close() override { closed_ = true; }
    std::string host() const override { return host_; }
    std::string credentials_hash() const override { return ""; }
    const Status& last_status() const override { return status_; }

    // Script
    void answer(const std::string& key, nlohmann::json data) {
        std::lock_guard<std::mutex> lock(mutex_);
        answers_[key] = protocol::ReplyFragment::ok(std::move(data));
    }
    void answer_error(const std::string& key, protocol::SmartErrorCode code) {
        std::lock_guard<std::mutex> lock(mutex_);
        answers_[key] = protocol::ReplyFragment::error(code);
    }
    void drop_answer(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        answers_.erase(key);
    }
    void fail_with(std::optional<Status> failure) {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = std::move(failure);
    }
    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }
    void on_query(std::function<void(const nlohmann::json&)> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        on_query_ = std::move(hook);
    }

    // Inspection
    size_t query_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }
    std::vector<nlohmann::json> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }
    nlohmann::json last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.empty() ? nlohmann::json() : requests_.back();
    }
    void clear_requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.clear();
    }
    bool closed() const { return closed_.load(); }

private:
    std::string host_;
    mutable std::mutex mutex_;
    std::map<std::string, protocol::ReplyFragment> answers_;
    std::optional<Status> failure_;
    std::function<void(const nlohmann::json&)> on_query_;
    std::vector<nlohmann::json> requests_;
    std::chrono::milliseconds delay_{0};
    std::atomic<bool> closed_{false};
    Status status_;
};

}  // namespace kasa::tests
