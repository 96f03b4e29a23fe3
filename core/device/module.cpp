#include "module.hpp"

#include <algorithm>

#include "device.hpp"
#include "logging/logger.hpp"

namespace kasa {
namespace device {

Module::Module(Device& device, const std::string& name, const std::string& required_component)
    : device_(device), name_(name), required_component_(required_component) {}

int Module::supported_version() const {
    if (required_component_.empty()) {
        return -1;
    }
    auto components = device_.components();
    auto it = components.find(required_component_);
    return it == components.end() ? -1 : it->second;
}

namespace {

// Fragment for key from the device's own update, falling back to the parent's
const protocol::ReplyFragment* find_fragment(const Device& device, const std::string& key,
                                             std::shared_ptr<const protocol::QueryResponse>& own,
                                             std::shared_ptr<const protocol::QueryResponse>& parent) {
    if (!own) {
        own = device.last_update();
    }
    auto it = own->find(key);
    if (it != own->end()) {
        return &it->second;
    }
    if (device.parent() != nullptr) {
        if (!parent) {
            parent = device.parent()->last_update();
        }
        auto pit = parent->find(key);
        if (pit != parent->end()) {
            return &pit->second;
        }
    }
    return nullptr;
}

}  // namespace

nlohmann::json Module::data() const {
    nlohmann::json query_keys = query();
    if (!query_keys.is_object() || query_keys.empty()) {
        return device_.sys_info();
    }

    std::shared_ptr<const protocol::QueryResponse> own;
    std::shared_ptr<const protocol::QueryResponse> parent;
    nlohmann::json result = nlohmann::json::object();
    for (auto it = query_keys.begin(); it != query_keys.end(); ++it) {
        const protocol::ReplyFragment* fragment = find_fragment(device_, it.key(), own, parent);
        if (fragment == nullptr || fragment->is_error()) {
            return nullptr;
        }
        result[it.key()] = fragment->data;
    }
    if (result.size() == 1) {
        return result.begin().value();
    }
    return result;
}

bool Module::has_data_error() const { return data_error_code() != 0; }

int Module::data_error_code() const {
    nlohmann::json query_keys = query();
    if (!query_keys.is_object() || query_keys.empty()) {
        return 0;
    }
    std::shared_ptr<const protocol::QueryResponse> own;
    std::shared_ptr<const protocol::QueryResponse> parent;
    for (auto it = query_keys.begin(); it != query_keys.end(); ++it) {
        const protocol::ReplyFragment* fragment = find_fragment(device_, it.key(), own, parent);
        if (fragment == nullptr) {
            return static_cast<int>(protocol::SmartErrorCode::INTERNAL_QUERY_ERROR);
        }
        if (fragment->is_error()) {
            return fragment->error_code;
        }
    }
    return 0;
}

Status Module::call(const std::string& method, const nlohmann::json& params, nlohmann::json* result) {
    nlohmann::json payload = params.is_null() ? nlohmann::json::object() : params;
    Status status = device_.query_key(method, payload, result);
    reset_update_time();
    if (!status.ok()) {
        LOG_WARN("[Module] " << name_ << " call " << method << " failed: " << status.message);
    }
    return status;
}

const std::vector<FeatureDescriptor>& Module::feature_descriptors() {
    if (!features_initialized_) {
        features_initialized_ = true;
        initialize_features();
    }
    return features_;
}

void Module::add_feature(FeatureDescriptor descriptor) { features_.push_back(std::move(descriptor)); }

bool Module::should_query(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
    if (!last_queried_at_) {
        return true;
    }
    std::chrono::milliseconds interval = minimum_update_interval();
    if (error_count_ > 0) {
        interval = std::max<std::chrono::milliseconds>(interval, kErrorBackoff);
    }
    return now - *last_queried_at_ >= interval;
}

void Module::record_update(Clock::time_point now, bool errored) {
    std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
    last_queried_at_ = now;
    error_count_ = errored ? error_count_ + 1 : 0;
}

void Module::reset_update_time() {
    std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
    last_queried_at_.reset();
}

std::optional<Module::Clock::time_point> Module::last_queried_at() const {
    std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
    return last_queried_at_;
}

int Module::error_count() const {
    std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
    return error_count_;
}

bool Module::is_disabled() const { return !is_critical() && error_count() >= kDisableAfterErrorCount; }

}  // namespace device
}  // namespace kasa
