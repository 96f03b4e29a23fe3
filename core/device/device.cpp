#include "device.hpp"

#include <algorithm>
#include <set>

#include "logging/logger.hpp"
#include "protocol/smart_error_code.hpp"

namespace kasa {
namespace device {

namespace {

std::string string_field(const nlohmann::json& info, const char* key) {
    if (info.is_object()) {
        auto it = info.find(key);
        if (it != info.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

}  // namespace

Device::Device(const connection::DeviceConfig& config, std::unique_ptr<protocol::IProtocol> protocol,
               ModuleCatalog catalog)
    : config_(config),
      protocol_(std::move(protocol)),
      catalog_(std::move(catalog)),
      last_update_(std::make_shared<const protocol::QueryResponse>()),
      sys_info_(std::make_shared<const nlohmann::json>(nlohmann::json::object())) {}

Device::~Device() = default;

Status Device::refresh() {
    if (parent_ != nullptr) {
        if (delegation_depth_.load() == 0) {
            return Status::error(StatusCode::INVALID_ARGUMENT, "Child devices refresh through their parent");
        }
        return parent_->refresh();
    }

    std::shared_future<Status> pending;
    std::promise<Status> promise;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(refresh_mutex_);
        if (inflight_.valid()) {
            pending = inflight_;
        } else {
            inflight_ = promise.get_future().share();
            pending = inflight_;
            owner = true;
        }
    }

    if (!owner) {
        LOG_DEBUG("[Device] " << host() << " refresh already running, waiting for it");
        return pending.get();
    }

    Status result = run_cycle();
    {
        std::lock_guard<std::mutex> lock(refresh_mutex_);
        inflight_ = std::shared_future<Status>();
    }
    promise.set_value(result);
    return result;
}

void Device::disconnect() {
    LOG_INFO("[Device] Disconnecting " << host());
    protocol_->close();
}

std::vector<std::shared_ptr<Module>> Device::modules() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return modules_;
}

std::shared_ptr<Module> Device::get_module(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    auto it = module_index_.find(name);
    if (it == module_index_.end()) {
        return nullptr;
    }
    return it->second;
}

Status Device::register_module(std::shared_ptr<Module> module) {
    if (!module) {
        return Status::error(StatusCode::INVALID_ARGUMENT, "Cannot register a null module");
    }
    nlohmann::json query = module->query();

    // Queried without state_mutex_ held: query() may read components()
    std::vector<std::shared_ptr<Module>> registered = modules();
    if (query.is_object()) {
        for (const auto& existing : registered) {
            nlohmann::json existing_query = existing->query();
            if (!existing_query.is_object()) {
                continue;
            }
            for (auto it = query.begin(); it != query.end(); ++it) {
                if (existing_query.contains(it.key())) {
                    return Status::error(StatusCode::CONFIGURATION_ERROR,
                                         "Query key '" + it.key() + "' of module " + module->name() +
                                             " is already claimed by module " + existing->name());
                }
            }
        }
    }

    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    if (module_index_.count(module->name()) > 0) {
        return Status::error(StatusCode::CONFIGURATION_ERROR, "Module already registered: " + module->name());
    }
    if (modules_.size() != registered.size()) {
        return Status::error(StatusCode::CONFIGURATION_ERROR,
                             "Module set changed while registering " + module->name());
    }
    modules_.push_back(module);
    module_index_[module->name()] = module;
    features_built_ = false;
    return Status::success();
}

std::vector<Feature> Device::features() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return features_;
}

std::optional<Feature> Device::feature(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    for (const auto& feature : features_) {
        if (feature.id() == id) {
            return feature;
        }
    }
    return std::nullopt;
}

std::shared_ptr<const protocol::QueryResponse> Device::last_update() const {
    std::lock_guard<std::mutex> lock(update_mutex_);
    return last_update_;
}

nlohmann::json Device::sys_info() const {
    std::shared_ptr<const nlohmann::json> info;
    {
        std::lock_guard<std::mutex> lock(update_mutex_);
        info = sys_info_;
    }
    return *info;
}

void Device::set_sys_info(nlohmann::json info) {
    auto next = std::make_shared<const nlohmann::json>(std::move(info));
    std::lock_guard<std::mutex> lock(update_mutex_);
    sys_info_ = next;
}

std::map<std::string, int> Device::components() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return components_;
}

bool Device::has_component(const std::string& component) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return components_.count(component) > 0;
}

void Device::set_components(std::map<std::string, int> components) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    components_ = std::move(components);
}

std::vector<std::shared_ptr<Device>> Device::children() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return children_;
}

std::shared_ptr<Device> Device::get_child(const std::string& device_id) const {
    for (const auto& child : children()) {
        if (child->device_id() == device_id) {
            return child;
        }
    }
    return nullptr;
}

void Device::add_child(std::shared_ptr<Device> child) {
    child->set_parent(this);
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    children_.push_back(std::move(child));
}

std::string Device::alias() const { return string_field(sys_info(), "alias"); }

std::string Device::model() const { return string_field(sys_info(), "model"); }

std::string Device::mac() const { return string_field(sys_info(), "mac"); }

std::string Device::device_id() const { return string_field(sys_info(), "device_id"); }

std::string Device::hw_version() const { return string_field(sys_info(), "hw_ver"); }

std::string Device::fw_version() const { return string_field(sys_info(), "fw_ver"); }

std::optional<int> Device::rssi() const {
    nlohmann::json info = sys_info();
    auto it = info.find("rssi");
    if (it != info.end() && it->is_number_integer()) {
        return it->get<int>();
    }
    return std::nullopt;
}

bool Device::is_on() const {
    nlohmann::json info = sys_info();
    auto it = info.find("device_on");
    return it != info.end() && it->is_boolean() && it->get<bool>();
}

Status Device::query_key(const std::string& key, const nlohmann::json& payload, nlohmann::json* result) {
    nlohmann::json request = nlohmann::json::object();
    request[key] = payload;

    protocol::QueryResponse response;
    if (!protocol_->query(request, response)) {
        return protocol_->last_status();
    }

    auto it = response.find(key);
    if (it == response.end()) {
        return Status::error(StatusCode::DEVICE_ERROR, "No reply for " + key + " from " + host());
    }
    if (it->second.is_error()) {
        Status status = protocol::status_from_error_code(protocol::smart_error_code_from_int(it->second.error_code),
                                                         key + " on " + host());
        status.device_error_code = it->second.error_code;
        return status;
    }
    if (result != nullptr) {
        *result = it->second.data;
    }
    return Status::success();
}

Status Device::create_modules() {
    for (const auto& entry : catalog_.entries()) {
        if (!entry.required_component.empty() && !has_component(entry.required_component)) {
            continue;
        }
        std::shared_ptr<Module> module = entry.factory(*this);
        if (!module) {
            continue;
        }
        if (!module->check_supported()) {
            LOG_DEBUG("[Device] " << host() << " module " << entry.name << " not supported");
            continue;
        }
        Status status = register_module(module);
        if (!status.ok()) {
            LOG_ERROR("[Device] " << host() << ": " << status.message);
            return status;
        }
    }
    LOG_DEBUG("[Device] " << host() << " initialized " << modules().size() << " modules");
    return Status::success();
}

Status Device::run_cycle() {
    if (!initialized_.load()) {
        Status status;
        if (!negotiate(status)) {
            LOG_WARN("[Device] Negotiation with " << host() << " failed: " << status.message);
            return status;
        }
        status = create_modules();
        if (!status.ok()) {
            return status;
        }
        initialized_.store(true);
    }

    const Clock::time_point now = Clock::now();
    std::vector<std::shared_ptr<Module>> active = modules();

    nlohmann::json request = nlohmann::json::object();
    std::vector<std::shared_ptr<Module>> queried;
    std::vector<std::shared_ptr<Module>> skipped;
    for (const auto& module : active) {
        nlohmann::json query = module->query();
        if (!query.is_object() || query.empty()) {
            continue;
        }
        if (!module->should_query(now)) {
            skipped.push_back(module);
            continue;
        }
        for (auto it = query.begin(); it != query.end(); ++it) {
            request[it.key()] = it.value();
        }
        queried.push_back(module);
    }
    add_refresh_keys(request);

    protocol::QueryResponse response;
    if (!request.empty()) {
        if (!protocol_->query(request, response)) {
            Status failure = protocol_->last_status();
            LOG_WARN("[Device] Refresh of " << host() << " failed: " << failure.message);
            return failure;
        }
    }

    auto previous = last_update();
    auto next = std::make_shared<protocol::QueryResponse>();
    for (const auto& module : skipped) {
        nlohmann::json query = module->query();
        for (auto it = query.begin(); it != query.end(); ++it) {
            auto found = previous->find(it.key());
            if (found != previous->end()) {
                (*next)[it.key()] = found->second;
            }
        }
    }
    for (auto& entry : response) {
        (*next)[entry.first] = std::move(entry.second);
    }
    for (auto it = request.begin(); it != request.end(); ++it) {
        if (next->count(it.key()) == 0) {
            LOG_DEBUG("[Device] " << host() << " did not answer " << it.key());
            (*next)[it.key()] = protocol::ReplyFragment::error(protocol::SmartErrorCode::INTERNAL_QUERY_ERROR);
        }
    }
    {
        std::lock_guard<std::mutex> lock(update_mutex_);
        last_update_ = next;
    }
    apply_update(*next);

    Status children_status = refresh_children();

    for (const auto& module : queried) {
        bool errored = module->has_data_error();
        module->record_update(now, errored);
        if (errored) {
            LOG_DEBUG("[Device] " << host() << " module " << module->name() << " errored (code "
                                  << module->data_error_code() << ", count " << module->error_count() << ")");
        }
    }

    for (const auto& module : active) {
        if (!module->has_data_error()) {
            module->post_update_hook();
        }
    }

    bool changed = update_active_modules();
    bool rebuild;
    {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        rebuild = changed || !features_built_;
    }
    if (rebuild) {
        rebuild_features();
    }

    return children_status;
}

Status Device::refresh_children() {
    Status first_failure;
    for (const auto& child : children()) {
        Status status = child->update_from_parent();
        if (!status.ok()) {
            LOG_WARN("[Device] Refresh of child " << child->device_id() << " on " << host()
                                                  << " failed: " << status.message);
            if (first_failure.ok()) {
                first_failure = status;
            }
        }
    }
    return first_failure;
}

Status Device::update_from_parent() {
    if (!initialized_.load()) {
        Status status;
        if (!negotiate(status)) {
            return status;
        }
        status = create_modules();
        if (!status.ok()) {
            return status;
        }
        initialized_.store(true);
    }

    // No request of its own: module data resolves against the parent's batch
    for (const auto& module : modules()) {
        if (!module->has_data_error()) {
            module->post_update_hook();
        }
    }

    bool changed = update_active_modules();
    bool rebuild;
    {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        rebuild = changed || !features_built_;
    }
    if (rebuild) {
        rebuild_features();
    }
    return Status::success();
}

bool Device::update_active_modules() {
    std::vector<std::shared_ptr<Module>> dropped;
    for (const auto& module : modules()) {
        const std::string& component = module->required_component();
        if (!module->is_supported()) {
            LOG_INFO("[Device] " << host() << " module " << module->name() << " no longer supported");
        } else if (module->is_disabled()) {
            LOG_WARN("[Device] " << host() << " disabling module " << module->name() << " after "
                                 << module->error_count() << " consecutive errors");
        } else if (!component.empty() && !has_component(component)) {
            LOG_INFO("[Device] " << host() << " component " << component << " is gone, dropping "
                                 << module->name());
        } else {
            continue;
        }
        dropped.push_back(module);
    }
    if (dropped.empty()) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    for (const auto& module : dropped) {
        module_index_.erase(module->name());
        modules_.erase(std::remove(modules_.begin(), modules_.end(), module), modules_.end());
    }
    return true;
}

void Device::rebuild_features() {
    std::vector<Feature> built;
    std::set<std::string> ids;
    for (const auto& module : modules()) {
        for (const auto& descriptor : module->feature_descriptors()) {
            Feature feature(weak_from_this(), module->name(), descriptor);
            if (!ids.insert(feature.id()).second) {
                LOG_WARN("[Device] " << host() << " duplicate feature id '" << feature.id() << "' from module "
                                     << module->name() << ", skipping");
                continue;
            }
            built.push_back(std::move(feature));
        }
    }

    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    features_ = std::move(built);
    features_built_ = true;
}

RefreshDelegation::RefreshDelegation(Device& device) : device_(device), active_(device.parent() != nullptr) {
    if (active_) {
        device_.delegation_depth_.fetch_add(1);
    }
}

RefreshDelegation::~RefreshDelegation() {
    if (active_) {
        device_.delegation_depth_.fetch_sub(1);
    }
}

}  // namespace device
}  // namespace kasa
