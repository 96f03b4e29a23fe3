#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/status.hpp"
#include "connection/device_config.hpp"
#include "feature.hpp"
#include "module.hpp"
#include "module_catalog.hpp"
#include "protocol/protocol.hpp"

namespace kasa {
namespace device {

/**
 * @brief One connected device: protocol, modules, features, last update, children
 *
 * Refresh cycle:
 *  1. negotiate on the first refresh and create modules from the catalog
 *  2. collect the query of every active module whose interval has elapsed
 *  3. send the merged request once
 *  4. build a new last update (fresh replies, previous fragments for skipped
 *     modules, error markers for keys the device did not answer) and swap it in
 *  5. update children from the new data without a request of their own
 *  6. run post-update hooks in registration order
 *  7. deactivate unsupported/disabled modules and rebuild features
 *
 * Cycles never overlap. A refresh requested while one is running waits for
 * and returns the running cycle's result. Only a failed protocol exchange
 * fails the refresh; per-module errors stay on the module.
 *
 * Thread-safety: all public methods may be called concurrently.
 *
 * Owned through shared_ptr; features hold a weak reference to their device.
 */
class Device : public std::enable_shared_from_this<Device> {
public:
    using Clock = std::chrono::steady_clock;

    Device(const connection::DeviceConfig& config, std::unique_ptr<protocol::IProtocol> protocol,
           ModuleCatalog catalog);
    virtual ~Device();

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    Status refresh();

    // Closes the protocol; the device must not be refreshed afterwards
    void disconnect();

    bool is_initialized() const { return initialized_.load(); }

    const std::string& host() const { return config_.host; }
    const connection::DeviceConfig& config() const { return config_; }
    protocol::IProtocol& protocol() { return *protocol_; }

    // Modules in registration order
    std::vector<std::shared_ptr<Module>> modules() const;
    std::shared_ptr<Module> get_module(const std::string& name) const;

    template <typename T>
    std::shared_ptr<T> get_module_as(const std::string& name) const {
        return std::dynamic_pointer_cast<T>(get_module(name));
    }

    // Adds a module; CONFIGURATION_ERROR when its name or a query key is already claimed
    Status register_module(std::shared_ptr<Module> module);

    // Features in module registration order
    std::vector<Feature> features() const;
    std::optional<Feature> feature(const std::string& id) const;

    std::shared_ptr<const protocol::QueryResponse> last_update() const;
    nlohmann::json sys_info() const;
    std::map<std::string, int> components() const;
    bool has_component(const std::string& component) const;

    std::vector<std::shared_ptr<Device>> children() const;
    std::shared_ptr<Device> get_child(const std::string& device_id) const;
    Device* parent() const { return parent_; }

    virtual std::string alias() const;
    virtual std::string model() const;
    virtual std::string mac() const;
    virtual std::string device_id() const;
    virtual std::string hw_version() const;
    virtual std::string fw_version() const;
    virtual std::optional<int> rssi() const;
    virtual bool is_on() const;
    virtual Status set_state(bool on) = 0;

    // Hubs own battery powered children that report through the hub's child list
    virtual bool is_hub() const { return false; }

    std::string credentials_hash() const { return protocol_->credentials_hash(); }

    // Sends {key: payload} and hands back the reply for key
    Status query_key(const std::string& key, const nlohmann::json& payload, nlohmann::json* result = nullptr);

protected:
    // Reads components and sys_info, creates children
    virtual bool negotiate(Status& status) = 0;

    // Keys sent with every refresh on top of the module queries
    virtual void add_refresh_keys(nlohmann::json& request) const {}

    // Extracts sys_info and child state from a new last update
    virtual void apply_update(const protocol::QueryResponse& update) {}

    void set_sys_info(nlohmann::json info);
    void set_components(std::map<std::string, int> components);
    void add_child(std::shared_ptr<Device> child);
    void set_parent(Device* parent) { parent_ = parent; }
    const ModuleCatalog& catalog() const { return catalog_; }

    // One refresh cycle, without coalescing
    Status run_cycle();

    Device* parent_ = nullptr;

private:
    friend class RefreshDelegation;

    connection::DeviceConfig config_;
    std::unique_ptr<protocol::IProtocol> protocol_;
    ModuleCatalog catalog_;
    std::atomic<bool> initialized_{false};

    // Module, feature and child lists
    mutable std::shared_mutex state_mutex_;
    std::vector<std::shared_ptr<Module>> modules_;
    std::unordered_map<std::string, std::shared_ptr<Module>> module_index_;
    std::vector<Feature> features_;
    bool features_built_ = false;
    std::vector<std::shared_ptr<Device>> children_;
    std::map<std::string, int> components_;

    // Replaced wholesale, never mutated in place
    mutable std::mutex update_mutex_;
    std::shared_ptr<const protocol::QueryResponse> last_update_;
    std::shared_ptr<const nlohmann::json> sys_info_;

    // In-flight refresh shared by concurrent callers
    std::mutex refresh_mutex_;
    std::shared_future<Status> inflight_;

    std::atomic<int> delegation_depth_{0};

    Status create_modules();
    Status refresh_children();
    // Child side of a parent cycle; sends nothing
    Status update_from_parent();
    bool update_active_modules();
    void rebuild_features();
};

/**
 * @brief Scope during which a child's refresh() runs its parent's refresh
 *
 * Outside any scope a child refuses to refresh on its own. Has no effect on
 * a device without a parent.
 */
class RefreshDelegation {
public:
    explicit RefreshDelegation(Device& device);
    ~RefreshDelegation();

    RefreshDelegation(const RefreshDelegation&) = delete;
    RefreshDelegation& operator=(const RefreshDelegation&) = delete;

private:
    Device& device_;
    bool active_;
};

}  // namespace device
}  // namespace kasa
