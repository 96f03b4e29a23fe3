#pragma once

#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "common/status.hpp"
#include "feature.hpp"

namespace kasa {
namespace device {

class Device;

/**
 * @brief One capability of a device
 *
 * A module declares the query fragment it needs on every refresh and reads
 * its slice of the device's last update through data(). Modules are created
 * by the device from its catalog once the advertised components are known.
 *
 * Error handling:
 * - an errored cycle delays the next query by kErrorBackoff
 * - kDisableAfterErrorCount consecutive errors disable the module,
 *   unless it is critical
 */
class Module {
public:
    static constexpr std::chrono::seconds kErrorBackoff{30};
    static constexpr int kDisableAfterErrorCount = 10;

    using Clock = std::chrono::steady_clock;

    Module(Device& device, const std::string& name, const std::string& required_component);
    virtual ~Module() = default;

    Module(const Module&) = delete;
    Module& operator=(const Module&) = delete;

    const std::string& name() const { return name_; }

    // Component that must be advertised for the module to exist, empty for always
    const std::string& required_component() const { return required_component_; }

    // Advertised version of the required component, -1 without one
    int supported_version() const;

    // Top-level keys to query on refresh; an empty object reads from sys_info
    virtual nlohmann::json query() const = 0;

    virtual std::chrono::milliseconds minimum_update_interval() const { return std::chrono::milliseconds(0); }

    // Critical modules are never disabled by errors
    virtual bool is_critical() const { return false; }

    // Checked once after creation
    virtual bool check_supported() { return true; }

    // Re-checked after every refresh; false deactivates the module
    virtual bool is_supported() const { return true; }

    // Runs after the device's last update is replaced, in registration order
    virtual void post_update_hook() {}

    // Data for this module. A single query key is unwrapped; several keys
    // give an object keyed by query key. Null when has_data_error().
    virtual nlohmann::json data() const;

    bool has_data_error() const;

    // Device error code of the first errored key, 0 when none
    int data_error_code() const;

    // Sends one method call and resets the update time so the next refresh re-reads the module
    virtual Status call(const std::string& method, const nlohmann::json& params = nlohmann::json(),
                        nlohmann::json* result = nullptr);

    // Features declared by initialize_features()
    const std::vector<FeatureDescriptor>& feature_descriptors();

    Device& device() const { return device_; }

    // Refresh bookkeeping, driven by the owning device
    bool should_query(Clock::time_point now) const;
    void record_update(Clock::time_point now, bool errored);
    void reset_update_time();
    std::optional<Clock::time_point> last_queried_at() const;
    int error_count() const;
    bool is_disabled() const;

protected:
    virtual void initialize_features() {}
    void add_feature(FeatureDescriptor descriptor);

    Device& device_;

private:
    std::string name_;
    std::string required_component_;
    std::vector<FeatureDescriptor> features_;
    bool features_initialized_ = false;

    mutable std::mutex bookkeeping_mutex_;
    std::optional<Clock::time_point> last_queried_at_;
    int error_count_ = 0;
};

}  // namespace device
}  // namespace kasa
