#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config.hpp"
#include "connection/negotiator.hpp"
#include "connection/recipe_cache.hpp"
#include "device/device.hpp"
#include "device/device_factory.hpp"
#include "discovery/discoverer.hpp"
#include "events/event_emitter.hpp"

namespace kasa {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const RuntimeConfig& config, std::shared_ptr<device::DeviceFactory> factory = nullptr);
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // Loads the recipe cache, connects configured devices, runs startup discovery
    bool initialize(std::string& error);

    // Main runtime loop (blocking)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Disconnects devices, releases the subscription, saves the cache
    void shutdown();

    // Refreshes every device once; returns the number that failed
    size_t poll_once();

    // Logs and discards pending discovery events; returns how many were drained
    size_t drain_events();

    std::vector<std::shared_ptr<device::Device>> devices() const;
    std::shared_ptr<device::Device> get_device(const std::string& host) const;

    events::EventEmitter& get_event_emitter() { return *event_emitter_; }
    connection::RecipeCache& get_recipe_cache() { return *recipe_cache_; }

private:
    // Staged initialization helpers
    bool init_core_services(std::string& error);
    void init_devices();
    void init_discovery();

    std::shared_ptr<device::Device> connect_device(const connection::DeviceConfig& device_config);
    void add_device(const std::shared_ptr<device::Device>& device);
    discovery::DiscoveryOptions discovery_options() const;

    RuntimeConfig config_;

    std::shared_ptr<device::DeviceFactory> factory_;
    std::shared_ptr<connection::RecipeCache> recipe_cache_;
    std::shared_ptr<connection::Negotiator> negotiator_;
    std::shared_ptr<events::EventEmitter> event_emitter_;
    std::unique_ptr<events::Subscription> subscription_;
    size_t reported_drops_ = 0;
    std::unique_ptr<discovery::Discoverer> discoverer_;

    mutable std::mutex devices_mutex_;
    std::map<std::string, std::shared_ptr<device::Device>> devices_;

    std::atomic<bool> running_{false};
    bool shut_down_ = false;
};

}  // namespace runtime
}  // namespace kasa
