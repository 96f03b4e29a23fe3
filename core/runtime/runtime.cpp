#include "runtime.hpp"

#include <chrono>
#include <type_traits>
#include <variant>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace kasa {
namespace runtime {

namespace {
constexpr int kLoopSliceMs = 100;
}  // namespace

Runtime::Runtime(const RuntimeConfig& config, std::shared_ptr<device::DeviceFactory> factory)
    : config_(config), factory_(std::move(factory)) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string& error) {
    LOG_INFO("[Runtime] Initializing kasa runtime");

    if (!init_core_services(error)) {
        return false;
    }

    init_devices();
    init_discovery();
    drain_events();

    LOG_INFO("[Runtime] Initialization complete, " << devices().size() << " device(s) connected");
    return true;
}

bool Runtime::init_core_services(std::string& error) {
    if (!factory_) {
        factory_ = std::make_shared<device::DeviceFactory>();
    }

    recipe_cache_ = std::make_shared<connection::RecipeCache>();
    if (!config_.cache.path.empty()) {
        Status status;
        if (!recipe_cache_->load(config_.cache.path, status)) {
            error = "Recipe cache load failed: " + status.message;
            return false;
        }
        LOG_INFO("[Runtime] Recipe cache loaded (" << recipe_cache_->size() << " host(s))");
    }

    negotiator_ = std::make_shared<connection::Negotiator>(factory_, recipe_cache_);

    // Default: 100 events per subscriber queue, max 32 subscribers
    event_emitter_ = std::make_shared<events::EventEmitter>(100, 32);
    subscription_ = event_emitter_->subscribe(events::EventFilter::all(), 0, "runtime");
    if (!subscription_) {
        error = "Unable to subscribe to discovery events";
        return false;
    }

    discoverer_ = std::make_unique<discovery::Discoverer>(factory_, negotiator_, event_emitter_);
    return true;
}

discovery::DiscoveryOptions Runtime::discovery_options() const {
    discovery::DiscoveryOptions options;
    options.target = config_.discovery.target;
    options.interface = config_.discovery.interface;
    options.discovery_timeout_ms = config_.discovery.timeout_ms;
    options.discovery_packets = config_.discovery.packets;
    options.port = config_.discovery.port;
    options.credentials = config_.credentials;
    options.concurrency_limit = config_.discovery.concurrency_limit;
    options.refresh_devices = config_.discovery.refresh_devices;
    return options;
}

std::shared_ptr<device::Device> Runtime::connect_device(const connection::DeviceConfig& device_config) {
    Status status;

    if (device_config.connection_type) {
        LOG_INFO("[Runtime] Connecting " << device_config.host << " with " << device_config.connection_type->to_string());
        auto device = factory_->connect(device_config, status);
        if (!device) {
            LOG_ERROR("[Runtime] Unable to connect " << device_config.host << ": " << status);
            return nullptr;
        }
        return device;
    }

    discovery::DiscoveryOptions options = discovery_options();
    options.port = device_config.port_override;
    options.timeout_s = device_config.timeout_s;
    options.credentials = device_config.credentials;

    discovery::HostResult found = discoverer_->discover_single(device_config.host, options);
    if (found.ok()) {
        return found.device;
    }
    if (found.auth_failed()) {
        LOG_ERROR("[Runtime] " << device_config.host << " rejected the configured credentials: " << found.status);
        return nullptr;
    }

    LOG_INFO("[Runtime] Discovery did not identify " << device_config.host << " (" << found.status.message
                                                     << "), trying every connection type");
    connection::NegotiationResult negotiation =
        negotiator_->try_connect_all(device_config, [](const connection::ConnectionRecipe& recipe, bool success) {
            LOG_DEBUG("[Runtime]   " << recipe.to_string() << ": " << (success ? "ok" : "failed"));
        });
    if (!negotiation.ok()) {
        LOG_ERROR("[Runtime] Unable to connect " << device_config.host << ": " << negotiation.status.message);
        return nullptr;
    }
    return negotiation.device;
}

void Runtime::add_device(const std::shared_ptr<device::Device>& device) {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    auto it = devices_.find(device->host());
    if (it != devices_.end()) {
        if (it->second != device) {
            device->disconnect();
        }
        return;
    }
    devices_[device->host()] = device;
    LOG_INFO("[Runtime] Device " << device->host() << " ready: " << device->alias() << " (" << device->model()
                                 << ", " << device->modules().size() << " modules, " << device->features().size()
                                 << " features)");
}

void Runtime::init_devices() {
    for (const auto& device_config : config_.devices) {
        auto device = connect_device(device_config);
        if (device) {
            add_device(device);
        }
    }
}

void Runtime::init_discovery() {
    if (!config_.discovery.enabled) {
        LOG_INFO("[Runtime] Startup discovery disabled in config");
        return;
    }

    discovery::BroadcastResult result = discoverer_->discover(discovery_options());
    if (!result.status.ok()) {
        LOG_WARN("[Runtime] Discovery failed: " << result.status);
        return;
    }
    for (const auto& entry : result.devices) {
        add_device(entry.second);
    }
    for (const auto& entry : result.auth_failed) {
        LOG_WARN("[Runtime] " << entry.first << " rejected the configured credentials");
    }
}

size_t Runtime::drain_events() {
    if (!subscription_) {
        return 0;
    }

    std::vector<events::Event> pending = subscription_->drain();
    for (const auto& event : pending) {
        std::visit(
            [](auto&& e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, events::DeviceDiscoveredEvent>) {
                    LOG_INFO("[Runtime] Event " << e.event_id << ": discovered " << e.host << " ("
                                                << (e.device ? e.device->model() : std::string("?")) << ")");
                } else if constexpr (std::is_same_v<T, events::DeviceUnsupportedEvent>) {
                    LOG_INFO("[Runtime] Event " << e.event_id << ": unsupported " << e.host << ": " << e.reason);
                } else {
                    LOG_DEBUG("[Runtime] Event " << e.event_id << ": raw reply from " << e.host << ":" << e.port);
                }
            },
            event);
    }
    size_t dropped = subscription_->dropped_count();
    if (dropped > reported_drops_) {
        LOG_WARN("[Runtime] " << dropped - reported_drops_ << " discovery event(s) dropped");
        reported_drops_ = dropped;
    }
    return pending.size();
}

size_t Runtime::poll_once() {
    size_t failures = 0;
    for (const auto& device : devices()) {
        Status status = device->refresh();
        if (!status.ok()) {
            ++failures;
            LOG_WARN("[Runtime] Refresh of " << device->host() << " failed: " << status);
            continue;
        }
        if (logging::Logger::is_enabled(logging::Level::LVL_DEBUG)) {
            for (const auto& feature : device->features()) {
                LOG_DEBUG("[Runtime] " << device->host() << " " << feature);
            }
        }
    }
    return failures;
}

std::vector<std::shared_ptr<device::Device>> Runtime::devices() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    std::vector<std::shared_ptr<device::Device>> result;
    result.reserve(devices_.size());
    for (const auto& entry : devices_) {
        result.push_back(entry.second);
    }
    return result;
}

std::shared_ptr<device::Device> Runtime::get_device(const std::string& host) const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    auto it = devices_.find(host);
    return it == devices_.end() ? nullptr : it->second;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Polling " << devices().size() << " device(s) every " << config_.polling.interval_ms
                                  << "ms, Ctrl+C to exit");
    running_ = true;

    const auto interval = std::chrono::milliseconds(config_.polling.interval_ms);
    auto next_poll = std::chrono::steady_clock::now();

    while (running_) {
        if (std::chrono::steady_clock::now() >= next_poll) {
            size_t failures = poll_once();
            if (failures > 0) {
                LOG_DEBUG("[Runtime] " << failures << " device(s) failed this cycle");
            }
            next_poll = std::chrono::steady_clock::now() + interval;
        }
        drain_events();

        if (!SignalHandler::wait_for(kLoopSliceMs)) {
            LOG_INFO("[Runtime] Signal " << SignalHandler::last_signal() << " received, stopping");
            break;
        }
    }
    running_ = false;

    LOG_INFO("[Runtime] Main loop stopped");
}

void Runtime::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    std::map<std::string, std::shared_ptr<device::Device>> devices;
    {
        std::lock_guard<std::mutex> lock(devices_mutex_);
        devices.swap(devices_);
    }
    for (const auto& entry : devices) {
        LOG_DEBUG("[Runtime] Disconnecting " << entry.first);
        entry.second->disconnect();
    }

    // Release the subscription before the emitter goes away
    subscription_.reset();

    if (recipe_cache_ && !config_.cache.path.empty()) {
        Status status;
        if (!recipe_cache_->save(config_.cache.path, status)) {
            LOG_ERROR("[Runtime] Recipe cache save failed: " << status.message);
        } else {
            LOG_INFO("[Runtime] Recipe cache saved (" << recipe_cache_->size() << " host(s))");
        }
    }
}

}  // namespace runtime
}  // namespace kasa
