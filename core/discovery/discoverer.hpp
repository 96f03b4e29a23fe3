#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "common/status.hpp"
#include "connection/device_config.hpp"
#include "connection/negotiator.hpp"
#include "datagram_channel.hpp"
#include "device/device.hpp"
#include "device/device_factory.hpp"
#include "discovery_result.hpp"
#include "events/event_emitter.hpp"

namespace kasa {
namespace discovery {

struct DiscoveryOptions {
    static constexpr int kDefaultTimeoutMs = 5000;
    static constexpr int kDefaultPackets = 3;
    static constexpr size_t kDefaultConcurrencyLimit = 8;

    std::string target = "255.255.255.255";  // broadcast address for discover()
    int discovery_timeout_ms = kDefaultTimeoutMs;
    int discovery_packets = kDefaultPackets;  // probes spread evenly over the window
    std::optional<int> port;                  // replaces 9999 for probes and device connections
    std::optional<int> timeout_s;             // per-request timeout of created devices
    std::optional<connection::Credentials> credentials;
    size_t concurrency_limit = kDefaultConcurrencyLimit;
    bool refresh_devices = true;  // run the first refresh before reporting a device
    std::string interface;        // bind probes to one network interface
};

// Outcome for one host
struct HostResult {
    std::string host;
    std::shared_ptr<device::Device> device;  // set when discovered
    Status status;                           // UNSUPPORTED_DEVICE, AUTHENTICATION_ERROR, ...
    std::optional<DiscoveryResult> discovery;

    bool ok() const { return device != nullptr; }
    bool auth_failed() const { return status.code == StatusCode::AUTHENTICATION_ERROR; }
};

struct BroadcastResult {
    Status status;  // failure to open or use the discovery socket
    std::map<std::string, std::shared_ptr<device::Device>> devices;
    std::map<std::string, HostResult> unsupported;
    std::map<std::string, HostResult> auth_failed;
};

/**
 * @brief Finds devices with UDP probes and turns replies into connected devices
 *
 * Both probes (XOR on 9999, TDP on 20002) are sent discovery_packets times
 * over the window. A reply names its recipe; the device is built for it and,
 * with refresh_devices, refreshed once. A reply naming a family but no
 * encryption scheme is resolved through the Negotiator.
 *
 * Every decoded reply emits a RawDiscoveryEvent; every host then emits
 * exactly one DeviceDiscoveredEvent or DeviceUnsupportedEvent.
 *
 * Broadcast classification runs on worker threads gated by a
 * ConcurrencyLimiter. Negotiation starts no attempt past the window and
 * workers still waiting for a permit give up when it closes. Hosts still in
 * progress then are reported as timed out; discover() joins the workers,
 * which disconnect any device they finish late, before returning.
 *
 * discover_single() spends one window on both the reply and the setup.
 */
class Discoverer {
public:
    using Clock = std::chrono::steady_clock;

    explicit Discoverer(std::shared_ptr<device::DeviceFactory> factory,
                        std::shared_ptr<connection::Negotiator> negotiator = nullptr,
                        std::shared_ptr<events::EventEmitter> events = nullptr,
                        DatagramChannelFactory channels = nullptr);

    HostResult discover_single(const std::string& host, const DiscoveryOptions& options = DiscoveryOptions());

    BroadcastResult discover(const DiscoveryOptions& options = DiscoveryOptions());

    // Decodes and classifies one reply, emitting the raw event only
    HostResult classify(const Datagram& datagram, const DiscoveryOptions& options,
                        std::optional<Clock::time_point> deadline = std::nullopt) const;

private:
    std::shared_ptr<device::DeviceFactory> factory_;
    std::shared_ptr<connection::Negotiator> negotiator_;
    std::shared_ptr<events::EventEmitter> events_;
    DatagramChannelFactory channels_;

    bool send_probes(IDatagramChannel& channel, const std::string& address, const DiscoveryOptions& options,
                     Status& status) const;
};

}  // namespace discovery
}  // namespace kasa
