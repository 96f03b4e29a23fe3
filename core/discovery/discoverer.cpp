#include "discoverer.hpp"

#include <algorithm>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>
#include <vector>

#include "concurrency_limiter.hpp"
#include "logging/logger.hpp"
#include "protocol/redaction.hpp"

namespace kasa {
namespace discovery {

namespace {

using Clock = Discoverer::Clock;

struct Collaborators {
    std::shared_ptr<device::DeviceFactory> factory;
    std::shared_ptr<connection::Negotiator> negotiator;
    std::shared_ptr<events::EventEmitter> events;
};

int remaining_ms(Clock::time_point until) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

int legacy_port(const DiscoveryOptions& options) { return options.port.value_or(kLegacyDiscoveryPort); }

connection::DeviceConfig config_for_host(const std::string& host, const DiscoveryOptions& options) {
    connection::DeviceConfig config;
    config.host = host;
    config.port_override = options.port;
    config.credentials = options.credentials;
    if (options.timeout_s) {
        config.timeout_s = *options.timeout_s;
    }
    config.discovery_timeout_s = std::max(1, (options.discovery_timeout_ms + 999) / 1000);
    return config;
}

void emit_outcome(const std::shared_ptr<events::EventEmitter>& emitter, const HostResult& result) {
    if (!emitter) {
        return;
    }
    if (result.ok()) {
        events::DeviceDiscoveredEvent event;
        event.host = result.host;
        event.device = result.device;
        event.timestamp_ms = events::now_epoch_ms();
        emitter->emit(event);
        return;
    }
    events::DeviceUnsupportedEvent event;
    event.host = result.host;
    event.reason = result.status;
    if (result.discovery) {
        event.discovery = result.discovery->raw;
    }
    event.timestamp_ms = events::now_epoch_ms();
    emitter->emit(event);
}

HostResult unsupported(const std::string& host, const Status& status,
                       std::optional<DiscoveryResult> discovery = std::nullopt) {
    HostResult result;
    result.host = host;
    result.status = status;
    result.discovery = std::move(discovery);
    return result;
}

// A negotiation where some candidate was rejected for credentials is reported as an auth failure
Status negotiation_failure(const connection::NegotiationResult& negotiation) {
    for (const auto& attempt : negotiation.attempts) {
        if (attempt.status.code == StatusCode::AUTHENTICATION_ERROR) {
            return attempt.status;
        }
    }
    return negotiation.status;
}

HostResult classify_reply(const Collaborators& with, const Datagram& datagram, const DiscoveryOptions& options,
                          std::optional<Clock::time_point> deadline) {
    const std::string& host = datagram.host;
    int legacy = legacy_port(options);
    Status status;

    nlohmann::json reply;
    if (!decode_discovery_reply(datagram.payload, datagram.port, legacy, reply, status)) {
        LOG_DEBUG("[Discovery] Unable to read reply from " << host << ": " << status.message);
        return unsupported(host, status);
    }

    bool is_legacy = datagram.port == legacy;
    LOG_DEBUG("[Discovery] " << host << ":" << datagram.port << " << "
                             << protocol::redact_data(reply, is_legacy ? protocol::iot_redactors()
                                                                       : protocol::smart_redactors())
                                    .dump());

    if (with.events) {
        events::RawDiscoveryEvent event;
        event.host = host;
        event.port = datagram.port;
        event.payload = reply;
        event.timestamp_ms = events::now_epoch_ms();
        with.events->emit(event);
    }

    DiscoveryResult result;
    if (!parse_discovery_result(reply, host, datagram.port, is_legacy, result, status)) {
        LOG_DEBUG("[Discovery] " << status.message);
        HostResult out = unsupported(host, status);
        out.discovery = DiscoveryResult();
        out.discovery->ip = host;
        out.discovery->port = datagram.port;
        out.discovery->legacy = is_legacy;
        out.discovery->raw = reply;
        return out;
    }

    connection::DeviceConfig config = config_for_host(host, options);
    connection::ConnectionRecipe recipe;
    bool ambiguous = false;
    if (!recipe_for_result(result, recipe, ambiguous, status)) {
        if (!ambiguous) {
            LOG_DEBUG("[Discovery] " << status.message);
            return unsupported(host, status, result);
        }
        if (!with.negotiator) {
            return unsupported(host, status, result);
        }

        LOG_INFO("[Discovery] " << host << " (" << result.device_type << ") did not name a recipe, negotiating");
        connection::NegotiationResult negotiation = with.negotiator->try_connect_all(config, nullptr, deadline);
        if (!negotiation.ok()) {
            return unsupported(host, negotiation_failure(negotiation), result);
        }
        HostResult out;
        out.host = host;
        out.device = negotiation.device;
        out.discovery = std::move(result);
        return out;
    }

    config.connection_type = recipe;
    std::shared_ptr<device::Device> device = options.refresh_devices ? with.factory->connect(config, status)
                                                                     : with.factory->create(config, status);
    if (!device) {
        LOG_WARN("[Discovery] " << host << " (" << recipe.to_string() << "): " << status);
        return unsupported(host, status, result);
    }

    HostResult out;
    out.host = host;
    out.device = std::move(device);
    out.discovery = std::move(result);
    return out;
}

// Shared between the receive loop and its classification workers
struct BroadcastState {
    Collaborators with;
    DiscoveryOptions options;
    Clock::time_point deadline;
    ConcurrencyLimiter limiter;

    std::mutex mutex;
    bool closed = false;
    std::set<std::string> pending;
    BroadcastResult result;

    BroadcastState(Collaborators collaborators, const DiscoveryOptions& opts, Clock::time_point end)
        : with(std::move(collaborators)), options(opts), deadline(end), limiter(opts.concurrency_limit) {}

    void record(HostResult outcome) {
        if (outcome.ok()) {
            result.devices[outcome.host] = outcome.device;
        } else if (outcome.auth_failed()) {
            result.auth_failed[outcome.host] = std::move(outcome);
        } else {
            result.unsupported[outcome.host] = std::move(outcome);
        }
    }

    void finish(HostResult outcome) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed) {
                if (outcome.device) {
                    LOG_DEBUG("[Discovery] Dropping late device " << outcome.host);
                    outcome.device->disconnect();
                }
                return;
            }
            pending.erase(outcome.host);
            record(outcome);
        }
        emit_outcome(with.events, outcome);
    }
};

void classify_worker(std::shared_ptr<BroadcastState> state, Datagram datagram) {
    std::optional<ConcurrencyLimiter::Permit> permit = state->limiter.acquire_until(state->deadline);
    if (!permit) {
        return;
    }
    HostResult outcome = classify_reply(state->with, datagram, state->options, state->deadline);
    permit.reset();
    state->finish(std::move(outcome));
}

}  // namespace

Discoverer::Discoverer(std::shared_ptr<device::DeviceFactory> factory,
                       std::shared_ptr<connection::Negotiator> negotiator,
                       std::shared_ptr<events::EventEmitter> events, DatagramChannelFactory channels)
    : factory_(std::move(factory)),
      negotiator_(std::move(negotiator)),
      events_(std::move(events)),
      channels_(std::move(channels)) {
    if (!factory_) {
        factory_ = std::make_shared<device::DeviceFactory>();
    }
    if (!channels_) {
        channels_ = [](const std::string& interface) { return std::make_unique<UdpDatagramChannel>(interface); };
    }
}

bool Discoverer::send_probes(IDatagramChannel& channel, const std::string& address, const DiscoveryOptions& options,
                             Status& status) const {
    static const std::vector<uint8_t> legacy_query = legacy_discovery_query();
    static const std::vector<uint8_t> tdp_query = discovery_query();

    if (!channel.send_to(address, legacy_port(options), legacy_query, status)) {
        return false;
    }
    return channel.send_to(address, kDiscoveryPort, tdp_query, status);
}

HostResult Discoverer::classify(const Datagram& datagram, const DiscoveryOptions& options,
                                std::optional<Clock::time_point> deadline) const {
    return classify_reply(Collaborators{factory_, negotiator_, events_}, datagram, options, deadline);
}

HostResult Discoverer::discover_single(const std::string& host, const DiscoveryOptions& options) {
    Status status;
    std::string address;
    if (!resolve_ipv4(host, address, status)) {
        LOG_WARN("[Discovery] " << status.message);
        return unsupported(host, status);
    }

    std::unique_ptr<IDatagramChannel> channel = channels_(options.interface);
    if (!channel->open(status)) {
        LOG_ERROR("[Discovery] Unable to open discovery socket: " << status.message);
        return unsupported(host, status);
    }

    const auto start = Clock::now();
    const auto deadline = start + std::chrono::milliseconds(options.discovery_timeout_ms);
    const int packets = std::max(1, options.discovery_packets);
    const auto spacing = std::chrono::milliseconds(options.discovery_timeout_ms) / packets;
    const int legacy = legacy_port(options);

    LOG_DEBUG("[Discovery] Probing " << host << " (" << address << ") for " << options.discovery_timeout_ms << "ms");

    std::optional<Datagram> reply;
    int sent = 0;
    auto next_send = start;
    while (!reply && Clock::now() < deadline) {
        if (sent < packets && Clock::now() >= next_send) {
            if (!send_probes(*channel, address, options, status)) {
                LOG_WARN("[Discovery] " << status.message);
            }
            ++sent;
            next_send += spacing;
        }

        auto wake = sent < packets ? std::min(next_send, deadline) : deadline;
        std::optional<Datagram> datagram = channel->receive(remaining_ms(wake), status);
        if (!datagram) {
            if (status.code != StatusCode::TIMEOUT) {
                LOG_DEBUG("[Discovery] " << status.message);
            }
            continue;
        }
        if (datagram->host != address || (datagram->port != legacy && datagram->port != kDiscoveryPort)) {
            continue;
        }
        reply = std::move(datagram);
    }
    channel->close();

    HostResult outcome;
    if (!reply) {
        outcome = unsupported(host, Status::error(StatusCode::UNSUPPORTED_DEVICE,
                                                  "Timed out getting discovery response for " + host));
        LOG_INFO("[Discovery] " << outcome.status.message);
    } else {
        outcome = classify(*reply, options, deadline);
        outcome.host = host;
    }
    emit_outcome(events_, outcome);
    return outcome;
}

BroadcastResult Discoverer::discover(const DiscoveryOptions& options) {
    Status status;
    std::string address;
    if (!resolve_ipv4(options.target, address, status)) {
        BroadcastResult result;
        result.status = status;
        return result;
    }

    std::unique_ptr<IDatagramChannel> channel = channels_(options.interface);
    if (!channel->open(status)) {
        LOG_ERROR("[Discovery] Unable to open discovery socket: " << status.message);
        BroadcastResult result;
        result.status = status;
        return result;
    }

    const auto start = Clock::now();
    const auto deadline = start + std::chrono::milliseconds(options.discovery_timeout_ms);
    const int packets = std::max(1, options.discovery_packets);
    const auto spacing = std::chrono::milliseconds(options.discovery_timeout_ms) / packets;
    const int legacy = legacy_port(options);

    auto state = std::make_shared<BroadcastState>(Collaborators{factory_, negotiator_, events_}, options, deadline);

    LOG_INFO("[Discovery] Broadcasting to " << address << " for " << options.discovery_timeout_ms << "ms");

    std::set<std::string> seen;
    std::vector<std::thread> workers;
    int sent = 0;
    auto next_send = start;
    while (Clock::now() < deadline) {
        if (sent < packets && Clock::now() >= next_send) {
            if (!send_probes(*channel, address, options, status)) {
                LOG_WARN("[Discovery] " << status.message);
            }
            ++sent;
            next_send += spacing;
        }

        auto wake = sent < packets ? std::min(next_send, deadline) : deadline;
        std::optional<Datagram> datagram = channel->receive(remaining_ms(wake), status);
        if (!datagram) {
            if (status.code != StatusCode::TIMEOUT) {
                LOG_DEBUG("[Discovery] " << status.message);
            }
            continue;
        }
        if (datagram->port != legacy && datagram->port != kDiscoveryPort) {
            continue;
        }
        if (!seen.insert(datagram->host).second) {
            continue;
        }

        const std::string reply_host = datagram->host;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->pending.insert(reply_host);
        }
        try {
            workers.emplace_back(classify_worker, state, std::move(*datagram));
        } catch (const std::system_error& e) {
            LOG_ERROR("[Discovery] Unable to start worker for " << reply_host << ": " << e.what());
            state->finish(unsupported(reply_host, Status::error(StatusCode::INTERNAL, e.what())));
        }
    }
    channel->close();

    std::vector<HostResult> abandoned;
    BroadcastResult result;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->closed = true;
        for (const auto& host : state->pending) {
            HostResult timed_out =
                unsupported(host, Status::error(StatusCode::TIMEOUT,
                                                "Discovery window closed before " + host + " was classified"));
            state->record(timed_out);
            abandoned.push_back(std::move(timed_out));
        }
        state->pending.clear();
        result = state->result;
    }
    for (const auto& outcome : abandoned) {
        emit_outcome(events_, outcome);
    }

    // Late workers only disconnect what they built
    if (!workers.empty()) {
        LOG_DEBUG("[Discovery] Waiting for " << workers.size() << " worker(s)");
    }
    for (auto& worker : workers) {
        worker.join();
    }

    LOG_INFO("[Discovery] Found " << result.devices.size() << " device(s), " << result.unsupported.size()
                                  << " unsupported, " << result.auth_failed.size() << " rejected credentials");
    return result;
}

}  // namespace discovery
}  // namespace kasa
