#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/status.hpp"

namespace kasa {
namespace discovery {

struct Datagram {
    std::string host;  // dotted IPv4 of the sender
    int port = 0;
    std::vector<uint8_t> payload;
};

/**
 * @brief Unconnected datagram socket used for discovery probes
 *
 * receive() returns nullopt both on timeout and on error; status tells them
 * apart (TIMEOUT vs CONNECTION_ERROR).
 */
class IDatagramChannel {
public:
    virtual ~IDatagramChannel() = default;

    virtual bool open(Status& status) = 0;
    virtual bool send_to(const std::string& host, int port, const std::vector<uint8_t>& payload, Status& status) = 0;
    virtual std::optional<Datagram> receive(int timeout_ms, Status& status) = 0;
    virtual void close() = 0;
};

// Builds a channel bound to the given interface (empty = any)
using DatagramChannelFactory = std::function<std::unique_ptr<IDatagramChannel>(const std::string& interface)>;

// UDP socket with broadcast enabled, bound to an ephemeral port
class UdpDatagramChannel : public IDatagramChannel {
public:
    static constexpr size_t kMaxDatagramSize = 65536;

    // interface: optional SO_BINDTODEVICE target
    explicit UdpDatagramChannel(const std::string& interface = "");
    ~UdpDatagramChannel() override;

    UdpDatagramChannel(const UdpDatagramChannel&) = delete;
    UdpDatagramChannel& operator=(const UdpDatagramChannel&) = delete;

    bool open(Status& status) override;
    bool send_to(const std::string& host, int port, const std::vector<uint8_t>& payload, Status& status) override;
    std::optional<Datagram> receive(int timeout_ms, Status& status) override;
    void close() override;

private:
    std::string interface_;
    int fd_ = -1;
};

// Resolves a hostname or dotted address to dotted IPv4; CONNECTION_ERROR on failure
bool resolve_ipv4(const std::string& host, std::string& address, Status& status);

}  // namespace discovery
}  // namespace kasa
