#include "datagram_channel.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>

#include "logging/logger.hpp"

namespace kasa {
namespace discovery {

UdpDatagramChannel::UdpDatagramChannel(const std::string& interface) : interface_(interface) {}

UdpDatagramChannel::~UdpDatagramChannel() { close(); }

bool UdpDatagramChannel::open(Status& status) {
    if (fd_ >= 0) {
        status = Status::success();
        return true;
    }

    fd_ = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
        status = Status::error(StatusCode::CONNECTION_ERROR, "socket failed: " + std::string(strerror(errno)));
        return false;
    }

    int enable = 1;
    if (setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) < 0) {
        status = Status::error(StatusCode::CONNECTION_ERROR, "SO_BROADCAST failed: " + std::string(strerror(errno)));
        close();
        return false;
    }
    if (setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
        LOG_DEBUG("[Discovery] Unable to set SO_REUSEADDR: " << strerror(errno));
    }
#ifdef SO_BINDTODEVICE
    if (!interface_.empty() &&
        setsockopt(fd_, SOL_SOCKET, SO_BINDTODEVICE, interface_.c_str(),
                   static_cast<socklen_t>(interface_.size())) < 0) {
        status = Status::error(StatusCode::CONFIGURATION_ERROR,
                               "Unable to bind to interface " + interface_ + ": " + strerror(errno));
        close();
        return false;
    }
#endif

    struct sockaddr_in local;
    std::memset(&local, 0, sizeof(local));
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = 0;
    if (bind(fd_, reinterpret_cast<struct sockaddr*>(&local), sizeof(local)) < 0) {
        status = Status::error(StatusCode::CONNECTION_ERROR, "bind failed: " + std::string(strerror(errno)));
        close();
        return false;
    }

    status = Status::success();
    return true;
}

bool UdpDatagramChannel::send_to(const std::string& host, int port, const std::vector<uint8_t>& payload,
                                 Status& status) {
    if (fd_ < 0) {
        status = Status::error(StatusCode::CONNECTION_ERROR, "Discovery socket is not open");
        return false;
    }

    struct sockaddr_in remote;
    std::memset(&remote, 0, sizeof(remote));
    remote.sin_family = AF_INET;
    remote.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, host.c_str(), &remote.sin_addr) != 1) {
        status = Status::error(StatusCode::INVALID_ARGUMENT, "Not an IPv4 address: " + host);
        return false;
    }

    ssize_t sent;
    do {
        sent = sendto(fd_, payload.data(), payload.size(), 0, reinterpret_cast<struct sockaddr*>(&remote),
                      sizeof(remote));
    } while (sent < 0 && errno == EINTR);

    if (sent < 0) {
        status = Status::error(StatusCode::CONNECTION_ERROR,
                               "sendto " + host + ":" + std::to_string(port) + " failed: " + strerror(errno), true);
        return false;
    }
    status = Status::success();
    return true;
}

std::optional<Datagram> UdpDatagramChannel::receive(int timeout_ms, Status& status) {
    if (fd_ < 0) {
        status = Status::error(StatusCode::CONNECTION_ERROR, "Discovery socket is not open");
        return std::nullopt;
    }

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int result;
    do {
        result = poll(&pfd, 1, timeout_ms < 0 ? 0 : timeout_ms);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        status = Status::error(StatusCode::CONNECTION_ERROR, "poll failed: " + std::string(strerror(errno)));
        return std::nullopt;
    }
    if (result == 0) {
        status = Status::error(StatusCode::TIMEOUT, "No datagram within " + std::to_string(timeout_ms) + "ms", true);
        return std::nullopt;
    }

    std::vector<uint8_t> buffer(kMaxDatagramSize);
    struct sockaddr_in remote;
    socklen_t remote_len = sizeof(remote);
    ssize_t n = recvfrom(fd_, buffer.data(), buffer.size(), 0, reinterpret_cast<struct sockaddr*>(&remote),
                         &remote_len);
    if (n < 0) {
        // ICMP errors from earlier probes surface here; they are not fatal for the window
        status = Status::error(StatusCode::CONNECTION_ERROR, "recvfrom failed: " + std::string(strerror(errno)), true);
        return std::nullopt;
    }

    char address[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &remote.sin_addr, address, sizeof(address)) == nullptr) {
        status = Status::error(StatusCode::INTERNAL, "inet_ntop failed: " + std::string(strerror(errno)), true);
        return std::nullopt;
    }

    Datagram datagram;
    datagram.host = address;
    datagram.port = ntohs(remote.sin_port);
    buffer.resize(static_cast<size_t>(n));
    datagram.payload = std::move(buffer);
    status = Status::success();
    return datagram;
}

void UdpDatagramChannel::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool resolve_ipv4(const std::string& host, std::string& address, Status& status) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    struct addrinfo* result = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (rc != 0 || result == nullptr) {
        status = Status::error(StatusCode::CONNECTION_ERROR,
                               "Could not resolve hostname " + host + ": " + std::string(gai_strerror(rc)));
        if (result != nullptr) {
            freeaddrinfo(result);
        }
        return false;
    }

    char buffer[INET_ADDRSTRLEN];
    auto* addr = reinterpret_cast<struct sockaddr_in*>(result->ai_addr);
    const char* text = inet_ntop(AF_INET, &addr->sin_addr, buffer, sizeof(buffer));
    freeaddrinfo(result);
    if (text == nullptr) {
        status = Status::error(StatusCode::CONNECTION_ERROR, "Could not resolve hostname " + host);
        return false;
    }

    address = buffer;
    status = Status::success();
    return true;
}

}  // namespace discovery
}  // namespace kasa
