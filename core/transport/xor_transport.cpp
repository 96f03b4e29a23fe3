#include "xor_transport.hpp"

#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstring>

#include "logging/logger.hpp"

namespace kasa {
namespace transport {

namespace {

bool is_no_retry_errno(int err) { return err == ECONNREFUSED || err == EHOSTUNREACH || err == EHOSTDOWN; }

int elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    return static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

}  // namespace

std::vector<uint8_t> XorCipher::encrypt_unframed(const std::string& plaintext) {
    std::vector<uint8_t> out;
    out.reserve(plaintext.size());
    uint8_t key = kInitialKey;
    for (unsigned char c : plaintext) {
        key = static_cast<uint8_t>(key ^ c);
        out.push_back(key);
    }
    return out;
}

std::vector<uint8_t> XorCipher::encrypt(const std::string& plaintext) {
    uint32_t len = static_cast<uint32_t>(plaintext.size());
    std::vector<uint8_t> out;
    out.reserve(4 + plaintext.size());
    out.push_back(static_cast<uint8_t>((len >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((len >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(len & 0xFF));
    auto body = encrypt_unframed(plaintext);
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

std::string XorCipher::decrypt(const uint8_t* ciphertext, size_t len) {
    std::string out;
    out.reserve(len);
    uint8_t key = kInitialKey;
    for (size_t i = 0; i < len; ++i) {
        out.push_back(static_cast<char>(key ^ ciphertext[i]));
        key = ciphertext[i];
    }
    return out;
}

XorTransport::XorTransport(const std::string& host, int port, int timeout_ms)
    : host_(host), port_(port), timeout_ms_(timeout_ms) {}

XorTransport::~XorTransport() { close(); }

std::string XorTransport::endpoint() const { return host_ + ":" + std::to_string(port_); }

void XorTransport::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool XorTransport::wait_for(short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = events;
    pfd.revents = 0;

    int result;
    do {
        result = poll(&pfd, 1, timeout_ms);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        status_ = Status::error(StatusCode::CONNECTION_ERROR, "poll failed: " + std::string(strerror(errno)), true);
        return false;
    }
    if (result == 0) {
        status_ = Status::error(StatusCode::TIMEOUT, "Timeout talking to " + endpoint(), true);
        return false;
    }
    if ((pfd.revents & events) != 0) {
        return true;
    }
    status_ = Status::error(StatusCode::CONNECTION_ERROR, "Socket error on " + endpoint(), true);
    return false;
}

bool XorTransport::connect_socket() {
    if (fd_ >= 0) {
        return true;
    }

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    std::string port_str = std::to_string(port_);
    int rc = getaddrinfo(host_.c_str(), port_str.c_str(), &hints, &result);
    if (rc != 0 || result == nullptr) {
        status_ = Status::error(StatusCode::CONNECTION_ERROR,
                                "Unable to resolve " + host_ + ": " + std::string(gai_strerror(rc)));
        return false;
    }

    fd_ = socket(result->ai_family, result->ai_socktype, result->ai_protocol);
    if (fd_ < 0) {
        status_ = Status::error(StatusCode::CONNECTION_ERROR, "socket failed: " + std::string(strerror(errno)), true);
        freeaddrinfo(result);
        return false;
    }

    int flags = fcntl(fd_, F_GETFL, 0);
    fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

    rc = ::connect(fd_, result->ai_addr, result->ai_addrlen);
    int connect_errno = errno;
    freeaddrinfo(result);

    if (rc < 0 && connect_errno != EINPROGRESS) {
        status_ = Status::error(StatusCode::CONNECTION_ERROR,
                                "Unable to connect to the device: " + endpoint() + ": " + strerror(connect_errno),
                                !is_no_retry_errno(connect_errno));
        close();
        return false;
    }

    if (rc < 0) {
        if (!wait_for(POLLOUT, timeout_ms_)) {
            status_.message = "Unable to connect to the device: " + endpoint() + ": " + status_.message;
            close();
            return false;
        }
        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &so_len);
        if (so_error != 0) {
            status_ = Status::error(StatusCode::CONNECTION_ERROR,
                                    "Unable to connect to the device: " + endpoint() + ": " + strerror(so_error),
                                    !is_no_retry_errno(so_error));
            close();
            return false;
        }
    }

    // Requests go out in a single write, no need to buffer
    int one = 1;
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return true;
}

bool XorTransport::write_exact(const uint8_t* buf, size_t n, int timeout_ms) {
    size_t total = 0;
    auto start_time = std::chrono::steady_clock::now();

    while (total < n) {
        int remaining_ms = timeout_ms - elapsed_ms_since(start_time);
        if (remaining_ms <= 0) {
            status_ = Status::error(StatusCode::TIMEOUT, "Timeout writing to " + endpoint(), true);
            return false;
        }
        if (!wait_for(POLLOUT, remaining_ms)) {
            return false;
        }

        ssize_t w = ::send(fd_, buf + total, n - total, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            status_ = Status::error(StatusCode::CONNECTION_ERROR, "Write failed: " + std::string(strerror(errno)), true);
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

bool XorTransport::read_exact(uint8_t* buf, size_t n, int timeout_ms) {
    size_t total = 0;
    auto start_time = std::chrono::steady_clock::now();

    while (total < n) {
        int remaining_ms = timeout_ms - elapsed_ms_since(start_time);
        if (remaining_ms <= 0) {
            status_ = Status::error(StatusCode::TIMEOUT, "Timeout reading from " + endpoint(), true);
            return false;
        }
        if (!wait_for(POLLIN, remaining_ms)) {
            return false;
        }

        ssize_t r = ::recv(fd_, buf + total, n - total, 0);
        if (r < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            status_ = Status::error(StatusCode::CONNECTION_ERROR, "Read failed: " + std::string(strerror(errno)), true);
            return false;
        }
        if (r == 0) {
            status_ = Status::error(StatusCode::CONNECTION_ERROR, "Connection closed by " + endpoint(), true);
            return false;
        }
        total += static_cast<size_t>(r);
    }
    return true;
}

bool XorTransport::send(const std::string& request, nlohmann::json& response) {
    status_ = Status::success();

    if (!connect_socket()) {
        LOG_DEBUG("[XorTransport] " << status_.message);
        return false;
    }

    auto start_time = std::chrono::steady_clock::now();
    auto frame = XorCipher::encrypt(request);
    if (!write_exact(frame.data(), frame.size(), timeout_ms_)) {
        status_.message = "Unable to query the device " + endpoint() + ": " + status_.message;
        close();
        return false;
    }

    uint8_t len_buf[4];
    int remaining_ms = timeout_ms_ - elapsed_ms_since(start_time);
    if (!read_exact(len_buf, 4, remaining_ms)) {
        status_.message = "Unable to query the device " + endpoint() + ": " + status_.message;
        close();
        return false;
    }

    uint32_t len = (uint32_t(len_buf[0]) << 24) | (uint32_t(len_buf[1]) << 16) | (uint32_t(len_buf[2]) << 8) |
                   uint32_t(len_buf[3]);
    if (len > kMaxXorPayloadSize) {
        status_ = Status::error(StatusCode::CONNECTION_ERROR, "Reply too large: " + std::to_string(len) + " bytes",
                                true);
        close();
        return false;
    }

    std::vector<uint8_t> payload(len);
    remaining_ms = timeout_ms_ - elapsed_ms_since(start_time);
    if (len > 0 && !read_exact(payload.data(), len, remaining_ms)) {
        status_.message = "Unable to query the device " + endpoint() + ": " + status_.message;
        close();
        return false;
    }

    std::string plaintext = XorCipher::decrypt(payload.data(), payload.size());
    try {
        response = nlohmann::json::parse(plaintext);
    } catch (const nlohmann::json::parse_error& e) {
        status_ = Status::error(StatusCode::CONNECTION_ERROR,
                                "Unable to decode reply from " + endpoint() + ": " + e.what(), true);
        close();
        return false;
    }

    LOG_DEBUG("[XorTransport] " << endpoint() << " << " << len << " bytes");
    return true;
}

}  // namespace transport
}  // namespace kasa
