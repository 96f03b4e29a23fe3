#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "transport.hpp"

namespace kasa {
namespace transport {

// Largest reply accepted from a legacy device: 1 MiB
constexpr uint32_t kMaxXorPayloadSize = 1024u * 1024u;

// Autokey XOR cipher used by legacy devices, initial key 171
class XorCipher {
public:
    static constexpr uint8_t kInitialKey = 171;

    // 4-byte big-endian length followed by the ciphertext
    static std::vector<uint8_t> encrypt(const std::string& plaintext);

    // Ciphertext without a length prefix (discovery probe)
    static std::vector<uint8_t> encrypt_unframed(const std::string& plaintext);

    static std::string decrypt(const uint8_t* ciphertext, size_t len);
};

/**
 * @brief Legacy TCP transport on port 9999
 *
 * Connects lazily on the first send and keeps the socket open between
 * requests. Any IO failure closes the socket so the next send reconnects.
 * Connection refused / host unreachable are reported as non-retryable.
 */
class XorTransport : public ITransport {
public:
    static constexpr int kDefaultPort = 9999;

    XorTransport(const std::string& host, int port, int timeout_ms);
    ~XorTransport() override;

    XorTransport(const XorTransport&) = delete;
    XorTransport& operator=(const XorTransport&) = delete;

    int default_port() const override { return kDefaultPort; }
    std::string credentials_hash() const override { return ""; }

    bool send(const std::string& request, nlohmann::json& response) override;
    void close() override;
    void reset() override { close(); }

    const Status& last_status() const override { return status_; }

    bool is_connected() const { return fd_ >= 0; }

private:
    std::string host_;
    int port_;
    int timeout_ms_;
    int fd_ = -1;
    Status status_;

    bool connect_socket();
    bool write_exact(const uint8_t* buf, size_t n, int timeout_ms);
    bool read_exact(uint8_t* buf, size_t n, int timeout_ms);
    bool wait_for(short events, int timeout_ms);
    std::string endpoint() const;
};

}  // namespace transport
}  // namespace kasa
