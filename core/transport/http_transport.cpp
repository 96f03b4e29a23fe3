#include "http_transport.hpp"

#include "logging/logger.hpp"

namespace kasa {
namespace transport {

HttpTransport::HttpTransport(std::unique_ptr<IHttpClient> client, std::unique_ptr<ISessionCipher> cipher,
                             int default_port)
    : client_(std::move(client)), cipher_(std::move(cipher)), default_port_(default_port) {}

bool HttpTransport::post(const std::string& path, const std::string& body, HttpHeaders headers, HttpReply& reply,
                         Status& status) {
    if (!session_cookie_.empty()) {
        headers.emplace("Cookie", session_cookie_);
    }
    if (!client_->post(path, body, headers, reply, status)) {
        return false;
    }

    // Keep only "NAME=value" from the first Set-Cookie
    auto it = reply.headers.find("Set-Cookie");
    if (it != reply.headers.end()) {
        session_cookie_ = it->second.substr(0, it->second.find(';'));
    }
    return true;
}

bool HttpTransport::check_http_status(const HttpReply& reply) {
    if (reply.status == 200) {
        return true;
    }
    if (reply.status == 401 || reply.status == 403) {
        status_ = Status::error(StatusCode::AUTHENTICATION_ERROR,
                                "Device rejected credentials (HTTP " + std::to_string(reply.status) + ")");
    } else {
        status_ = Status::error(StatusCode::CONNECTION_ERROR,
                                "Unexpected HTTP status " + std::to_string(reply.status), true);
    }
    return false;
}

bool HttpTransport::send(const std::string& request, nlohmann::json& response) {
    status_ = Status::success();

    if (state_ == HandshakeState::HANDSHAKE_REQUIRED) {
        HandshakePost handshake_post = [this](const std::string& path, const std::string& body, HttpReply& reply,
                                              Status& status) { return post(path, body, HttpHeaders{}, reply, status); };
        if (!cipher_->handshake(handshake_post, status_)) {
            LOG_DEBUG("[HttpTransport] Handshake failed: " << status_.message);
            reset();
            return false;
        }
        state_ = HandshakeState::ESTABLISHED;
    }

    EncryptedRequest encrypted;
    if (!cipher_->encrypt(request, encrypted, status_)) {
        return false;
    }

    HttpReply reply;
    if (!post(encrypted.path, encrypted.body, encrypted.headers, reply, status_)) {
        reset();
        return false;
    }
    if (!check_http_status(reply)) {
        reset();
        return false;
    }

    std::string plaintext;
    if (!cipher_->decrypt(reply, plaintext, status_)) {
        reset();
        return false;
    }

    try {
        response = nlohmann::json::parse(plaintext);
    } catch (const nlohmann::json::parse_error& e) {
        status_ = Status::error(StatusCode::CONNECTION_ERROR, std::string("Unable to decode reply: ") + e.what(),
                                true);
        return false;
    }
    return true;
}

void HttpTransport::close() { reset(); }

void HttpTransport::reset() {
    state_ = HandshakeState::HANDSHAKE_REQUIRED;
    session_cookie_.clear();
    cipher_->reset();
}

}  // namespace transport
}  // namespace kasa
