#include "http_client.hpp"

// cpp-httplib with OpenSSL support when CPPHTTPLIB_OPENSSL_SUPPORT is defined by the build
#include <httplib.h>

namespace kasa {
namespace transport {

HttplibClient::HttplibClient(const std::string& host, int port, bool https, int timeout_ms)
    : base_url_(std::string(https ? "https://" : "http://") + host + ":" + std::to_string(port)),
      client_(std::make_unique<httplib::Client>(base_url_)) {
    time_t sec = timeout_ms / 1000;
    time_t usec = (timeout_ms % 1000) * 1000;
    client_->set_connection_timeout(sec, usec);
    client_->set_read_timeout(sec, usec);
    client_->set_write_timeout(sec, usec);
    client_->set_keep_alive(true);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    // Devices present self-signed certificates
    client_->enable_server_certificate_verification(false);
#endif
}

HttplibClient::~HttplibClient() = default;

bool HttplibClient::post(const std::string& path, const std::string& body, const HttpHeaders& headers,
                         HttpReply& reply, Status& status) {
    httplib::Headers request_headers(headers.begin(), headers.end());
    auto res = client_->Post(path, request_headers, body, "application/octet-stream");
    if (!res) {
        auto err = res.error();
        StatusCode code =
            err == httplib::Error::ConnectionTimeout || err == httplib::Error::Read ? StatusCode::TIMEOUT
                                                                                      : StatusCode::CONNECTION_ERROR;
        status = Status::error(code, "HTTP request to " + base_url_ + path + " failed: " + httplib::to_string(err),
                               true);
        return false;
    }

    reply.status = res->status;
    reply.body = res->body;
    reply.headers.clear();
    for (const auto& header : res->headers) {
        reply.headers.emplace(header.first, header.second);
    }
    status = Status::success();
    return true;
}

}  // namespace transport
}  // namespace kasa
