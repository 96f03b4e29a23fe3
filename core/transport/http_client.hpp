#pragma once

#include <map>
#include <memory>
#include <string>

#include "common/status.hpp"

// Forward declaration for cpp-httplib client
namespace httplib {
class Client;
}

namespace kasa {
namespace transport {

struct HttpReply {
    int status = 0;
    std::string body;
    std::multimap<std::string, std::string> headers;
};

using HttpHeaders = std::multimap<std::string, std::string>;

// Minimal POST client so the transport can be exercised without a socket
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // False only when no HTTP reply arrived at all (status holds the reason)
    virtual bool post(const std::string& path, const std::string& body, const HttpHeaders& headers,
                      HttpReply& reply, Status& status) = 0;
};

// cpp-httplib backed client, one keep-alive connection per device
class HttplibClient : public IHttpClient {
public:
    HttplibClient(const std::string& host, int port, bool https, int timeout_ms);
    ~HttplibClient() override;

    bool post(const std::string& path, const std::string& body, const HttpHeaders& headers, HttpReply& reply,
              Status& status) override;

private:
    std::string base_url_;
    std::unique_ptr<httplib::Client> client_;
};

}  // namespace transport
}  // namespace kasa
