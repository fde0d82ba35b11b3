#pragma once

#include "bgd/error_handling.hpp"
#include <openssl/ssl.h>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace bgd {

struct ParsedUrl {
    std::string scheme;   // "http" or "https"
    std::string host;
    uint16_t port{0};
    std::string path{"/"};
};

Result<ParsedUrl> parse_url(const std::string& url);

// Health probe transport. Returns the response status code for any well
// formed response; transport failures are errors.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual Result<int> get_status(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

// HTTP/1.1 GET over POSIX sockets, TLS through OpenSSL for https URLs.
class SocketHttpClient : public HttpClient {
public:
    explicit SocketHttpClient(bool verify_peer = true);
    ~SocketHttpClient() override;

    SocketHttpClient(const SocketHttpClient&) = delete;
    SocketHttpClient& operator=(const SocketHttpClient&) = delete;

    Result<int> get_status(const std::string& url, std::chrono::milliseconds timeout) override;

private:
    bool verify_peer_;
    SSL_CTX* ssl_ctx_{nullptr};
    std::mutex ctx_mutex_;

    Result<void> ensure_tls_context();
};

// Status line parser, "HTTP/1.1 204 No Content" -> 204.
Result<int> parse_status_line(const std::string& response);

} // namespace bgd
