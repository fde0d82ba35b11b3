/**
 * @file http_client.cpp
 * @brief Minimal HTTP/1.1 GET client for health probes
 *
 * Every step runs against one deadline: name resolution, connect, TLS
 * handshake, request write and status line read all share the per-attempt
 * timeout. Sockets are non-blocking and driven by poll().
 */

#include "bgd/http_client.hpp"
#include "bgd/logger.hpp"
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <arpa/inet.h>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace bgd {

namespace {

using SteadyTime = std::chrono::steady_clock::time_point;

constexpr size_t MAX_STATUS_LINE = 8192;

int remaining_ms(SteadyTime deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

std::string openssl_error() {
    unsigned long err = ERR_get_error();
    if (err == 0) return "unknown TLS error";
    char buffer[256];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    ERR_clear_error();
    return buffer;
}

Result<void> wait_io(int fd, short events, SteadyTime deadline) {
    while (true) {
        int timeout = remaining_ms(deadline);
        if (timeout == 0) {
            return Result<void>(ErrorCode::NETWORK_TIMEOUT);
        }
        pollfd pfd{fd, events, 0};
        int rc = ::poll(&pfd, 1, timeout);
        if (rc > 0) return Result<void>();
        if (rc == 0) return Result<void>(ErrorCode::NETWORK_TIMEOUT);
        if (errno != EINTR) {
            return Result<void>(ErrorCode::NETWORK_CONNECTION_FAILED, std::strerror(errno));
        }
    }
}

struct AddressLookup {
    std::mutex mutex;
    std::condition_variable finished;
    bool done{false};
    int rc{0};
    std::shared_ptr<addrinfo> addresses;
};

// getaddrinfo() takes no timeout. The lookup runs on a detached thread that
// owns its result; a caller that gives up at the deadline just stops waiting.
Result<std::shared_ptr<addrinfo>> resolve(const std::string& host, uint16_t port, SteadyTime deadline) {
    auto lookup = std::make_shared<AddressLookup>();
    try {
        std::thread([lookup, host, service = std::to_string(port)]() {
            addrinfo hints{};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;

            addrinfo* found = nullptr;
            int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &found);

            std::lock_guard<std::mutex> lock(lookup->mutex);
            lookup->rc = rc;
            if (rc == 0) lookup->addresses.reset(found, &::freeaddrinfo);
            lookup->done = true;
            lookup->finished.notify_one();
        }).detach();
    } catch (const std::system_error& e) {
        return Result<std::shared_ptr<addrinfo>>(ErrorCode::NETWORK_CONNECTION_FAILED,
                                                 "resolver thread: " + std::string(e.what()));
    }

    std::unique_lock<std::mutex> lock(lookup->mutex);
    if (!lookup->finished.wait_until(lock, deadline, [&lookup] { return lookup->done; })) {
        return Result<std::shared_ptr<addrinfo>>(ErrorCode::NETWORK_TIMEOUT, "resolve " + host);
    }
    if (lookup->rc != 0) {
        return Result<std::shared_ptr<addrinfo>>(ErrorCode::NETWORK_CONNECTION_FAILED,
                                                 host + ": " + ::gai_strerror(lookup->rc));
    }
    return lookup->addresses;
}

struct SslDeleter {
    void operator()(SSL* ssl) const { SSL_free(ssl); }
};

// One request's connection: a non-blocking socket, optionally wrapped in TLS.
class Connection {
public:
    Connection() = default;
    ~Connection() {
        if (ssl_) {
            SSL_shutdown(ssl_.get());
        }
        ssl_.reset();
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    Result<void> connect(const std::string& host, uint16_t port, SteadyTime deadline) {
        auto addresses = resolve(host, port, deadline);
        if (addresses.has_error()) {
            return Result<void>(addresses.error(), addresses.detail());
        }

        Result<void> last(ErrorCode::NETWORK_CONNECTION_FAILED, host);
        for (addrinfo* ai = addresses.value().get(); ai != nullptr; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
            if (fd < 0) {
                last = Result<void>(ErrorCode::NETWORK_CONNECTION_FAILED, std::strerror(errno));
                continue;
            }

            if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
                fd_ = fd;
                return Result<void>();
            }
            if (errno != EINPROGRESS) {
                last = Result<void>(ErrorCode::NETWORK_CONNECTION_FAILED, std::strerror(errno));
                ::close(fd);
                continue;
            }

            auto ready = wait_io(fd, POLLOUT, deadline);
            if (ready.has_error()) {
                ::close(fd);
                if (to_error_code(ready.error()) == ErrorCode::NETWORK_TIMEOUT) {
                    return Result<void>(ErrorCode::NETWORK_TIMEOUT, "connect to " + host);
                }
                last = ready;
                continue;
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (so_error != 0) {
                last = Result<void>(ErrorCode::NETWORK_CONNECTION_FAILED, std::strerror(so_error));
                ::close(fd);
                continue;
            }

            fd_ = fd;
            return Result<void>();
        }
        return last;
    }

    Result<void> start_tls(SSL_CTX* ctx, const std::string& host, bool verify_peer, SteadyTime deadline) {
        ssl_.reset(SSL_new(ctx));
        if (!ssl_) {
            return Result<void>(ErrorCode::TLS_HANDSHAKE_FAILED, openssl_error());
        }
        SSL_set_fd(ssl_.get(), fd_);
        SSL_set_tlsext_host_name(ssl_.get(), host.c_str());
        if (verify_peer) {
            SSL_set1_host(ssl_.get(), host.c_str());
        }

        while (true) {
            int rc = SSL_connect(ssl_.get());
            if (rc == 1) return Result<void>();

            int err = SSL_get_error(ssl_.get(), rc);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
                auto ready = wait_io(fd_, err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline);
                if (ready.has_error()) return ready;
                continue;
            }

            if (verify_peer) {
                long verify = SSL_get_verify_result(ssl_.get());
                if (verify != X509_V_OK) {
                    ERR_clear_error();
                    return Result<void>(ErrorCode::TLS_VERIFY_FAILED,
                                        X509_verify_cert_error_string(verify));
                }
            }
            return Result<void>(ErrorCode::TLS_HANDSHAKE_FAILED, openssl_error());
        }
    }

    Result<void> write_all(const std::string& data, SteadyTime deadline) {
        size_t sent = 0;
        while (sent < data.size()) {
            if (ssl_) {
                int rc = SSL_write(ssl_.get(), data.data() + sent, static_cast<int>(data.size() - sent));
                if (rc > 0) {
                    sent += static_cast<size_t>(rc);
                    continue;
                }
                int err = SSL_get_error(ssl_.get(), rc);
                if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) {
                    return Result<void>(ErrorCode::NETWORK_CONNECTION_FAILED, openssl_error());
                }
                auto ready = wait_io(fd_, err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline);
                if (ready.has_error()) return ready;
            } else {
                ssize_t rc = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
                if (rc > 0) {
                    sent += static_cast<size_t>(rc);
                    continue;
                }
                if (rc < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    return Result<void>(ErrorCode::NETWORK_CONNECTION_FAILED, std::strerror(errno));
                }
                auto ready = wait_io(fd_, POLLOUT, deadline);
                if (ready.has_error()) return ready;
            }
        }
        return Result<void>();
    }

    // Read until the status line is complete or the peer closes.
    Result<std::string> read_status_line(SteadyTime deadline) {
        std::string response;
        char buffer[1024];

        while (response.find("\r\n") == std::string::npos && response.size() < MAX_STATUS_LINE) {
            ssize_t n;
            if (ssl_) {
                int rc = SSL_read(ssl_.get(), buffer, sizeof(buffer));
                if (rc > 0) {
                    response.append(buffer, static_cast<size_t>(rc));
                    continue;
                }
                int err = SSL_get_error(ssl_.get(), rc);
                if (err == SSL_ERROR_ZERO_RETURN) break;
                if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) {
                    return Result<std::string>(ErrorCode::NETWORK_CONNECTION_FAILED, openssl_error());
                }
                auto ready = wait_io(fd_, err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline);
                if (ready.has_error()) return Result<std::string>(ready.error(), ready.detail());
                continue;
            }

            n = ::recv(fd_, buffer, sizeof(buffer), 0);
            if (n > 0) {
                response.append(buffer, static_cast<size_t>(n));
                continue;
            }
            if (n == 0) break;
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                return Result<std::string>(ErrorCode::NETWORK_CONNECTION_FAILED, std::strerror(errno));
            }
            auto ready = wait_io(fd_, POLLIN, deadline);
            if (ready.has_error()) return Result<std::string>(ready.error(), ready.detail());
        }
        return response;
    }

private:
    int fd_{-1};
    std::unique_ptr<SSL, SslDeleter> ssl_;
};

} // namespace

Result<ParsedUrl> parse_url(const std::string& url) {
    ParsedUrl parsed;
    std::string rest;

    if (url.rfind("http://", 0) == 0) {
        parsed.scheme = "http";
        parsed.port = 80;
        rest = url.substr(7);
    } else if (url.rfind("https://", 0) == 0) {
        parsed.scheme = "https";
        parsed.port = 443;
        rest = url.substr(8);
    } else {
        return Result<ParsedUrl>(ErrorCode::INVALID_URL, url);
    }

    auto path_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_start);
    if (path_start != std::string::npos) {
        parsed.path = rest.substr(path_start);
        if (parsed.path.front() == '?') parsed.path.insert(0, "/");
    }

    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return Result<ParsedUrl>(ErrorCode::INVALID_URL, url);
        }
        parsed.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return Result<ParsedUrl>(ErrorCode::INVALID_URL, url);
            port_text = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.find(':');
        parsed.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (parsed.host.empty() || parsed.host.find('@') != std::string::npos) {
        return Result<ParsedUrl>(ErrorCode::INVALID_URL, url);
    }

    if (!port_text.empty() || authority.back() == ':') {
        if (port_text.empty() || port_text.size() > 5 ||
            port_text.find_first_not_of("0123456789") != std::string::npos) {
            return Result<ParsedUrl>(ErrorCode::INVALID_URL, url);
        }
        int port = std::stoi(port_text);
        if (port < 1 || port > 65535) {
            return Result<ParsedUrl>(ErrorCode::INVALID_URL, url);
        }
        parsed.port = static_cast<uint16_t>(port);
    }

    return parsed;
}

Result<int> parse_status_line(const std::string& response) {
    auto eol = response.find("\r\n");
    std::string line = response.substr(0, eol);

    if (line.rfind("HTTP/1.", 0) != 0 || line.size() < 12 || line[8] != ' ') {
        return Result<int>(ErrorCode::HTTP_INVALID_RESPONSE, SecurityUtils::sanitize_log_input(line.substr(0, 64)));
    }

    std::string code = line.substr(9, 3);
    if (code.find_first_not_of("0123456789") != std::string::npos ||
        (line.size() > 12 && line[12] != ' ')) {
        return Result<int>(ErrorCode::HTTP_INVALID_RESPONSE, SecurityUtils::sanitize_log_input(line.substr(0, 64)));
    }
    return std::stoi(code);
}

SocketHttpClient::SocketHttpClient(bool verify_peer) : verify_peer_(verify_peer) {}

SocketHttpClient::~SocketHttpClient() {
    if (ssl_ctx_) {
        SSL_CTX_free(ssl_ctx_);
    }
}

Result<void> SocketHttpClient::ensure_tls_context() {
    std::lock_guard lock(ctx_mutex_);
    if (ssl_ctx_) return Result<void>();

    ssl_ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ssl_ctx_) {
        return Result<void>(ErrorCode::TLS_HANDSHAKE_FAILED, openssl_error());
    }

    SSL_CTX_set_min_proto_version(ssl_ctx_, TLS1_2_VERSION);

    if (verify_peer_) {
        SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(ssl_ctx_) != 1) {
            LOG_WARN("Could not load default CA paths: " + openssl_error());
        }
    } else {
        SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_NONE, nullptr);
    }

    return Result<void>();
}

Result<int> SocketHttpClient::get_status(const std::string& url, std::chrono::milliseconds timeout) {
    auto parsed = parse_url(url);
    if (parsed.has_error()) {
        return Result<int>(parsed.error(), parsed.detail());
    }
    const auto& target = parsed.value();
    auto deadline = std::chrono::steady_clock::now() + timeout;

    Connection connection;
    auto connected = connection.connect(target.host, target.port, deadline);
    if (connected.has_error()) {
        return Result<int>(connected.error(), connected.detail());
    }

    if (target.scheme == "https") {
        auto ctx = ensure_tls_context();
        if (ctx.has_error()) {
            return Result<int>(ctx.error(), ctx.detail());
        }
        auto tls = connection.start_tls(ssl_ctx_, target.host, verify_peer_, deadline);
        if (tls.has_error()) {
            return Result<int>(tls.error(), tls.detail());
        }
    }

    bool default_port = (target.scheme == "http" && target.port == 80) ||
                        (target.scheme == "https" && target.port == 443);
    std::string host_header = target.host.find(':') != std::string::npos
                                  ? "[" + target.host + "]"
                                  : target.host;
    if (!default_port) {
        host_header += ":" + std::to_string(target.port);
    }

    std::string request = "GET " + target.path + " HTTP/1.1\r\n"
                          "Host: " + host_header + "\r\n"
                          "User-Agent: bgd-deploy\r\n"
                          "Accept: */*\r\n"
                          "Connection: close\r\n\r\n";

    auto written = connection.write_all(request, deadline);
    if (written.has_error()) {
        return Result<int>(written.error(), written.detail());
    }

    auto response = connection.read_status_line(deadline);
    if (response.has_error()) {
        return Result<int>(response.error(), response.detail());
    }
    if (response.value().empty()) {
        return Result<int>(ErrorCode::HTTP_INVALID_RESPONSE, "empty response");
    }

    return parse_status_line(response.value());
}

} // namespace bgd
