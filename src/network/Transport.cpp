#include "Transport.hpp"
#include "../core/Errors.hpp"
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/select.h>
#include <sys/time.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>

namespace {
timeval to_timeval(std::chrono::milliseconds timeout) {
    if (timeout.count() < 0) timeout = std::chrono::milliseconds(0);
    timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return tv;
}

std::string ssl_error_text() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

int connect_with_timeout(const addrinfo* ai, std::chrono::milliseconds timeout, std::string& error) {
    int sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock < 0) {
        error = std::string("socket creation failed: ") + strerror(errno);
        return -1;
    }

    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);

    int result = ::connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (result < 0 && errno != EINPROGRESS) {
        error = strerror(errno);
        ::close(sock);
        return -1;
    }

    if (result < 0) {
        fd_set write_fds;
        FD_ZERO(&write_fds);
        FD_SET(sock, &write_fds);
        timeval tv = to_timeval(timeout);

        result = select(sock + 1, NULL, &write_fds, NULL, &tv);
        if (result <= 0) {
            error = result == 0 ? "connect timed out" : strerror(errno);
            ::close(sock);
            return -1;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            error = strerror(so_error != 0 ? so_error : errno);
            ::close(sock);
            return -1;
        }
    }

    // Back to blocking mode
    fcntl(sock, F_SETFL, flags);
    return sock;
}
}

Transport::~Transport() {
    close();
}

int Transport::open_tcp(const std::string& host, int port, std::chrono::milliseconds timeout,
                        std::string& error) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        error = "cannot resolve " + host + ": " + gai_strerror(rc);
        return -1;
    }

    int sock = -1;
    for (addrinfo* ai = res; ai != nullptr && sock < 0; ai = ai->ai_next) {
        sock = connect_with_timeout(ai, timeout, error);
    }
    freeaddrinfo(res);
    return sock;
}

void Transport::connect(const std::string& host, int port, bool use_tls, bool verify_peer,
                        std::chrono::milliseconds timeout) {
    close();

    std::string error;
    sock = open_tcp(host, port, timeout, error);
    if (sock < 0) {
        throw ConnectionError("Connection to " + host + ":" + std::to_string(port) + " failed: " + error);
    }
    spdlog::debug("TCP connected to {}:{}", host, port);

    if (use_tls) {
        try {
            start_tls(host, verify_peer, timeout);
        } catch (const ConnectionError&) {
            close();
            throw;
        }
    }
}

void Transport::start_tls(const std::string& host, bool verify_peer, std::chrono::milliseconds timeout) {
    ctx = SSL_CTX_new(TLS_client_method());
    if (!ctx) {
        throw ConnectionError("SSL_CTX_new failed: " + ssl_error_text());
    }

    if (verify_peer) {
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(ctx) != 1) {
            throw ConnectionError("Cannot load system trust store: " + ssl_error_text());
        }
    } else {
        SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
        spdlog::warn("TLS certificate verification disabled for {}: reduced-trust connection", host);
    }

    ssl = SSL_new(ctx);
    if (!ssl) {
        throw ConnectionError("SSL_new failed: " + ssl_error_text());
    }
    SSL_set_tlsext_host_name(ssl, host.c_str());
    if (verify_peer && SSL_set1_host(ssl, host.c_str()) != 1) {
        throw ConnectionError("Cannot set expected TLS host name " + host);
    }
    SSL_set_fd(ssl, sock);

    // Bound the blocking handshake by the connect timeout
    timeval tv = to_timeval(timeout);
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    if (SSL_connect(ssl) != 1) {
        std::string reason = ssl_error_text();
        long verify = SSL_get_verify_result(ssl);
        if (verify != X509_V_OK) {
            reason = X509_verify_cert_error_string(verify);
        }
        throw ConnectionError("TLS handshake with " + host + " failed: " + reason);
    }

    timeval none{};
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &none, sizeof(none));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &none, sizeof(none));
    spdlog::debug("TLS established with {} ({})", host, SSL_get_version(ssl));
}

bool Transport::is_open() const {
    return sock >= 0;
}

bool Transport::wait_readable(std::chrono::milliseconds timeout) {
    if (sock < 0) return false;
    if (ssl && SSL_pending(ssl) > 0) return true;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(sock, &read_fds);
    timeval tv = to_timeval(timeout);

    int result = select(sock + 1, &read_fds, NULL, NULL, &tv);
    if (result < 0) {
        // treat as readable so read_some reports the failure
        return errno != EINTR;
    }
    return result > 0;
}

ssize_t Transport::read_some(char* buffer, size_t length) {
    if (sock < 0) return -1;
    if (ssl) {
        int n = SSL_read(ssl, buffer, static_cast<int>(length));
        if (n > 0) return n;
        int err = SSL_get_error(ssl, n);
        if (err == SSL_ERROR_ZERO_RETURN) return 0;
        if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0 && errno == 0) return 0;
        return -1;
    }
    ssize_t n = recv(sock, buffer, length, 0);
    if (n < 0 && errno == EINTR) {
        n = recv(sock, buffer, length, 0);
    }
    return n;
}

bool Transport::write_all(const std::string& data) {
    if (sock < 0) return false;
    size_t sent = 0;
    while (sent < data.size()) {
        if (ssl) {
            int n = SSL_write(ssl, data.data() + sent, static_cast<int>(data.size() - sent));
            if (n <= 0) return false;
            sent += static_cast<size_t>(n);
        } else {
            ssize_t n = send(sock, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return false;
            sent += static_cast<size_t>(n);
        }
    }
    return true;
}

void Transport::close() {
    if (ssl) {
        SSL_shutdown(ssl);
        SSL_free(ssl);
        ssl = nullptr;
    }
    if (ctx) {
        SSL_CTX_free(ctx);
        ctx = nullptr;
    }
    if (sock >= 0) {
        ::close(sock);
        sock = -1;
    }
}

Transport::ProbeResult Transport::probe(const std::string& host, int port, std::chrono::milliseconds timeout) {
    std::string error;
    int sock = open_tcp(host, port, timeout, error);
    if (sock < 0) {
        spdlog::warn("TCP connect FAILED to {}:{}: {}", host, port, error);
        return {false, error};
    }
    ::close(sock);
    spdlog::info("TCP connect OK to {}:{}", host, port);
    return {true, "ok"};
}
