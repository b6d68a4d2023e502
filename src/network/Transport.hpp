#pragma once
#include <openssl/ssl.h>
#include <chrono>
#include <string>
#include <sys/types.h>

// Plain TCP or TLS byte stream to an IRC server.
class Transport {
public:
    struct ProbeResult {
        bool ok;
        std::string detail;
    };

    Transport() = default;
    ~Transport();
    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // Throws ConnectionError when the TCP connect or the TLS handshake fails.
    void connect(const std::string& host, int port, bool use_tls, bool verify_peer,
                 std::chrono::milliseconds timeout);
    bool is_open() const;

    // True when a read will not block (buffered TLS bytes count).
    bool wait_readable(std::chrono::milliseconds timeout);
    // >0 bytes read, 0 on orderly EOF, -1 on error.
    ssize_t read_some(char* buffer, size_t length);
    bool write_all(const std::string& data);
    void close();

    // Resolves host and connects with a bounded non-blocking connect.
    // Returns a blocking socket, or -1 with error describing why.
    static int open_tcp(const std::string& host, int port, std::chrono::milliseconds timeout,
                        std::string& error);
    static ProbeResult probe(const std::string& host, int port, std::chrono::milliseconds timeout);

private:
    int sock = -1;
    SSL_CTX* ctx = nullptr;
    SSL* ssl = nullptr;

    void start_tls(const std::string& host, bool verify_peer, std::chrono::milliseconds timeout);
};
