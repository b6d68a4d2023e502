#include "DccTransfer.hpp"
#include "Transport.hpp"
#include "../commands/helpers/Config.hpp"
#include "../core/Errors.hpp"
#include "../utils/NetworkUtils.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/select.h>
#include <unistd.h>
#include <errno.h>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static std::string describe_size(const std::optional<uint64_t>& size) {
    return size ? std::to_string(*size) : std::string("unknown");
}

uint64_t DccTransfer::receive(const TransferOffer& offer, const std::string& dest,
                              std::chrono::milliseconds timeout) {
    try {
        fs::path parent = fs::path(dest).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
    } catch (const fs::filesystem_error& e) {
        throw TransferError("Cannot create directory for " + dest + ": " + e.what());
    }

    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw TransferError("Cannot create output file " + dest);
    }

    spdlog::info("DCC connect -> {} (expect size {})", offer.endpoint(), describe_size(offer.size));
    auto start = std::chrono::steady_clock::now();

    std::string error;
    int sock = Transport::open_tcp(offer.host, offer.port, timeout, error);
    if (sock < 0) {
        spdlog::error("DCC connect to {} failed: {}", offer.endpoint(), error);
        throw TransferError("DCC connect to " + offer.endpoint() + " failed: " + error);
    }
    spdlog::info("DCC socket established to {}", offer.endpoint());

    uint64_t total = 0;
    auto abort_transfer = [&](const std::string& reason) {
        close(sock);
        out.close();
        spdlog::error("DCC socket error {} after {} bytes: {}", offer.endpoint(), total, reason);
        throw TransferError(reason);
    };

    char buffer[Config::DCC_CHUNK_SIZE];
    while (!(offer.size && total >= *offer.size)) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        FD_SET(sock, &read_fds);

        struct timeval tv;
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

        int ready = select(sock + 1, &read_fds, NULL, NULL, &tv);
        if (ready < 0) {
            if (errno == EINTR) continue;
            abort_transfer(std::string("select failed: ") + strerror(errno));
        }
        if (ready == 0) {
            abort_transfer("DCC transfer stalled after " + std::to_string(total) + " bytes");
        }

        ssize_t n = recv(sock, buffer, sizeof(buffer), 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            abort_transfer(std::string("recv failed: ") + strerror(errno));
        }
        if (n == 0) {
            spdlog::info("DCC recv got EOF");
            if (offer.size) {
                abort_transfer("DCC connection closed after " + std::to_string(total) + " of " +
                               std::to_string(*offer.size) + " bytes");
            }
            break;
        }

        out.write(buffer, n);
        if (!out) {
            abort_transfer("Failed writing to " + dest);
        }
        total += static_cast<uint64_t>(n);

        // Cumulative count, modulo 2^32
        auto ack = NetworkUtils::encode_be32(static_cast<uint32_t>(total));
        ssize_t sent = send(sock, ack.data(), ack.size(), MSG_NOSIGNAL);
        if (sent != static_cast<ssize_t>(ack.size())) {
            spdlog::warn("DCC ack send failed after {} bytes", total);
        }
    }

    if (offer.size) {
        spdlog::info("DCC recv reached declared size");
    }
    close(sock);
    out.close();
    if (!out) {
        throw TransferError("Failed to finish writing " + dest);
    }

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    spdlog::info("Saved DCC to {} ({} bytes in {:.2f}s)", dest, total, elapsed);
    return total;
}
