#pragma once
#include "../core/TransferOffer.hpp"
#include <chrono>
#include <cstdint>
#include <string>

class DccTransfer {
public:
    // Streams the offered file into dest (parent directories created, file
    // truncated before connecting) and acknowledges every chunk with the
    // cumulative byte count. Connect and each read are bounded by timeout.
    // Throws TransferError on connect failure, socket error, stall, or EOF
    // before the declared size; the partial file stays on disk.
    static uint64_t receive(const TransferOffer& offer, const std::string& dest,
                            std::chrono::milliseconds timeout);
};
