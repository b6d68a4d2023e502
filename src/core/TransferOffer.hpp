#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <optional>
#include <cstdint>

using json = nlohmann::json;

// One accepted DCC SEND offer.
struct TransferOffer {
    std::string filename;
    std::string host;
    uint16_t port;
    std::optional<uint64_t> size;
    std::string sender;

    TransferOffer(const std::string& filename, const std::string& host, uint16_t port,
                  std::optional<uint64_t> size, const std::string& sender);
    std::string endpoint() const;
    std::string to_string() const;
    json to_json() const;
};
