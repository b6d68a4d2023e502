#include "NetworkUtils.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

std::string NetworkUtils::ipv4_from_uint32(uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "." +
           std::to_string((address >> 16) & 0xFF) + "." +
           std::to_string((address >> 8) & 0xFF) + "." +
           std::to_string(address & 0xFF);
}

uint64_t NetworkUtils::parse_decimal(const std::string& token, uint64_t max_value) {
    if (token.empty()) {
        throw std::invalid_argument("empty number");
    }
    uint64_t value = 0;
    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("not a decimal number: " + token);
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            throw std::invalid_argument("number out of range: " + token);
        }
        value = value * 10 + digit;
    }
    if (value > max_value) {
        throw std::invalid_argument("number out of range: " + token);
    }
    return value;
}

std::array<uint8_t, 4> NetworkUtils::encode_be32(uint32_t value) {
    return {static_cast<uint8_t>((value >> 24) & 0xFF),
            static_cast<uint8_t>((value >> 16) & 0xFF),
            static_cast<uint8_t>((value >> 8) & 0xFF),
            static_cast<uint8_t>(value & 0xFF)};
}

uint32_t NetworkUtils::decode_be32(const uint8_t* bytes) {
    return (static_cast<uint32_t>(bytes[0]) << 24) |
           (static_cast<uint32_t>(bytes[1]) << 16) |
           (static_cast<uint32_t>(bytes[2]) << 8) |
           static_cast<uint32_t>(bytes[3]);
}
