#pragma once
#include <array>
#include <cstdint>
#include <string>

class NetworkUtils {
public:
    // 32-bit address in network byte order (most significant octet first) to dotted-quad.
    static std::string ipv4_from_uint32(uint32_t address);
    // Parses a base-10 unsigned integer that must fit in max_value; throws std::invalid_argument.
    static uint64_t parse_decimal(const std::string& token, uint64_t max_value);
    // 4-byte big-endian encoding, as used by DCC acknowledgements.
    static std::array<uint8_t, 4> encode_be32(uint32_t value);
    static uint32_t decode_be32(const uint8_t* bytes);
};
