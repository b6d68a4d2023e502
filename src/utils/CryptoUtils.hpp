#pragma once
#include <string>

class CryptoUtils {
public:
    static std::string to_hex(const std::string& raw);
    // num_bytes of OpenSSL randomness, hex encoded.
    static std::string random_hex(int num_bytes);
};
