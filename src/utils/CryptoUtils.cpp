#include "CryptoUtils.hpp"
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

std::string CryptoUtils::to_hex(const std::string& raw) {
    std::ostringstream oss;
    for (unsigned char c : raw) {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    }
    return oss.str();
}

std::string CryptoUtils::random_hex(int num_bytes) {
    if (num_bytes <= 0) {
        throw std::invalid_argument("random_hex needs a positive byte count");
    }
    std::vector<unsigned char> bytes(num_bytes);
    if (RAND_bytes(bytes.data(), num_bytes) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return to_hex(std::string(bytes.begin(), bytes.end()));
}
