#include "DccOffer.hpp"
#include "../core/Errors.hpp"
#include "../utils/NetworkUtils.hpp"
#include "../utils/StringUtils.hpp"
#include <cctype>
#include <limits>

OfferPolicy OfferPolicy::from_settings(const Settings& settings) {
    OfferPolicy policy;
    for (const auto& bot : settings.allowed_bots) {
        policy.allowed_senders.push_back(StringUtils::to_lower(bot));
    }
    policy.max_size = settings.max_download_bytes;
    return policy;
}

bool OfferPolicy::allows_sender(const std::string& nick) const {
    if (allowed_senders.empty()) {
        return true;
    }
    for (const auto& allowed : allowed_senders) {
        if (StringUtils::iequals(allowed, nick)) {
            return true;
        }
    }
    return false;
}

bool DccOffer::is_dcc_send(const std::string& payload) {
    return StringUtils::istarts_with(payload, "DCC SEND");
}

std::vector<std::string> DccOffer::tokenize(const std::string& payload) {
    std::vector<std::string> tokens;
    size_t pos = 0;
    while (pos < payload.size()) {
        while (pos < payload.size() && std::isspace(static_cast<unsigned char>(payload[pos]))) {
            ++pos;
        }
        if (pos >= payload.size()) break;

        if (payload[pos] == '"') {
            size_t close = payload.find('"', pos + 1);
            if (close == std::string::npos) {
                tokens.push_back(payload.substr(pos + 1));
                break;
            }
            tokens.push_back(payload.substr(pos + 1, close - pos - 1));
            pos = close + 1;
        } else {
            size_t end = pos;
            while (end < payload.size() && !std::isspace(static_cast<unsigned char>(payload[end]))) {
                ++end;
            }
            tokens.push_back(payload.substr(pos, end - pos));
            pos = end;
        }
    }
    return tokens;
}

TransferOffer DccOffer::parse(const std::string& payload, const std::string& sender,
                              const OfferPolicy& policy) {
    if (!policy.allows_sender(sender)) {
        throw PolicyError("Sender " + sender + " not allowed");
    }

    std::vector<std::string> tokens = tokenize(payload);
    if (tokens.size() < 5) {
        throw ProtocolError("Invalid DCC payload: " + payload);
    }

    const std::string& filename = tokens[2];
    std::string host;
    uint16_t port = 0;
    std::optional<uint64_t> size;

    try {
        host = NetworkUtils::ipv4_from_uint32(static_cast<uint32_t>(
            NetworkUtils::parse_decimal(tokens[3], std::numeric_limits<uint32_t>::max())));
    } catch (const std::invalid_argument& e) {
        throw ProtocolError("Invalid DCC address " + tokens[3] + ": " + e.what());
    }

    try {
        port = static_cast<uint16_t>(NetworkUtils::parse_decimal(tokens[4], 65535));
    } catch (const std::invalid_argument& e) {
        throw ProtocolError("Invalid DCC port " + tokens[4] + ": " + e.what());
    }
    if (port == 0) {
        throw ProtocolError("Passive DCC (port 0) is not supported");
    }

    if (tokens.size() > 5) {
        try {
            size = NetworkUtils::parse_decimal(tokens[5], std::numeric_limits<uint64_t>::max());
        } catch (const std::invalid_argument& e) {
            throw ProtocolError("Invalid DCC size " + tokens[5] + ": " + e.what());
        }
    }

    if (size && policy.max_size && *size > *policy.max_size) {
        throw PolicyError("File too large: " + std::to_string(*size) + " bytes (limit " +
                          std::to_string(*policy.max_size) + ")");
    }

    return TransferOffer(filename, host, port, size, sender);
}
