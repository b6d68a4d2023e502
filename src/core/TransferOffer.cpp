#include "TransferOffer.hpp"

TransferOffer::TransferOffer(const std::string& filename, const std::string& host, uint16_t port,
                             std::optional<uint64_t> size, const std::string& sender)
    : filename(filename), host(host), port(port), size(size), sender(sender) {}

std::string TransferOffer::endpoint() const {
    return host + ":" + std::to_string(port);
}

std::string TransferOffer::to_string() const {
    return filename + " from " + sender + " at " + endpoint() + " size " +
           (size ? std::to_string(*size) : std::string("unknown"));
}

json TransferOffer::to_json() const {
    json j;
    j["filename"] = filename;
    j["host"] = host;
    j["port"] = port;
    j["size"] = size ? json(*size) : json(nullptr);
    j["sender"] = sender;
    return j;
}
