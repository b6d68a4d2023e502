#include "Settings.hpp"
#include "../utils/StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

template <typename T>
static void read_value(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

static void read_seconds(const json& j, const char* key, std::chrono::milliseconds& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        double seconds = it->get<double>();
        if (seconds < 0) {
            throw std::invalid_argument(std::string(key) + " must not be negative");
        }
        out = std::chrono::milliseconds(std::llround(seconds * 1000.0));
    }
}

static double to_seconds(std::chrono::milliseconds value) {
    return static_cast<double>(value.count()) / 1000.0;
}

static bool parse_bool(const std::string& text) {
    std::string value = StringUtils::to_lower(StringUtils::trim(text));
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw std::invalid_argument("not a boolean: " + text);
}

Settings::Settings() = default;

Settings Settings::from_json(const json& j, const Settings& base) {
    if (!j.is_object()) {
        throw std::invalid_argument("configuration must be a JSON object");
    }

    Settings s = base;
    read_value(j, "irc_server", s.irc_server);
    read_value(j, "irc_port", s.irc_port);
    read_value(j, "irc_ssl", s.irc_ssl);
    read_value(j, "irc_ssl_verify", s.irc_ssl_verify);
    read_value(j, "irc_channel", s.irc_channel);
    read_value(j, "irc_nick", s.irc_nick);
    read_value(j, "irc_realname", s.irc_realname);
    read_value(j, "download_dir", s.download_dir);
    read_value(j, "library_dir", s.library_dir);
    read_value(j, "temp_dir", s.temp_dir);
    read_value(j, "allowed_bots", s.allowed_bots);
    read_value(j, "search_command", s.search_command);
    read_value(j, "download_command", s.download_command);

    // null explicitly removes the ceiling
    auto max_it = j.find("max_download_bytes");
    if (max_it != j.end()) {
        if (max_it->is_null()) {
            s.max_download_bytes.reset();
        } else {
            s.max_download_bytes = max_it->get<uint64_t>();
        }
    }

    read_seconds(j, "connect_timeout", s.connect_timeout);
    read_seconds(j, "welcome_timeout", s.welcome_timeout);
    read_seconds(j, "join_timeout", s.join_timeout);
    read_seconds(j, "search_timeout", s.search_timeout);
    read_seconds(j, "dcc_timeout", s.dcc_timeout);

    if (s.irc_port <= 0 || s.irc_port > 65535) {
        throw std::invalid_argument("irc_port out of range: " + std::to_string(s.irc_port));
    }
    return s;
}

Settings Settings::with_environment(const Settings& base) {
    json defaults = base.to_json();
    json overlay = json::object();

    for (const auto& item : defaults.items()) {
        std::string name = StringUtils::to_upper(item.key());
        const char* raw = std::getenv(name.c_str());
        if (raw == nullptr) {
            continue;
        }
        std::string text = raw;
        const json& current = item.value();
        try {
            if (current.is_boolean()) {
                overlay[item.key()] = parse_bool(text);
            } else if (current.is_number_integer()) {
                overlay[item.key()] = std::stoll(text);
            } else if (current.is_number_float()) {
                overlay[item.key()] = std::stod(text);
            } else if (current.is_array()) {
                json values = json::array();
                for (const auto& part : StringUtils::split(text, ',')) {
                    std::string trimmed = StringUtils::trim(part);
                    if (!trimmed.empty()) values.push_back(trimmed);
                }
                overlay[item.key()] = values;
            } else if (current.is_null()) {
                // only max_download_bytes is nullable
                std::string trimmed = StringUtils::trim(text);
                overlay[item.key()] = trimmed.empty() ? json(nullptr) : json(std::stoull(trimmed));
            } else {
                overlay[item.key()] = text;
            }
        } catch (const std::exception& e) {
            spdlog::warn("Ignoring environment variable {}: {}", name, e.what());
        }
    }
    return from_json(overlay, base);
}

Settings Settings::load(const std::string& path) {
    Settings settings;
    std::ifstream file(path);
    if (file.is_open()) {
        try {
            json j = json::parse(file);
            settings = from_json(j, settings);
            spdlog::info("Loaded configuration from {}", path);
        } catch (const std::exception& e) {
            spdlog::warn("Ignoring configuration file {}: {}", path, e.what());
            settings = Settings();
        }
    } else {
        spdlog::debug("No configuration file at {}, using defaults", path);
    }
    return with_environment(settings);
}

json Settings::to_json() const {
    json j;
    j["irc_server"] = irc_server;
    j["irc_port"] = irc_port;
    j["irc_ssl"] = irc_ssl;
    j["irc_ssl_verify"] = irc_ssl_verify;
    j["irc_channel"] = irc_channel;
    j["irc_nick"] = irc_nick;
    j["irc_realname"] = irc_realname;
    j["download_dir"] = download_dir;
    j["library_dir"] = library_dir;
    j["temp_dir"] = temp_dir;
    j["max_download_bytes"] = max_download_bytes ? json(*max_download_bytes) : json(nullptr);
    j["allowed_bots"] = allowed_bots;
    j["search_command"] = search_command;
    j["download_command"] = download_command;
    j["connect_timeout"] = to_seconds(connect_timeout);
    j["welcome_timeout"] = to_seconds(welcome_timeout);
    j["join_timeout"] = to_seconds(join_timeout);
    j["search_timeout"] = to_seconds(search_timeout);
    j["dcc_timeout"] = to_seconds(dcc_timeout);
    return j;
}
