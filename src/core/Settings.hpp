#pragma once
#include "../commands/helpers/Config.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

// Read-only configuration snapshot. Sessions copy it once when they start.
struct Settings {
    Settings();

    std::string irc_server = "irc.irchighway.net";
    int irc_port = Config::DEFAULT_IRC_PORT;
    bool irc_ssl = false;
    bool irc_ssl_verify = true;
    std::string irc_channel = "#ebooks";
    std::string irc_nick = "lircbrarybot";
    std::string irc_realname = "lircbrary";

    std::string download_dir = "/data/downloads";
    std::string library_dir = "/data/library";
    std::string temp_dir = "/data/tmp";

    std::optional<uint64_t> max_download_bytes;
    std::vector<std::string> allowed_bots;

    std::string search_command = "@search {query}";
    std::string download_command = "@download {id}";

    std::chrono::milliseconds connect_timeout{std::chrono::seconds(Config::DEFAULT_CONNECT_TIMEOUT)};
    std::chrono::milliseconds welcome_timeout{std::chrono::seconds(Config::DEFAULT_WELCOME_TIMEOUT)};
    std::chrono::milliseconds join_timeout{std::chrono::seconds(Config::DEFAULT_JOIN_TIMEOUT)};
    std::chrono::milliseconds search_timeout{std::chrono::seconds(Config::DEFAULT_SEARCH_TIMEOUT)};
    std::chrono::milliseconds dcc_timeout{std::chrono::seconds(Config::DEFAULT_DCC_TIMEOUT)};

    // Defaults, overlaid by the JSON file at path (if any), then by the environment.
    static Settings load(const std::string& path);
    // Overlay the keys present in j on top of base.
    static Settings from_json(const json& j, const Settings& base = Settings());
    // Overlay IRC_SERVER, IRC_PORT, ... from the process environment.
    static Settings with_environment(const Settings& base);

    json to_json() const;
};
