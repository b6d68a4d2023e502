#pragma once
#include "../core/Settings.hpp"
#include <string>
#include <vector>

class CommandHandler {
public:
    // Returns the process exit status.
    static int execute(const std::string& command, const std::vector<std::string>& args,
                       const Settings& settings);

private:
    static int handle_search(std::vector<std::string> args, const Settings& settings);
    static int handle_download(std::vector<std::string> args, const Settings& settings);
    static int handle_session(std::vector<std::string> args, const Settings& settings);
    static int handle_decode_offer(std::vector<std::string> args, const Settings& settings);
    static int handle_parse_results(std::vector<std::string> args, const Settings& settings);
    static int handle_process(std::vector<std::string> args, const Settings& settings);
    static int handle_ping(std::vector<std::string> args, const Settings& settings);
    static int handle_config(std::vector<std::string> args, const Settings& settings);
};
