#include "commands/CommandHandler.hpp"
#include "core/Settings.hpp"
#include "utils/Logger.hpp"
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <vector>

int main(int argc, char* argv[]) {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;
    std::signal(SIGPIPE, SIG_IGN);

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    std::string config_path;
    if (args.size() >= 2 && args[0] == "--config") {
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    } else if (const char* env = std::getenv("LIRCBRARY_CONFIG")) {
        config_path = env;
    } else {
        config_path = "config.json";
    }

    if (args.empty()) {
        std::cerr << "Usage: " << argv[0] << " [--config <path>] <command> <args>" << std::endl;
        std::cerr << "\nAvailable commands:" << std::endl;
        std::cerr << "  IRC:" << std::endl;
        std::cerr << "    search <query> [--author <author>] [--json]" << std::endl;
        std::cerr << "    download <result_id> [--bot <bot>] [--folder <folder>]" << std::endl;
        std::cerr << "    session [--json]" << std::endl;
        std::cerr << "    ping <host> <port>" << std::endl;
        std::cerr << "\n  Local:" << std::endl;
        std::cerr << "    decode_offer <payload> [--sender <nick>]" << std::endl;
        std::cerr << "    parse_results <file> [--json]" << std::endl;
        std::cerr << "    process <file> <result_id> [--folder <folder>]" << std::endl;
        std::cerr << "    config" << std::endl;
        return 1;
    }

    Logger::init();
    Settings settings = Settings::load(config_path);

    std::string command = args[0];
    args.erase(args.begin());
    return CommandHandler::execute(command, args, settings);
}
