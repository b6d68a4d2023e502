#include "CommandHandler.hpp"
#include "helpers/CliHelpers.hpp"
#include "helpers/Config.hpp"
#include "../core/Errors.hpp"
#include "../download/DownloadJobQueue.hpp"
#include "../download/DownloadPipeline.hpp"
#include "../network/DccOffer.hpp"
#include "../network/Transport.hpp"
#include "../session/PersistentSession.hpp"
#include "../session/SearchSession.hpp"
#include "../utils/CryptoUtils.hpp"
#include "../utils/Logger.hpp"
#include "../utils/ResultParser.hpp"
#include "../utils/StringUtils.hpp"

#include <iostream>
#include <chrono>
#include <stdexcept>

// ============================================================================
// COMMAND EXECUTOR
// ============================================================================

int CommandHandler::execute(const std::string& command, const std::vector<std::string>& args,
                            const Settings& settings) {
    try {
        if (command == "search") {
            return handle_search(args, settings);
        } else if (command == "download") {
            return handle_download(args, settings);
        } else if (command == "session") {
            return handle_session(args, settings);
        } else if (command == "decode_offer") {
            return handle_decode_offer(args, settings);
        } else if (command == "parse_results") {
            return handle_parse_results(args, settings);
        } else if (command == "process") {
            return handle_process(args, settings);
        } else if (command == "ping") {
            return handle_ping(args, settings);
        } else if (command == "config") {
            return handle_config(args, settings);
        }
        std::cerr << "Unknown command: " << command << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

// ============================================================================
// IRC COMMANDS
// ============================================================================

int CommandHandler::handle_search(std::vector<std::string> args, const Settings& settings) {
    auto author = CliHelpers::take_option(args, "--author");
    bool as_json = CliHelpers::take_flag(args, "--json");
    if (args.empty()) {
        std::cerr << "Usage: search <query> [--author <author>] [--json]" << std::endl;
        return 1;
    }

    SearchSession session(settings);
    auto results = session.search(CliHelpers::join_args(args), author);
    CliHelpers::print_results(results, as_json);
    return 0;
}

int CommandHandler::handle_download(std::vector<std::string> args, const Settings& settings) {
    auto bot = CliHelpers::take_option(args, "--bot");
    auto folder = CliHelpers::take_option(args, "--folder");
    if (args.empty()) {
        std::cerr << "Usage: download <result_id> [--bot <bot>] [--folder <folder>]" << std::endl;
        return 1;
    }

    DownloadJobQueue queue(settings);
    std::string job_id = queue.submit(CliHelpers::join_args(args), bot, folder);
    return CliHelpers::follow_job(queue, job_id);
}

int CommandHandler::handle_session(std::vector<std::string> args, const Settings& settings) {
    bool as_json = CliHelpers::take_flag(args, "--json");

    PersistentSession session(settings);
    session.connect();
    auto budget = settings.connect_timeout +
                  settings.welcome_timeout * Config::MAX_REGISTRATION_ATTEMPTS +
                  settings.join_timeout;
    if (!session.wait_until_connected(budget)) {
        std::cerr << "Error: " << session.status().error.value_or("session did not connect") << std::endl;
        return 1;
    }
    std::cout << "Connected. One query per line; 'status', 'logs' or 'quit'." << std::endl;

    std::string line;
    while (std::getline(std::cin, line)) {
        std::string query = StringUtils::trim(line);
        if (query.empty()) continue;
        if (query == "quit") break;
        if (query == "status") {
            std::cout << session.status().to_json().dump(2) << std::endl;
            continue;
        }
        if (query == "logs") {
            for (const auto& entry : Logger::recent_lines()) {
                std::cout << entry << std::endl;
            }
            continue;
        }

        try {
            auto results = session.search(query, std::nullopt,
                                          std::chrono::seconds(Config::DEFAULT_SESSION_WAIT));
            CliHelpers::print_results(results, as_json);
        } catch (const LircbraryError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            if (!session.is_connected()) {
                return 1;
            }
        }
    }

    session.disconnect();
    return 0;
}

int CommandHandler::handle_ping(std::vector<std::string> args, const Settings& settings) {
    if (args.size() < 2) {
        std::cerr << "Usage: ping <host> <port>" << std::endl;
        return 1;
    }
    int port = std::stoi(args[1]);
    auto result = Transport::probe(args[0], port, settings.connect_timeout);
    std::cout << (result.ok ? "ok" : "failed: " + result.detail) << std::endl;
    return result.ok ? 0 : 1;
}

// ============================================================================
// LOCAL COMMANDS
// ============================================================================

int CommandHandler::handle_decode_offer(std::vector<std::string> args, const Settings& settings) {
    auto sender = CliHelpers::take_option(args, "--sender");
    if (args.empty()) {
        std::cerr << "Usage: decode_offer <payload> [--sender <nick>]" << std::endl;
        return 1;
    }

    std::string payload = CliHelpers::join_args(args);
    if (!DccOffer::is_dcc_send(payload)) {
        std::cerr << "Not a DCC SEND payload" << std::endl;
        return 1;
    }
    TransferOffer offer = DccOffer::parse(payload, sender.value_or(""), OfferPolicy::from_settings(settings));
    std::cout << offer.to_json().dump(2) << std::endl;
    return 0;
}

int CommandHandler::handle_parse_results(std::vector<std::string> args, const Settings&) {
    bool as_json = CliHelpers::take_flag(args, "--json");
    if (args.empty()) {
        std::cerr << "Usage: parse_results <file> [--json]" << std::endl;
        return 1;
    }
    CliHelpers::print_results(ResultParser::parse_file(args[0]), as_json);
    return 0;
}

int CommandHandler::handle_process(std::vector<std::string> args, const Settings& settings) {
    auto folder = CliHelpers::take_option(args, "--folder");
    if (args.size() < 2) {
        std::cerr << "Usage: process <file> <result_id> [--folder <folder>]" << std::endl;
        return 1;
    }

    DownloadJob job;
    job.id = CryptoUtils::random_hex(Config::JOB_ID_BYTES);
    job.request_id = CliHelpers::join_args(std::vector<std::string>(args.begin() + 1, args.end()));
    job.target_folder = folder;

    std::string final_path = DownloadPipeline::file_download(job, args[0], settings);
    std::cout << "Saved to " << final_path << std::endl;
    return 0;
}

int CommandHandler::handle_config(std::vector<std::string>, const Settings& settings) {
    std::cout << settings.to_json().dump(2) << std::endl;
    return 0;
}
