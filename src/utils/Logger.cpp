#include "Logger.hpp"
#include "../commands/helpers/Config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <mutex>

namespace {
std::once_flag init_flag;
std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> ring_sink;
}

void Logger::init() {
    std::call_once(init_flag, [] {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        ring_sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(Config::LOG_RING_LINES);
        ring_sink->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");

        auto logger = std::make_shared<spdlog::logger>(
            "lircbrary", spdlog::sinks_init_list{console, ring_sink});

        const char* level = std::getenv("LIRCBRARY_LOG_LEVEL");
        logger->set_level(level ? spdlog::level::from_str(level) : spdlog::level::info);
        spdlog::set_default_logger(logger);
    });
}

std::vector<std::string> Logger::recent_lines(size_t limit) {
    init();
    std::vector<std::string> lines = ring_sink->last_formatted(limit);
    for (auto& line : lines) {
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
    }
    return lines;
}
