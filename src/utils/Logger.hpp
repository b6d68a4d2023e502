#pragma once
#include <cstddef>
#include <string>
#include <vector>

// Installs the "lircbrary" default spdlog logger: colored stderr plus an
// in-memory ring buffer of the most recent trace lines.
class Logger {
public:
    static void init();
    // Most recent formatted lines, oldest first. limit == 0 returns everything kept.
    static std::vector<std::string> recent_lines(size_t limit = 0);
};
