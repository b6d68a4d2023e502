#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace Config {
    // IRC defaults
    constexpr int DEFAULT_IRC_PORT = 6667;
    constexpr int MAX_REGISTRATION_ATTEMPTS = 3;

    // Timeouts (seconds)
    constexpr int DEFAULT_CONNECT_TIMEOUT = 60;
    constexpr int DEFAULT_WELCOME_TIMEOUT = 10;
    constexpr int DEFAULT_JOIN_TIMEOUT = 10;
    constexpr int DEFAULT_SEARCH_TIMEOUT = 15;
    constexpr int DEFAULT_DCC_TIMEOUT = 60;
    constexpr int DEFAULT_SESSION_WAIT = 30;

    // Event loop slice (milliseconds)
    constexpr int POLL_SLICE_MS = 200;

    // DCC constants
    constexpr size_t DCC_CHUNK_SIZE = 4096;

    // Socket read buffer for the IRC connection
    constexpr size_t IRC_READ_BUFFER = 4096;

    // Logging
    constexpr size_t LOG_RING_LINES = 200;

    // Job queue
    constexpr int DEFAULT_JOB_WORKERS = 1;
    constexpr int JOB_ID_BYTES = 16;

    // Upper bound for a gunzipped tar stream held in memory
    constexpr uint64_t MAX_UNPACKED_ARCHIVE_BYTES = 1ULL << 30;

    // Ebook detection
    constexpr const char* EPUB_MIMETYPE = "application/epub+zip";
    constexpr const char* EPUB_MIMETYPE_MEMBER = "mimetype";
}

#endif // CONFIG_HPP
