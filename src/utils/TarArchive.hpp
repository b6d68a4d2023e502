#pragma once
#include "../commands/helpers/Config.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Read-only tar archive held in memory, plain or gzip-compressed. Understands
// ustar prefixes, GNU long names and pax "path" records. Malformed headers
// raise TarFormatError.
class TarArchive {
public:
    struct Entry {
        std::string name;
        char type;
        uint64_t size;
        size_t data_offset;

        bool is_directory() const;
        bool is_file() const;
    };

    // gzip magic, or a first header block with a valid checksum.
    static bool has_signature(const std::string& data);
    static bool file_has_signature(const std::string& path);

    static TarArchive open(const std::string& path, uint64_t max_bytes = Config::MAX_UNPACKED_ARCHIVE_BYTES);
    // Gunzips data first when it carries the gzip magic. A stream that
    // inflates past max_bytes raises TarFormatError.
    explicit TarArchive(std::string data, uint64_t max_bytes = Config::MAX_UNPACKED_ARCHIVE_BYTES);

    const std::vector<Entry>& entries() const;
    std::string read(const Entry& entry) const;

private:
    std::string data;
    std::vector<Entry> members;

    void read_headers();
    static bool is_gzip(const std::string& data);
    static std::string gunzip(const std::string& data, uint64_t max_bytes);
};
