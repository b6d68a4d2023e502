#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Read-only ZIP container held in memory. Supports stored and deflated
// members; zip64, encrypted and multi-disk archives raise ZipFormatError.
class ZipArchive {
public:
    struct Entry {
        std::string name;
        uint16_t method;
        uint16_t flags;
        uint32_t crc32;
        uint32_t compressed_size;
        uint32_t uncompressed_size;
        uint32_t local_header_offset;

        bool is_directory() const;
    };

    static constexpr uint16_t METHOD_STORED = 0;
    static constexpr uint16_t METHOD_DEFLATED = 8;

    // "PK\3\4" (local header) or "PK\5\6" (empty archive).
    static bool has_signature(const std::string& data);
    static bool file_has_signature(const std::string& path);

    static ZipArchive open(const std::string& path);
    explicit ZipArchive(std::string data);

    const std::vector<Entry>& entries() const;
    // nullptr when no member has that exact name.
    const Entry* find(const std::string& name) const;
    // Uncompressed bytes of entry, CRC checked.
    std::string read(const Entry& entry) const;

private:
    std::string data;
    std::vector<Entry> members;

    void read_central_directory();
    size_t locate_end_record() const;
    uint16_t u16(size_t offset) const;
    uint32_t u32(size_t offset) const;
};
