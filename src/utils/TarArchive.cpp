#include "TarArchive.hpp"
#include "FileUtils.hpp"
#include "../core/Errors.hpp"
#include <zlib.h>
#include <fstream>
#include <optional>

namespace {
constexpr size_t BLOCK = 512;
constexpr size_t INFLATE_CHUNK = 16384;

constexpr size_t NAME_AT = 0;
constexpr size_t NAME_LEN = 100;
constexpr size_t SIZE_AT = 124;
constexpr size_t SIZE_LEN = 12;
constexpr size_t CHECKSUM_AT = 148;
constexpr size_t CHECKSUM_LEN = 8;
constexpr size_t TYPE_AT = 156;
constexpr size_t MAGIC_AT = 257;
constexpr size_t PREFIX_AT = 345;
constexpr size_t PREFIX_LEN = 155;

bool is_zero_block(const char* block) {
    for (size_t i = 0; i < BLOCK; ++i) {
        if (block[i] != '\0') return false;
    }
    return true;
}

std::string field_string(const char* field, size_t len) {
    size_t n = 0;
    while (n < len && field[n] != '\0') ++n;
    return std::string(field, n);
}

// Octal, NUL/space padded; a leading 0x80 byte marks GNU base-256.
std::optional<uint64_t> parse_number(const char* field, size_t len) {
    auto bytes = reinterpret_cast<const unsigned char*>(field);
    if (bytes[0] & 0x80) {
        uint64_t value = bytes[0] & 0x7F;
        for (size_t i = 1; i < len; ++i) {
            if (value > (UINT64_MAX >> 8)) return std::nullopt;
            value = (value << 8) | bytes[i];
        }
        return value;
    }

    size_t i = 0;
    while (i < len && (field[i] == ' ' || field[i] == '\0')) ++i;
    uint64_t value = 0;
    bool digits = false;
    for (; i < len && field[i] != ' ' && field[i] != '\0'; ++i) {
        if (field[i] < '0' || field[i] > '7') return std::nullopt;
        if (value > (UINT64_MAX >> 3)) return std::nullopt;
        value = (value << 3) | static_cast<uint64_t>(field[i] - '0');
        digits = true;
    }
    if (!digits) return uint64_t{0};
    return value;
}

// Accepts both unsigned and signed byte sums, as historic writers differ.
bool checksum_ok(const char* block) {
    auto stored = parse_number(block + CHECKSUM_AT, CHECKSUM_LEN);
    if (!stored) return false;

    uint64_t unsigned_sum = 0;
    int64_t signed_sum = 0;
    for (size_t i = 0; i < BLOCK; ++i) {
        bool in_checksum = i >= CHECKSUM_AT && i < CHECKSUM_AT + CHECKSUM_LEN;
        char c = in_checksum ? ' ' : block[i];
        unsigned_sum += static_cast<unsigned char>(c);
        signed_sum += static_cast<signed char>(c);
    }
    return *stored == unsigned_sum || static_cast<int64_t>(*stored) == signed_sum;
}

std::string header_name(const char* block) {
    std::string name = field_string(block + NAME_AT, NAME_LEN);
    // POSIX ustar splits long paths into prefix + name
    if (std::string(block + MAGIC_AT, 6) == std::string("ustar\0", 6)) {
        std::string prefix = field_string(block + PREFIX_AT, PREFIX_LEN);
        if (!prefix.empty()) {
            name = prefix + "/" + name;
        }
    }
    return name;
}

// pax extended header: "<len> key=value\n" records.
std::optional<std::string> pax_path(const std::string& records) {
    std::optional<std::string> path;
    size_t pos = 0;
    while (pos < records.size()) {
        size_t space = records.find(' ', pos);
        if (space == std::string::npos) {
            throw TarFormatError("Malformed pax header");
        }
        size_t len = 0;
        for (size_t i = pos; i < space; ++i) {
            if (records[i] < '0' || records[i] > '9' || len > records.size()) {
                throw TarFormatError("Malformed pax record length");
            }
            len = len * 10 + static_cast<size_t>(records[i] - '0');
        }
        if (len <= space - pos + 1 || pos + len > records.size()) {
            throw TarFormatError("Malformed pax record length");
        }
        std::string record = records.substr(space + 1, pos + len - space - 1);
        if (!record.empty() && record.back() == '\n') {
            record.pop_back();
        }
        size_t eq = record.find('=');
        if (eq != std::string::npos && record.compare(0, eq, "path") == 0) {
            path = record.substr(eq + 1);
        }
        pos += len;
    }
    return path;
}
}

bool TarArchive::Entry::is_directory() const {
    return type == '5' || (is_file() && !name.empty() && name.back() == '/');
}

bool TarArchive::Entry::is_file() const {
    return type == '0' || type == '7';
}

bool TarArchive::is_gzip(const std::string& data) {
    return data.size() >= 2 && static_cast<unsigned char>(data[0]) == 0x1F &&
           static_cast<unsigned char>(data[1]) == 0x8B;
}

bool TarArchive::has_signature(const std::string& data) {
    if (is_gzip(data)) return true;
    if (data.size() < BLOCK) return false;
    return !is_zero_block(data.data()) && checksum_ok(data.data());
}

bool TarArchive::file_has_signature(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    std::string head(BLOCK, '\0');
    file.read(&head[0], static_cast<std::streamsize>(head.size()));
    head.resize(static_cast<size_t>(file.gcount()));
    return has_signature(head);
}

TarArchive TarArchive::open(const std::string& path, uint64_t max_bytes) {
    return TarArchive(FileUtils::read_file(path), max_bytes);
}

TarArchive::TarArchive(std::string raw, uint64_t max_bytes) {
    data = is_gzip(raw) ? gunzip(raw, max_bytes) : std::move(raw);
    read_headers();
}

const std::vector<TarArchive::Entry>& TarArchive::entries() const {
    return members;
}

std::string TarArchive::read(const Entry& entry) const {
    if (entry.data_offset > data.size() || entry.size > data.size() - entry.data_offset) {
        throw TarFormatError("Truncated data for " + entry.name);
    }
    return data.substr(entry.data_offset, static_cast<size_t>(entry.size));
}

std::string TarArchive::gunzip(const std::string& input, uint64_t max_bytes) {
    z_stream strm{};
    // 16 + window bits: expect a gzip wrapper
    if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
        throw TarFormatError("inflateInit2 failed");
    }
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    strm.avail_in = static_cast<uInt>(input.size());

    std::string out;
    char buffer[INFLATE_CHUNK];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        strm.next_out = reinterpret_cast<Bytef*>(buffer);
        strm.avail_out = sizeof(buffer);
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            throw TarFormatError("Corrupt gzip data");
        }
        size_t produced = sizeof(buffer) - strm.avail_out;
        if (out.size() + produced > max_bytes) {
            inflateEnd(&strm);
            throw TarFormatError("Compressed archive expands beyond " + std::to_string(max_bytes) + " bytes");
        }
        out.append(buffer, produced);
        if (ret == Z_OK && produced == 0 && strm.avail_in == 0) {
            inflateEnd(&strm);
            throw TarFormatError("Truncated gzip data");
        }
    }
    inflateEnd(&strm);
    return out;
}

void TarArchive::read_headers() {
    std::optional<std::string> pending_name;
    size_t pos = 0;
    while (pos < data.size()) {
        if (data.size() - pos < BLOCK) {
            throw TarFormatError("Truncated tar header");
        }
        const char* block = data.data() + pos;
        if (is_zero_block(block)) {
            break; // End-of-archive marker
        }
        if (!checksum_ok(block)) {
            throw TarFormatError("Bad tar header checksum at offset " + std::to_string(pos));
        }

        auto size = parse_number(block + SIZE_AT, SIZE_LEN);
        if (!size) {
            throw TarFormatError("Bad tar size field at offset " + std::to_string(pos));
        }
        size_t body = pos + BLOCK;
        if (*size > data.size() - body) {
            throw TarFormatError("Truncated tar data at offset " + std::to_string(pos));
        }

        char type = block[TYPE_AT] == '\0' ? '0' : block[TYPE_AT];
        if (type == 'L') {
            // GNU long name for the next header
            pending_name = field_string(data.data() + body, static_cast<size_t>(*size));
        } else if (type == 'x') {
            auto path = pax_path(data.substr(body, static_cast<size_t>(*size)));
            if (path) pending_name = path;
        } else if (type != 'g') {
            Entry entry;
            entry.name = pending_name ? *pending_name : header_name(block);
            entry.type = type;
            entry.size = *size;
            entry.data_offset = body;
            members.push_back(std::move(entry));
            pending_name.reset();
        }

        pos = body + static_cast<size_t>((*size + BLOCK - 1) / BLOCK * BLOCK);
    }
}
