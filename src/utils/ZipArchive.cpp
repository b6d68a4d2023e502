#include "ZipArchive.hpp"
#include "FileUtils.hpp"
#include "../core/Errors.hpp"
#include <zlib.h>
#include <algorithm>
#include <fstream>

namespace {
constexpr uint32_t LOCAL_HEADER_SIG = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
constexpr uint32_t END_RECORD_SIG = 0x06054b50;
constexpr size_t END_RECORD_SIZE = 22;
constexpr size_t CENTRAL_HEADER_SIZE = 46;
constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t MAX_COMMENT = 0xFFFF;
constexpr size_t INFLATE_CHUNK = 16384;
constexpr size_t MAX_RESERVE = 1 << 20;
}

bool ZipArchive::Entry::is_directory() const {
    return !name.empty() && (name.back() == '/' || name.back() == '\\');
}

bool ZipArchive::has_signature(const std::string& data) {
    if (data.size() < 4) return false;
    return data.compare(0, 4, "PK\x03\x04") == 0 || data.compare(0, 4, "PK\x05\x06") == 0;
}

bool ZipArchive::file_has_signature(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    char head[4] = {};
    file.read(head, sizeof(head));
    if (file.gcount() != sizeof(head)) return false;
    return has_signature(std::string(head, sizeof(head)));
}

ZipArchive ZipArchive::open(const std::string& path) {
    return ZipArchive(FileUtils::read_file(path));
}

ZipArchive::ZipArchive(std::string data) : data(std::move(data)) {
    read_central_directory();
}

const std::vector<ZipArchive::Entry>& ZipArchive::entries() const {
    return members;
}

const ZipArchive::Entry* ZipArchive::find(const std::string& name) const {
    for (const auto& entry : members) {
        if (entry.name == name) return &entry;
    }
    return nullptr;
}

uint16_t ZipArchive::u16(size_t offset) const {
    if (offset + 2 > data.size()) {
        throw ZipFormatError("Truncated zip structure");
    }
    auto b = reinterpret_cast<const unsigned char*>(data.data()) + offset;
    return static_cast<uint16_t>(b[0] | (b[1] << 8));
}

uint32_t ZipArchive::u32(size_t offset) const {
    if (offset + 4 > data.size()) {
        throw ZipFormatError("Truncated zip structure");
    }
    auto b = reinterpret_cast<const unsigned char*>(data.data()) + offset;
    return static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8) |
           (static_cast<uint32_t>(b[2]) << 16) | (static_cast<uint32_t>(b[3]) << 24);
}

size_t ZipArchive::locate_end_record() const {
    if (data.size() < END_RECORD_SIZE) {
        throw ZipFormatError("Not a zip archive: too short");
    }
    size_t last = data.size() - END_RECORD_SIZE;
    size_t first = last > MAX_COMMENT ? last - MAX_COMMENT : 0;
    for (size_t pos = last + 1; pos-- > first;) {
        if (u32(pos) == END_RECORD_SIG) return pos;
    }
    throw ZipFormatError("Not a zip archive: end of central directory not found");
}

void ZipArchive::read_central_directory() {
    size_t eocd = locate_end_record();

    uint16_t disk = u16(eocd + 4);
    uint16_t cd_disk = u16(eocd + 6);
    uint16_t total = u16(eocd + 10);
    uint32_t cd_size = u32(eocd + 12);
    uint32_t cd_offset = u32(eocd + 16);

    if (disk != 0 || cd_disk != 0) {
        throw ZipFormatError("Multi-disk zip archives are not supported");
    }
    if (total == 0xFFFF || cd_offset == 0xFFFFFFFF || cd_size == 0xFFFFFFFF) {
        throw ZipFormatError("Zip64 archives are not supported");
    }
    if (static_cast<uint64_t>(cd_offset) + cd_size > eocd) {
        throw ZipFormatError("Central directory lies outside the archive");
    }

    size_t pos = cd_offset;
    members.reserve(total);
    for (uint16_t i = 0; i < total; ++i) {
        if (u32(pos) != CENTRAL_HEADER_SIG) {
            throw ZipFormatError("Bad central directory header");
        }
        Entry entry;
        entry.flags = u16(pos + 8);
        entry.method = u16(pos + 10);
        entry.crc32 = u32(pos + 16);
        entry.compressed_size = u32(pos + 20);
        entry.uncompressed_size = u32(pos + 24);
        uint16_t name_len = u16(pos + 28);
        uint16_t extra_len = u16(pos + 30);
        uint16_t comment_len = u16(pos + 32);
        entry.local_header_offset = u32(pos + 42);

        size_t name_at = pos + CENTRAL_HEADER_SIZE;
        if (name_at + name_len > data.size()) {
            throw ZipFormatError("Truncated central directory entry");
        }
        entry.name = data.substr(name_at, name_len);

        if (entry.compressed_size == 0xFFFFFFFF || entry.uncompressed_size == 0xFFFFFFFF ||
            entry.local_header_offset == 0xFFFFFFFF) {
            throw ZipFormatError("Zip64 entry not supported: " + entry.name);
        }

        members.push_back(std::move(entry));
        pos = name_at + name_len + extra_len + comment_len;
    }
}

std::string ZipArchive::read(const Entry& entry) const {
    if (entry.flags & 0x0001) {
        throw ZipFormatError("Encrypted entry not supported: " + entry.name);
    }

    size_t header = entry.local_header_offset;
    if (u32(header) != LOCAL_HEADER_SIG) {
        throw ZipFormatError("Bad local header for " + entry.name);
    }
    size_t start = header + LOCAL_HEADER_SIZE + u16(header + 26) + u16(header + 28);
    if (start + entry.compressed_size > data.size()) {
        throw ZipFormatError("Truncated data for " + entry.name);
    }

    std::string out;
    if (entry.method == METHOD_STORED) {
        out = data.substr(start, entry.compressed_size);
    } else if (entry.method == METHOD_DEFLATED) {
        z_stream strm{};
        if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) {
            throw ZipFormatError("inflateInit2 failed");
        }
        strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data() + start));
        strm.avail_in = entry.compressed_size;

        out.reserve(std::min<size_t>(entry.uncompressed_size, MAX_RESERVE));
        char buffer[INFLATE_CHUNK];
        int ret = Z_OK;
        while (ret != Z_STREAM_END) {
            strm.next_out = reinterpret_cast<Bytef*>(buffer);
            strm.avail_out = sizeof(buffer);
            ret = inflate(&strm, Z_NO_FLUSH);
            if (ret != Z_OK && ret != Z_STREAM_END) {
                inflateEnd(&strm);
                throw ZipFormatError("Corrupt deflate data in " + entry.name);
            }
            size_t produced = sizeof(buffer) - strm.avail_out;
            // Never inflate past the size the directory declares
            if (out.size() + produced > entry.uncompressed_size) {
                inflateEnd(&strm);
                throw ZipFormatError("Member larger than declared size: " + entry.name);
            }
            out.append(buffer, produced);
            if (ret == Z_OK && produced == 0 && strm.avail_in == 0) {
                inflateEnd(&strm);
                throw ZipFormatError("Truncated deflate data in " + entry.name);
            }
        }
        inflateEnd(&strm);
    } else {
        throw ZipFormatError("Unsupported compression method " + std::to_string(entry.method) +
                             " for " + entry.name);
    }

    if (out.size() != entry.uncompressed_size) {
        throw ZipFormatError("Size mismatch in " + entry.name);
    }
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(out.data()), static_cast<uInt>(out.size()));
    if (static_cast<uint32_t>(crc) != entry.crc32) {
        throw ZipFormatError("CRC mismatch in " + entry.name);
    }
    return out;
}
