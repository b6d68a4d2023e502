#include "ZipWriter.hpp"
#include <zlib.h>
#include <fstream>
#include <stdexcept>

namespace {
void put16(std::string& out, uint16_t value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
}

void put32(std::string& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

std::string raw_deflate(const std::string& input) {
    z_stream strm{};
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    std::string out(deflateBound(&strm, static_cast<uLong>(input.size())), '\0');
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_out = reinterpret_cast<Bytef*>(&out[0]);
    strm.avail_out = static_cast<uInt>(out.size());
    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (ret != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    out.resize(strm.total_out);
    return out;
}
}

ZipWriter& ZipWriter::add(const std::string& name, const std::string& content, bool deflate) {
    Member m;
    m.name = name;
    m.method = deflate ? 8 : 0;
    m.stored = deflate ? raw_deflate(content) : content;
    m.crc = static_cast<uint32_t>(crc32(crc32(0L, Z_NULL, 0),
                                        reinterpret_cast<const Bytef*>(content.data()),
                                        static_cast<uInt>(content.size())));
    m.size = static_cast<uint32_t>(content.size());
    members.push_back(m);
    return *this;
}

ZipWriter& ZipWriter::add_directory(const std::string& name) {
    return add(name.back() == '/' ? name : name + "/", "");
}

std::string ZipWriter::build() const {
    std::string out;
    std::string central;
    for (const auto& m : members) {
        uint32_t offset = static_cast<uint32_t>(out.size());

        put32(out, 0x04034b50);
        put16(out, 20);
        put16(out, 0);
        put16(out, m.method);
        put16(out, 0);
        put16(out, 0x21);
        put32(out, m.crc);
        put32(out, static_cast<uint32_t>(m.stored.size()));
        put32(out, m.size);
        put16(out, static_cast<uint16_t>(m.name.size()));
        put16(out, 0);
        out += m.name;
        out += m.stored;

        put32(central, 0x02014b50);
        put16(central, 20);
        put16(central, 20);
        put16(central, 0);
        put16(central, m.method);
        put16(central, 0);
        put16(central, 0x21);
        put32(central, m.crc);
        put32(central, static_cast<uint32_t>(m.stored.size()));
        put32(central, m.size);
        put16(central, static_cast<uint16_t>(m.name.size()));
        put16(central, 0);
        put16(central, 0);
        put16(central, 0);
        put16(central, 0);
        put32(central, 0);
        put32(central, offset);
        central += m.name;
    }

    uint32_t cd_offset = static_cast<uint32_t>(out.size());
    out += central;
    put32(out, 0x06054b50);
    put16(out, 0);
    put16(out, 0);
    put16(out, static_cast<uint16_t>(members.size()));
    put16(out, static_cast<uint16_t>(members.size()));
    put32(out, static_cast<uint32_t>(central.size()));
    put32(out, cd_offset);
    put16(out, 0);
    return out;
}

void ZipWriter::write(const std::string& path) const {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    std::string data = build();
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw std::runtime_error("Failed to write " + path);
    }
}
