#include "FileUtils.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

std::string FileUtils::read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void FileUtils::write_file(const std::string& filename, const std::string& content) {
    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to create output file: " + filename);
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        throw std::runtime_error("Failed to write file: " + filename);
    }
}

std::string FileUtils::safe_filename(const std::string& name, const std::string& fallback) {
    size_t pos = name.find_last_of("/\\");
    std::string base = (pos == std::string::npos) ? name : name.substr(pos + 1);

    std::string out;
    for (char c : base) {
        unsigned char uc = static_cast<unsigned char>(c);
        out.push_back(uc < 0x20 || uc == 0x7F ? '_' : c);
    }
    out = StringUtils::trim(out);
    if (out.empty() || out == "." || out == "..") {
        return fallback;
    }
    return out;
}

std::string FileUtils::lower_extension(const std::string& filename) {
    return StringUtils::to_lower(fs::path(filename).extension().string());
}

fs::path FileUtils::unique_destination(const fs::path& dir, const std::string& filename) {
    fs::path candidate = dir / filename;
    if (!fs::exists(candidate)) {
        return candidate;
    }
    fs::path name(filename);
    std::string stem = name.stem().string();
    std::string ext = name.extension().string();
    for (int n = 2;; ++n) {
        candidate = dir / (stem + " (" + std::to_string(n) + ")" + ext);
        if (!fs::exists(candidate)) {
            return candidate;
        }
    }
}

void FileUtils::move_file(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) {
        return;
    }
    if (ec != std::errc::cross_device_link) {
        throw fs::filesystem_error("move failed", from, to, ec);
    }
    fs::copy_file(from, to, fs::copy_options::overwrite_existing);
    fs::remove(from);
}

bool FileUtils::is_within(const fs::path& root, const fs::path& candidate) {
    fs::path base = root.lexically_normal();
    fs::path target = candidate.lexically_normal();

    // drop a trailing empty element left by "dir/"
    auto trimmed = [](const fs::path& p) {
        std::string s = p.string();
        while (s.size() > 1 && s.back() == '/') s.pop_back();
        return fs::path(s);
    };
    base = trimmed(base);
    target = trimmed(target);

    auto b = base.begin();
    auto t = target.begin();
    for (; b != base.end(); ++b, ++t) {
        if (t == target.end() || *b != *t) {
            return false;
        }
    }
    return t != target.end();
}
