#pragma once
#include <filesystem>
#include <string>

class FileUtils {
public:
    static std::string read_file(const std::string& filename);
    static void write_file(const std::string& filename, const std::string& content);

    // Strips directory components and control characters. Never empty.
    static std::string safe_filename(const std::string& name, const std::string& fallback = "download");
    // Lower-cased extension including the dot, or "".
    static std::string lower_extension(const std::string& filename);

    // Path inside dir named filename, inserting " (2)", " (3)", ... before the
    // extension while the name is taken.
    static std::filesystem::path unique_destination(const std::filesystem::path& dir,
                                                    const std::string& filename);
    // rename(), falling back to copy + remove across filesystems.
    static void move_file(const std::filesystem::path& from, const std::filesystem::path& to);

    // True when candidate (lexically normalized) lies strictly below root.
    static bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate);
};
