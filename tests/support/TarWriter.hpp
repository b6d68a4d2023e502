#pragma once
#include <string>
#include <vector>

// Builds small ustar archives in memory for tests. Names longer than the
// 100-byte header field are written with a GNU long-name record.
class TarWriter {
public:
    TarWriter& add(const std::string& name, const std::string& content);
    TarWriter& add_directory(const std::string& name);
    TarWriter& add_symlink(const std::string& name, const std::string& target);

    std::string build() const;
    // build() wrapped in gzip.
    std::string build_gzip() const;
    void write(const std::string& path, bool gzip = false) const;

private:
    struct Member {
        std::string name;
        char type;
        std::string content;
        std::string link;
    };
    std::vector<Member> members;
};
