#include "TestHelpers.hpp"
#include "utils/FileUtils.hpp"
#include <stdlib.h>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

TempDir::TempDir() {
    std::string pattern = (fs::temp_directory_path() / "lircbrary-test-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("mkdtemp failed");
    }
    root = fs::path(buffer.data());
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(root, ec);
}

const fs::path& TempDir::path() const {
    return root;
}

fs::path TempDir::operator/(const std::string& name) const {
    return root / name;
}

Settings test_settings(int port, const fs::path& root) {
    Settings settings;
    settings.irc_server = "127.0.0.1";
    settings.irc_port = port;
    settings.irc_channel = "#ebooks";
    settings.irc_nick = "tester";
    settings.download_dir = (root / "downloads").string();
    settings.library_dir = (root / "library").string();
    settings.temp_dir = (root / "tmp").string();
    settings.connect_timeout = std::chrono::seconds(2);
    settings.welcome_timeout = std::chrono::seconds(2);
    settings.join_timeout = std::chrono::seconds(2);
    settings.search_timeout = std::chrono::seconds(2);
    settings.dcc_timeout = std::chrono::seconds(5);
    return settings;
}

std::string read_text(const fs::path& path) {
    return FileUtils::read_file(path.string());
}

void write_text(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    FileUtils::write_file(path.string(), content);
}

bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return condition();
}
