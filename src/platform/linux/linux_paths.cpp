#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <fstream>
#include <string_view>

namespace platform {

namespace {

std::string home_dir() {
    const char* home = std::getenv("HOME");
    return home ? std::string(home) : std::string{};
}

// Reads XDG_DOWNLOAD_DIR="$HOME/Downloads" from user-dirs.dirs.
std::string read_user_dirs_download(const std::string& home) {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    std::string file = xdg ? std::string(xdg) + "/user-dirs.dirs"
                           : home + "/.config/user-dirs.dirs";
    std::ifstream f(file);
    if (!f.is_open()) return {};

    constexpr std::string_view key = "XDG_DOWNLOAD_DIR=";
    std::string line;
    while (std::getline(f, line)) {
        if (!line.starts_with(key)) continue;

        std::string value = line.substr(key.size());
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        if (value.starts_with("$HOME")) {
            value = home + value.substr(5);
        }
        return value;
    }
    return {};
}

} // namespace

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/mediascribe";
    auto home = home_dir();
    if (home.empty()) return {};
    return home + "/.config/mediascribe";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg) return std::string(xdg) + "/mediascribe";
    auto home = home_dir();
    if (home.empty()) return {};
    return home + "/.local/share/mediascribe";
}

std::string cache_dir() {
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg) return std::string(xdg) + "/mediascribe";
    auto home = home_dir();
    if (home.empty()) return {};
    return home + "/.cache/mediascribe";
}

std::string downloads_dir() {
    const char* env = std::getenv("XDG_DOWNLOAD_DIR");
    if (env && *env) return env;

    auto home = home_dir();
    if (home.empty()) return "/tmp";

    auto from_user_dirs = read_user_dirs_download(home);
    if (!from_user_dirs.empty()) return from_user_dirs;
    return home + "/Downloads";
}

} // namespace platform
