#include "platform/desktop.hpp"

#include "platform/process.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace platform {

std::optional<std::string> pick_file(const std::string& title,
                                     const std::vector<std::string>& extensions) {
    std::string filter = "Audio/video |";
    for (const auto& ext : extensions) {
        filter += " *." + ext;
    }

    auto res = run_process({"zenity", "--file-selection", "--title=" + title,
                            "--file-filter=" + filter},
                           {.timeout = std::chrono::minutes(5), .capture_stdout = true});
    if (!res || res->exit_code != 0) return std::nullopt;

    std::string path = res->output;
    while (!path.empty() && (path.back() == '\n' || path.back() == '\r')) path.pop_back();

    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec)) return std::nullopt;
    return path;
}

bool reveal_in_file_browser(const std::string& path) {
    auto dir = fs::path(path).parent_path();
    if (dir.empty()) dir = ".";
    auto res = run_process({"xdg-open", dir.string()}, {.timeout = std::chrono::seconds(10)});
    return res && res->exit_code == 0;
}

} // namespace platform
