#include "media/run_workspace.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <print>
#include <vector>

namespace fs = std::filesystem;

std::expected<RunWorkspace, std::string> RunWorkspace::create(const std::string& parent_dir) {
    std::error_code ec;
    fs::path parent = parent_dir.empty() ? fs::temp_directory_path(ec) : fs::path(parent_dir);
    if (ec) return std::unexpected("no temp directory: " + ec.message());

    fs::create_directories(parent, ec);
    if (ec) return std::unexpected("cannot create " + parent.string() + ": " + ec.message());

    auto tmpl_str = (parent / "mediascribe_XXXXXX").string();
    std::vector<char> tmpl(tmpl_str.begin(), tmpl_str.end());
    tmpl.push_back('\0');
    if (!::mkdtemp(tmpl.data())) {
        return std::unexpected(std::string("mkdtemp failed: ") + std::strerror(errno));
    }
    return RunWorkspace(fs::path(tmpl.data()));
}

RunWorkspace::~RunWorkspace() {
    remove();
}

RunWorkspace::RunWorkspace(RunWorkspace&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

RunWorkspace& RunWorkspace::operator=(RunWorkspace&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void RunWorkspace::remove() {
    if (path_.empty()) return;

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        std::println(stderr, "workspace: failed to remove {}: {}", path_.string(), ec.message());
    }
    path_.clear();
}
