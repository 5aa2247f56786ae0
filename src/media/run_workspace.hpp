#pragma once

#include <expected>
#include <filesystem>
#include <string>

// Private temporary directory for one pipeline run. Removed with everything
// in it on destruction or remove().
class RunWorkspace {
public:
    // parent_dir empty: the system temp directory.
    static std::expected<RunWorkspace, std::string> create(const std::string& parent_dir);

    RunWorkspace() = default;
    ~RunWorkspace();

    RunWorkspace(RunWorkspace&& other) noexcept;
    RunWorkspace& operator=(RunWorkspace&& other) noexcept;
    RunWorkspace(const RunWorkspace&) = delete;
    RunWorkspace& operator=(const RunWorkspace&) = delete;

    const std::filesystem::path& path() const { return path_; }
    bool active() const { return !path_.empty(); }

    void remove();

private:
    explicit RunWorkspace(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
};
