#pragma once

#include <optional>
#include <string>
#include <vector>

namespace platform {

// Native file dialog filtered to the given extensions (without dot).
// nullopt if the dialog is unavailable, cancelled or times out.
std::optional<std::string> pick_file(const std::string& title,
                                     const std::vector<std::string>& extensions);

// Opens the directory containing path in the desktop file browser.
bool reveal_in_file_browser(const std::string& path);

} // namespace platform
