#pragma once

#include <string>

namespace platform {

// Empty string when no home directory can be determined.
std::string config_dir();
std::string data_dir();
std::string cache_dir();

// The user's downloads directory (XDG user dir), falling back to ~/Downloads.
std::string downloads_dir();

} // namespace platform
