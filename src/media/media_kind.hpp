#pragma once

#include <string>
#include <string_view>
#include <vector>

enum class MediaKind { Audio, Video, Unsupported };

// Extensions are lowercase and carry no leading dot.
const std::vector<std::string>& supported_audio_extensions();
const std::vector<std::string>& supported_video_extensions();
std::vector<std::string> supported_extensions();

// Classifies by file extension, case-insensitively.
MediaKind classify_media(std::string_view path);
