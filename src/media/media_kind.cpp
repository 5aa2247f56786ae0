#include "media/media_kind.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

const std::vector<std::string>& supported_audio_extensions() {
    static const std::vector<std::string> exts = {"mp3", "wav", "m4a", "ogg", "flac", "aac"};
    return exts;
}

const std::vector<std::string>& supported_video_extensions() {
    static const std::vector<std::string> exts = {"mp4", "mov", "avi", "mkv", "webm", "flv", "wmv"};
    return exts;
}

std::vector<std::string> supported_extensions() {
    auto all = supported_audio_extensions();
    const auto& video = supported_video_extensions();
    all.insert(all.end(), video.begin(), video.end());
    return all;
}

MediaKind classify_media(std::string_view path) {
    auto ext = std::filesystem::path(path).extension().string();
    if (ext.size() < 2) return MediaKind::Unsupported;

    ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto contains = [&ext](const std::vector<std::string>& v) {
        return std::find(v.begin(), v.end(), ext) != v.end();
    };
    if (contains(supported_audio_extensions())) return MediaKind::Audio;
    if (contains(supported_video_extensions())) return MediaKind::Video;
    return MediaKind::Unsupported;
}
