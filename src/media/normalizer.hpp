#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "media/media_kind.hpp"
#include "media/media_toolkit.hpp"
#include "transcript.hpp"

#include <expected>
#include <filesystem>
#include <stop_token>
#include <string>

// Turns an input media file into audio the recognition engine can decode.
// Audio files pass through untouched (unless oversized); video files get
// their audio track extracted into work_dir.
class MediaNormalizer {
public:
    MediaNormalizer(MediaToolkit& toolkit, Config::Media cfg);

    // Classifies and checks the input without touching the disk otherwise.
    // UnsupportedFormat for unknown extensions and unreadable files.
    std::expected<MediaKind, PipelineError> check_input(const std::string& input_path) const;

    std::expected<NormalizedAudio, PipelineError>
        normalize(const std::string& input_path, const std::filesystem::path& work_dir,
                  std::stop_token stop = {});

private:
    std::expected<NormalizedAudio, PipelineError>
        extract(const std::string& input_path, const std::filesystem::path& output,
                std::stop_token stop);

    NormalizedAudio pass_through(const std::string& input_path);

    MediaToolkit& toolkit_;
    Config::Media cfg_;
};
