#include "media/normalizer.hpp"

#include "media/wav_codec.hpp"

#include <format>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr int kExtractionAttempts = 2;

} // namespace

MediaNormalizer::MediaNormalizer(MediaToolkit& toolkit, Config::Media cfg)
    : toolkit_(toolkit), cfg_(std::move(cfg)) {}

std::expected<MediaKind, PipelineError>
MediaNormalizer::check_input(const std::string& input_path) const {
    auto kind = classify_media(input_path);
    if (kind == MediaKind::Unsupported) {
        return std::unexpected(PipelineError{
            ErrorKind::UnsupportedFormat,
            std::format("{} is neither a supported audio nor video file",
                        fs::path(input_path).filename().string())});
    }

    std::error_code ec;
    if (!fs::is_regular_file(input_path, ec)) {
        return std::unexpected(PipelineError{
            ErrorKind::UnsupportedFormat, "cannot read input file " + input_path});
    }
    return kind;
}

std::expected<NormalizedAudio, PipelineError>
MediaNormalizer::normalize(const std::string& input_path, const fs::path& work_dir,
                           std::stop_token stop) {
    auto checked = check_input(input_path);
    if (!checked) return std::unexpected(checked.error());
    auto kind = *checked;

    if (kind == MediaKind::Video) {
        auto out = work_dir / (fs::path(input_path).stem().string() + ".wav");
        return extract(input_path, out, stop);
    }

    std::error_code ec;
    auto size = fs::file_size(input_path, ec);
    uint64_t limit = static_cast<uint64_t>(cfg_.reencode_above_mb) * 1024 * 1024;
    if (!ec && cfg_.reencode_above_mb > 0 && size > limit) {
        std::println(stderr, "normalizer: large audio file ({} MB), re-encoding to {} Hz mono",
                     size / (1024 * 1024), cfg_.sample_rate);
        return extract(input_path, work_dir / "reencoded.wav", stop);
    }

    return pass_through(input_path);
}

NormalizedAudio MediaNormalizer::pass_through(const std::string& input_path) {
    NormalizedAudio audio{.path = input_path};

    if (auto info = wav::read_info(input_path); info && info->is_pcm16()) {
        audio.duration_s = info->duration_s();
        audio.sample_rate = info->sample_rate;
        return audio;
    }

    // Compressed audio: the engine decodes it later, only the length is needed now.
    auto duration = toolkit_.probe_duration(input_path);
    if (duration) {
        audio.duration_s = *duration;
    } else {
        std::println(stderr, "normalizer: could not probe duration: {}", duration.error());
    }
    return audio;
}

std::expected<NormalizedAudio, PipelineError>
MediaNormalizer::extract(const std::string& input_path, const fs::path& output,
                         std::stop_token stop) {
    std::string last_error;

    for (int attempt = 1; attempt <= kExtractionAttempts; ++attempt) {
        if (stop.stop_requested()) {
            return std::unexpected(PipelineError{ErrorKind::Cancelled, "interrupted before extraction"});
        }

        auto res = toolkit_.extract_audio(input_path, output.string(), cfg_.sample_rate, stop);
        if (res) {
            auto info = wav::read_info(output.string());
            if (info && info->is_pcm16()) {
                return NormalizedAudio{
                    .path = output.string(),
                    .duration_s = info->duration_s(),
                    .sample_rate = info->sample_rate,
                    .temporary = true,
                };
            }
            last_error = "decoder produced no readable audio";
        } else {
            last_error = res.error().message;
        }

        std::error_code ec;
        fs::remove(output, ec);

        if (!res && res.error().cancelled) {
            return std::unexpected(PipelineError{ErrorKind::Cancelled, last_error});
        }
        if (attempt < kExtractionAttempts) {
            std::println(stderr, "normalizer: extraction failed ({}), retrying", last_error);
        }
    }

    return std::unexpected(PipelineError{
        ErrorKind::ExtractionFailed,
        std::format("audio extraction from {} failed: {}",
                    fs::path(input_path).filename().string(), last_error)});
}
