#include "media/ffmpeg_toolkit.hpp"

#include "platform/process.hpp"

#include <cctype>
#include <charconv>
#include <cstring>
#include <format>

namespace {

ToolFailure describe_failure(const std::string& tool, const platform::ProcessResult& r,
                             uint32_t timeout_s) {
    if (r.cancelled) return {.cancelled = true, .message = tool + " interrupted"};
    if (r.timed_out) return {.cancelled = false, .message = std::format("{} timed out after {}s", tool, timeout_s)};
    if (r.exit_code == 127) return {.cancelled = false, .message = tool + " not found on PATH"};
    if (r.exit_code < 0) return {.cancelled = false, .message = tool + " was killed by a signal"};
    return {.cancelled = false, .message = std::format("{} exited with code {}", tool, r.exit_code)};
}

} // namespace

FfmpegToolkit::FfmpegToolkit(Config::Media cfg)
    : cfg_(std::move(cfg)) {}

std::expected<double, std::string> FfmpegToolkit::probe_duration(const std::string& path) {
    auto res = platform::run_process(
        {cfg_.ffprobe, "-v", "quiet", "-show_entries", "format=duration",
         "-of", "csv=p=0", path},
        {.timeout = std::chrono::seconds(30), .capture_stdout = true});
    if (!res) return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected(describe_failure(cfg_.ffprobe, *res, 30).message);
    }

    const auto& out = res->output;
    auto begin = out.data();
    while (begin < out.data() + out.size() && std::isspace(static_cast<unsigned char>(*begin))) ++begin;

    double duration = 0.0;
    auto [ptr, ec] = std::from_chars(begin, out.data() + out.size(), duration);
    if (ec != std::errc{} || duration < 0.0) {
        return std::unexpected("unparsable ffprobe duration: " + out);
    }
    return duration;
}

std::expected<void, ToolFailure>
FfmpegToolkit::extract_audio(const std::string& input, const std::string& output,
                             uint32_t sample_rate, std::stop_token stop) {
    auto res = platform::run_process(
        {cfg_.ffmpeg, "-nostdin", "-hide_banner", "-loglevel", "error",
         "-i", input, "-vn", "-acodec", "pcm_s16le",
         "-ar", std::to_string(sample_rate), "-ac", "1", "-y", output},
        {.timeout = std::chrono::seconds(cfg_.extraction_timeout_seconds),
         .capture_stdout = false,
         .stop = stop});
    if (!res) return std::unexpected(ToolFailure{.cancelled = false, .message = res.error()});
    if (res->exit_code != 0) {
        return std::unexpected(describe_failure(cfg_.ffmpeg, *res, cfg_.extraction_timeout_seconds));
    }
    return {};
}

std::expected<std::vector<int16_t>, ToolFailure>
FfmpegToolkit::decode_pcm(const std::string& input, uint32_t sample_rate, std::stop_token stop) {
    auto res = platform::run_process(
        {cfg_.ffmpeg, "-nostdin", "-hide_banner", "-loglevel", "error",
         "-i", input, "-vn", "-f", "s16le", "-acodec", "pcm_s16le",
         "-ar", std::to_string(sample_rate), "-ac", "1", "-"},
        {.timeout = std::chrono::seconds(cfg_.extraction_timeout_seconds),
         .capture_stdout = true,
         .stop = stop});
    if (!res) return std::unexpected(ToolFailure{.cancelled = false, .message = res.error()});
    if (res->exit_code != 0) {
        return std::unexpected(describe_failure(cfg_.ffmpeg, *res, cfg_.extraction_timeout_seconds));
    }

    std::vector<int16_t> samples(res->output.size() / sizeof(int16_t));
    if (!samples.empty()) {
        std::memcpy(samples.data(), res->output.data(), samples.size() * sizeof(int16_t));
    }
    return samples;
}
