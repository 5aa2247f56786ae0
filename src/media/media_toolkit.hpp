#pragma once

#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>
#include <vector>

struct ToolFailure {
    bool cancelled = false;
    std::string message;
};

// External audio/video tooling. The pipeline only talks to this interface.
class MediaToolkit {
public:
    virtual ~MediaToolkit() = default;

    // Container duration in seconds.
    virtual std::expected<double, std::string> probe_duration(const std::string& path) = 0;

    // Writes the first audio track of input as a mono 16-bit PCM WAV file.
    virtual std::expected<void, ToolFailure>
        extract_audio(const std::string& input, const std::string& output,
                      uint32_t sample_rate, std::stop_token stop) = 0;

    // Decodes input to mono 16-bit PCM samples in memory.
    virtual std::expected<std::vector<int16_t>, ToolFailure>
        decode_pcm(const std::string& input, uint32_t sample_rate, std::stop_token stop) = 0;
};
