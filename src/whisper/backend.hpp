#pragma once

#include "transcript.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct ChunkTranscript {
    std::vector<TranscriptSegment> segments;
    std::string language;       // detected language code, empty if not reported
};

class WhisperBackend {
public:
    virtual ~WhisperBackend() = default;

    virtual std::expected<void, std::string> load_model(std::string_view model_name) = 0;

    // Segment times are relative to the start of audio. Must be safe to call
    // from several threads at once after load_model() succeeded.
    virtual std::expected<ChunkTranscript, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate,
                   const std::string& language) = 0;
};
