#pragma once

#include "errors.hpp"
#include "media/media_toolkit.hpp"
#include "transcript.hpp"
#include "whisper/backend.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>

struct TranscriberOptions {
    uint32_t sample_rate = 16000;
    uint32_t chunk_seconds = 30;
    uint32_t parallel_requests = 1;
};

// Runs a recognition backend over normalized audio, one window at a time,
// and reports progress after every window in order.
class Transcriber {
public:
    using ProgressCallback = std::function<void(const TranscriptionProgress&)>;

    Transcriber(WhisperBackend& backend, MediaToolkit& toolkit, TranscriberOptions opts);

    // Progress is non-decreasing and ends with exactly one 1.0 on success.
    // Nothing is reported after a failure or cancellation.
    std::expected<std::vector<TranscriptSegment>, PipelineError>
        transcribe(const NormalizedAudio& audio, const std::string& language,
                   const std::string& model_name, const ProgressCallback& on_progress,
                   std::stop_token stop = {});

    // Orders segments by start time, drops blank ones, merges equal starts and
    // truncates overlaps so starts strictly increase and spans never overlap.
    static std::vector<TranscriptSegment> sequence_segments(std::vector<TranscriptSegment> segments);

    // Language reported by the server for the first chunk of the last run.
    // Empty when the server does not report one.
    const std::string& detected_language() const { return detected_language_; }

private:
    std::expected<std::vector<int16_t>, PipelineError>
        load_samples(const NormalizedAudio& audio, std::stop_token stop);

    WhisperBackend& backend_;
    MediaToolkit& toolkit_;
    TranscriberOptions opts_;
    std::string detected_language_;
};
