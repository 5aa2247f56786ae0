#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Built once by the CLI layer from the user's selections.
struct TranscriptionRequest {
    std::string input_path;
    std::string language_code;  // e.g. "nl"
    std::string model_name;     // e.g. "medium"
};

struct NormalizedAudio {
    std::string path;
    double duration_s = 0.0;    // 0 when unknown
    uint32_t sample_rate = 0;   // 0 when unknown (compressed pass-through)
    bool temporary = false;     // lives inside the run workspace
};

struct TranscriptSegment {
    double start_s = 0.0;
    double end_s = 0.0;
    std::string text;
    std::optional<double> confidence;
};

struct TranscriptionProgress {
    double fraction_complete = 0.0;
    double segment_end_s = 0.0;
};

struct OutputDocument {
    std::string path;
    std::vector<TranscriptSegment> segments;
};
