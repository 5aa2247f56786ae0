#pragma once

#include "whisper/backend.hpp"
#include "whisper/model_cache.hpp"

#include <string>

// Talks to a whisper.cpp server (or an OpenAI-compatible endpoint) over HTTP.
class LanBackend : public WhisperBackend {
public:
    // api_format: "whisper.cpp" or "openai"
    LanBackend(std::string url, std::string api_format, long timeout_s,
               ModelCache& models);
    ~LanBackend() override;

    void set_download_progress(ModelCache::DownloadProgress progress) {
        download_progress_ = std::move(progress);
    }

    std::expected<void, std::string> load_model(std::string_view model_name) override;

    std::expected<ChunkTranscript, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate,
                   const std::string& language) override;

    // Parses a verbose_json (or plain json) transcription response.
    static std::expected<ChunkTranscript, std::string>
        parse_response(const std::string& body, double audio_duration_s);

private:
    std::expected<void, std::string> post_load(const std::string& model_path);

    std::string url_;
    std::string api_format_;
    long timeout_s_;
    ModelCache& models_;
    ModelCache::DownloadProgress download_progress_;
    std::string model_name_;
};
