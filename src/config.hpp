#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Backend {
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        uint32_t timeout_seconds = 600;
        uint32_t parallel_requests = 1;
    } backend;

    struct Models {
        std::string cache_dir;  // empty: platform cache dir
        std::string download_url = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main";
    } models;

    struct Media {
        std::string ffmpeg = "ffmpeg";
        std::string ffprobe = "ffprobe";
        uint32_t sample_rate = 16000;
        uint32_t extraction_timeout_seconds = 3600;
        uint32_t reencode_above_mb = 500;
        std::string temp_dir;   // empty: system temp dir
    } media;

    struct Transcription {
        std::string language = "nl";
        std::string model = "medium";
        uint32_t chunk_seconds = 30;
    } transcription;

    struct Output {
        std::string directory;  // empty: downloads dir
        std::string format = "docx";
        bool timestamps = true;
        bool reveal = true;
    } output;

    static Config load(const std::string& path);
    static Config load_default();
};
