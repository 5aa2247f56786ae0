#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("url")) cfg.backend.url = b["url"].get<std::string>();
            if (b.contains("api_format")) cfg.backend.api_format = b["api_format"].get<std::string>();
            if (b.contains("timeout_seconds")) cfg.backend.timeout_seconds = b["timeout_seconds"].get<uint32_t>();
            if (b.contains("parallel_requests")) cfg.backend.parallel_requests = b["parallel_requests"].get<uint32_t>();
        }

        if (j.contains("models")) {
            auto& m = j["models"];
            if (m.contains("cache_dir")) cfg.models.cache_dir = m["cache_dir"].get<std::string>();
            if (m.contains("download_url")) cfg.models.download_url = m["download_url"].get<std::string>();
        }

        if (j.contains("media")) {
            auto& m = j["media"];
            if (m.contains("ffmpeg")) cfg.media.ffmpeg = m["ffmpeg"].get<std::string>();
            if (m.contains("ffprobe")) cfg.media.ffprobe = m["ffprobe"].get<std::string>();
            if (m.contains("sample_rate")) cfg.media.sample_rate = m["sample_rate"].get<uint32_t>();
            if (m.contains("extraction_timeout_seconds"))
                cfg.media.extraction_timeout_seconds = m["extraction_timeout_seconds"].get<uint32_t>();
            if (m.contains("reencode_above_mb")) cfg.media.reencode_above_mb = m["reencode_above_mb"].get<uint32_t>();
            if (m.contains("temp_dir")) cfg.media.temp_dir = m["temp_dir"].get<std::string>();
        }

        if (j.contains("transcription")) {
            auto& t = j["transcription"];
            if (t.contains("language")) cfg.transcription.language = t["language"].get<std::string>();
            if (t.contains("model")) cfg.transcription.model = t["model"].get<std::string>();
            if (t.contains("chunk_seconds")) cfg.transcription.chunk_seconds = t["chunk_seconds"].get<uint32_t>();
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("directory")) cfg.output.directory = o["directory"].get<std::string>();
            if (o.contains("format")) cfg.output.format = o["format"].get<std::string>();
            if (o.contains("timestamps")) cfg.output.timestamps = o["timestamps"].get<bool>();
            if (o.contains("reveal")) cfg.output.reveal = o["reveal"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    // Zero would make the chunker and the worker pool spin forever.
    if (cfg.transcription.chunk_seconds == 0) cfg.transcription.chunk_seconds = 30;
    if (cfg.backend.parallel_requests == 0) cfg.backend.parallel_requests = 1;
    if (cfg.media.sample_rate == 0) cfg.media.sample_rate = 16000;

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
