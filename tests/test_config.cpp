#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "ms_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        if (fd >= 0) {
            auto written = ::write(fd, content.data(), content.size());
            (void)written;
            ::close(fd);
        }
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.backend.url == "http://localhost:8080");
        REQUIRE(cfg.backend.api_format == "whisper.cpp");
        REQUIRE(cfg.backend.parallel_requests == 1);
        REQUIRE(cfg.transcription.language == "nl");
        REQUIRE(cfg.transcription.model == "medium");
        REQUIRE(cfg.transcription.chunk_seconds == 30);
        REQUIRE(cfg.media.sample_rate == 16000);
        REQUIRE(cfg.media.reencode_above_mb == 500);
        REQUIRE(cfg.output.format == "docx");
        REQUIRE(cfg.output.timestamps);
        REQUIRE(cfg.models.cache_dir.empty());
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "backend": {
                "url": "http://10.0.0.1:9090",
                "api_format": "openai",
                "timeout_seconds": 120,
                "parallel_requests": 3
            },
            "models": { "cache_dir": "/srv/models", "download_url": "http://mirror.lan/whisper" },
            "media": { "ffmpeg": "/opt/ffmpeg/bin/ffmpeg", "sample_rate": 8000, "temp_dir": "/scratch" },
            "transcription": { "language": "de", "model": "small", "chunk_seconds": 60 },
            "output": { "directory": "/home/u/transcripts", "format": "srt",
                        "timestamps": false, "reveal": false }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.url == "http://10.0.0.1:9090");
        REQUIRE(cfg.backend.api_format == "openai");
        REQUIRE(cfg.backend.timeout_seconds == 120);
        REQUIRE(cfg.backend.parallel_requests == 3);
        REQUIRE(cfg.models.cache_dir == "/srv/models");
        REQUIRE(cfg.models.download_url == "http://mirror.lan/whisper");
        REQUIRE(cfg.media.ffmpeg == "/opt/ffmpeg/bin/ffmpeg");
        REQUIRE(cfg.media.ffprobe == "ffprobe");
        REQUIRE(cfg.media.sample_rate == 8000);
        REQUIRE(cfg.media.temp_dir == "/scratch");
        REQUIRE(cfg.transcription.language == "de");
        REQUIRE(cfg.transcription.model == "small");
        REQUIRE(cfg.transcription.chunk_seconds == 60);
        REQUIRE(cfg.output.directory == "/home/u/transcripts");
        REQUIRE(cfg.output.format == "srt");
        REQUIRE_FALSE(cfg.output.timestamps);
        REQUIRE_FALSE(cfg.output.reveal);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "transcription": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.transcription.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.transcription.model == "medium");
        REQUIRE(cfg.backend.url == "http://localhost:8080");
        REQUIRE(cfg.output.format == "docx");
    }

    SECTION("ZeroValuesReset") {
        TmpFile f(R"({ "transcription": { "chunk_seconds": 0 }, "backend": { "parallel_requests": 0 },
                       "media": { "sample_rate": 0 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.transcription.chunk_seconds == 30);
        REQUIRE(cfg.backend.parallel_requests == 1);
        REQUIRE(cfg.media.sample_rate == 16000);
    }

    SECTION("WrongValueTypeFallsBack") {
        TmpFile f(R"({ "output": { "timestamps": "yes" }, "transcription": { "model": "tiny" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.output.timestamps);
        REQUIRE(cfg.transcription.model == "medium");
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.transcription.language == "nl");
        REQUIRE(cfg.media.sample_rate == 16000);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/ms_test_nonexistent_config_file.json");
        REQUIRE(cfg.backend.url == "http://localhost:8080");
        REQUIRE(cfg.media.sample_rate == 16000);
    }
}
