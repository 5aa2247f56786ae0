#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "media/normalizer.hpp"
#include "test_support.hpp"

#include <filesystem>

using Catch::Matchers::WithinAbs;
namespace fs = std::filesystem;

TEST_CASE("MediaNormalizer", "[normalizer]") {
    test::TmpDir input_dir;
    test::TmpDir work_dir;
    test::MockToolkit toolkit;
    Config::Media cfg;
    MediaNormalizer normalizer(toolkit, cfg);

    SECTION("WavPassesThroughWithoutDecoder") {
        auto path = input_dir.file("memo.wav");
        test::write_wav(path, 3.0, 16000);

        auto res = normalizer.normalize(path, work_dir.path);
        REQUIRE(res.has_value());
        REQUIRE(res->path == path);
        REQUIRE_FALSE(res->temporary);
        REQUIRE_THAT(res->duration_s, WithinAbs(3.0, 1.0 / 16000));
        REQUIRE(toolkit.extract_calls == 0);
        REQUIRE(toolkit.decode_calls == 0);
        REQUIRE(work_dir.entry_count() == 0);
    }

    SECTION("CompressedAudioProbedNotDecoded") {
        auto path = input_dir.file("podcast.mp3");
        test::write_bytes(path, "ID3 not really an mp3");

        auto res = normalizer.normalize(path, work_dir.path);
        REQUIRE(res.has_value());
        REQUIRE(res->path == path);
        REQUIRE(res->duration_s == 42.0);
        REQUIRE(toolkit.probe_calls == 1);
        REQUIRE(toolkit.extract_calls == 0);
        REQUIRE(toolkit.decode_calls == 0);
    }

    SECTION("ProbeFailureLeavesDurationUnknown") {
        toolkit.probe_fails = true;
        auto path = input_dir.file("podcast.ogg");
        test::write_bytes(path, "OggS");

        auto res = normalizer.normalize(path, work_dir.path);
        REQUIRE(res.has_value());
        REQUIRE(res->duration_s == 0.0);
    }

    SECTION("VideoAudioExtracted") {
        auto path = input_dir.file("lecture.mp4");
        test::write_bytes(path, "not really a video");

        auto res = normalizer.normalize(path, work_dir.path);
        REQUIRE(res.has_value());
        REQUIRE(res->temporary);
        REQUIRE(fs::path(res->path).parent_path() == work_dir.path);
        REQUIRE(fs::path(res->path).extension() == ".wav");
        REQUIRE_THAT(res->duration_s, WithinAbs(toolkit.extracted_seconds, 1.0 / cfg.sample_rate));
        REQUIRE(res->sample_rate == cfg.sample_rate);
        REQUIRE(toolkit.extract_calls == 1);
    }

    SECTION("UppercaseExtensionRecognized") {
        auto path = input_dir.file("CLIP.MOV");
        test::write_bytes(path, "x");
        auto res = normalizer.normalize(path, work_dir.path);
        REQUIRE(res.has_value());
        REQUIRE(res->temporary);
    }

    SECTION("TextFileUnsupported") {
        auto path = input_dir.file("notes.txt");
        test::write_bytes(path, "meeting notes");

        auto res = normalizer.normalize(path, work_dir.path);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::UnsupportedFormat);
        REQUIRE(toolkit.extract_calls == 0);
        REQUIRE(toolkit.probe_calls == 0);
        REQUIRE(work_dir.entry_count() == 0);
    }

    SECTION("MissingFileUnsupported") {
        auto res = normalizer.normalize(input_dir.file("gone.mp3"), work_dir.path);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::UnsupportedFormat);
    }

    SECTION("CheckInputTouchesNothing") {
        auto video = input_dir.file("lecture.webm");
        test::write_bytes(video, "x");
        auto text = input_dir.file("notes.txt");
        test::write_bytes(text, "meeting notes");

        REQUIRE(normalizer.check_input(video) == MediaKind::Video);
        REQUIRE(normalizer.check_input(text).error().kind == ErrorKind::UnsupportedFormat);
        REQUIRE(normalizer.check_input(input_dir.file("gone.mp3")).error().kind ==
                ErrorKind::UnsupportedFormat);
        REQUIRE(toolkit.probe_calls == 0);
        REQUIRE(toolkit.extract_calls == 0);
    }

    SECTION("ExtractionRetriedOnce") {
        toolkit.extract_failures = 1;
        auto path = input_dir.file("lecture.mkv");
        test::write_bytes(path, "x");

        auto res = normalizer.normalize(path, work_dir.path);
        REQUIRE(res.has_value());
        REQUIRE(toolkit.extract_calls == 2);
    }

    SECTION("ExtractionFailureSurfaced") {
        toolkit.extract_failures = 5;
        auto path = input_dir.file("lecture.mp4");
        test::write_bytes(path, "x");

        auto res = normalizer.normalize(path, work_dir.path);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::ExtractionFailed);
        REQUIRE(res.error().message.find("lecture.mp4") != std::string::npos);
        REQUIRE(toolkit.extract_calls == 2);
        REQUIRE(work_dir.entry_count() == 0);
    }

    SECTION("InterruptedExtractionCancelled") {
        toolkit.extract_cancels = true;
        auto path = input_dir.file("lecture.mp4");
        test::write_bytes(path, "x");

        auto res = normalizer.normalize(path, work_dir.path);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::Cancelled);
        REQUIRE(toolkit.extract_calls == 1);
        REQUIRE(work_dir.entry_count() == 0);
    }

    SECTION("OversizedAudioReencoded") {
        Config::Media small = cfg;
        small.reencode_above_mb = 1;
        MediaNormalizer strict(toolkit, small);

        auto path = input_dir.file("long.flac");
        test::write_bytes(path, std::string(2 * 1024 * 1024, 'f'));

        auto res = strict.normalize(path, work_dir.path);
        REQUIRE(res.has_value());
        REQUIRE(res->temporary);
        REQUIRE(toolkit.extract_calls == 1);
    }
}
