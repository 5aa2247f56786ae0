#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "media/wav_codec.hpp"
#include "test_support.hpp"

#include <cstdint>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>

using Catch::Matchers::WithinAbs;

namespace {

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

void put_u32(std::vector<uint8_t>& bytes, size_t pos, uint32_t v) {
    std::memcpy(bytes.data() + pos, &v, 4);
}

void put_u16(std::vector<uint8_t>& bytes, size_t pos, uint16_t v) {
    std::memcpy(bytes.data() + pos, &v, 2);
}

std::string as_string(const std::vector<uint8_t>& bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

// Inserts a LIST chunk between "fmt " and "data", as ffmpeg does.
std::vector<uint8_t> with_list_chunk(std::vector<uint8_t> wav) {
    std::vector<uint8_t> list = {'L', 'I', 'S', 'T', 5, 0, 0, 0, 'I', 'N', 'F', 'O', 'x', 0};
    wav.insert(wav.begin() + 36, list.begin(), list.end());
    put_u32(wav, 4, read_u32(wav.data() + 4) + static_cast<uint32_t>(list.size()));
    return wav;
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    constexpr uint32_t sample_rate = 16000;
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};

    SECTION("HeaderLayout") {
        auto bytes = wav::encode(samples, sample_rate);
        REQUIRE(bytes.size() == 44 + samples.size() * 2);
        REQUIRE(as_string(bytes).substr(0, 4) == "RIFF");
        REQUIRE(as_string(bytes).substr(36, 4) == "data");
        // RIFF chunk size = file_size - 8
        REQUIRE(read_u32(bytes.data() + 4) == bytes.size() - 8);
    }

    SECTION("EmptySamples") {
        std::vector<int16_t> empty;
        auto bytes = wav::encode(empty, sample_rate);
        REQUIRE(bytes.size() == 44);
        REQUIRE(read_u32(bytes.data() + 40) == 0);
    }
}

TEST_CASE("wav::read_info", "[wav]") {
    std::vector<int16_t> samples(8000, 5);

    SECTION("CanonicalHeader") {
        std::istringstream in(as_string(wav::encode(samples, 16000)));
        auto info = wav::read_info(in);
        REQUIRE(info.has_value());
        REQUIRE(info->is_pcm16());
        REQUIRE(info->channels == 1);
        REQUIRE(info->sample_rate == 16000);
        REQUIRE(info->data_offset == 44);
        REQUIRE(info->frame_count() == 8000);
        REQUIRE_THAT(info->duration_s(), WithinAbs(0.5, 1e-9));
    }

    SECTION("UnknownChunksSkipped") {
        std::istringstream in(as_string(with_list_chunk(wav::encode(samples, 16000))));
        auto info = wav::read_info(in);
        REQUIRE(info.has_value());
        // Odd-sized chunks are padded to an even length.
        REQUIRE(info->data_offset == 44 + 14);
        REQUIRE(info->frame_count() == 8000);
    }

    SECTION("StereoFrameCount") {
        auto bytes = wav::encode(samples, 16000);
        put_u16(bytes, 22, 2);
        std::istringstream in(as_string(bytes));
        auto info = wav::read_info(in);
        REQUIRE(info.has_value());
        REQUIRE(info->frame_count() == 4000);
    }

    SECTION("NotRiff") {
        std::istringstream in("ID3\x04 definitely an mp3");
        REQUIRE_FALSE(wav::read_info(in).has_value());
    }

    SECTION("TruncatedHeader") {
        auto bytes = wav::encode(samples, 16000);
        bytes.resize(30);
        std::istringstream in(as_string(bytes));
        REQUIRE_FALSE(wav::read_info(in).has_value());
    }

    SECTION("StreamedSizeClampedToFile") {
        test::TmpDir dir;
        auto bytes = wav::encode(samples, 16000);
        put_u32(bytes, 40, 0xFFFFFFFFu);
        auto path = dir.file("streamed.wav");
        test::write_bytes(path, as_string(bytes));

        auto info = wav::read_info(path);
        REQUIRE(info.has_value());
        REQUIRE(info->data_size == samples.size() * 2);
    }
}

TEST_CASE("wav::read_pcm16_mono", "[wav]") {
    test::TmpDir dir;
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};

    SECTION("SamplesRoundTrip") {
        auto path = dir.file("a.wav");
        test::write_bytes(path, as_string(wav::encode(samples, 16000)));
        auto res = wav::read_pcm16_mono(path, 16000);
        REQUIRE(res.has_value());
        REQUIRE(*res == samples);
    }

    SECTION("SampleRateMismatch") {
        auto path = dir.file("b.wav");
        test::write_bytes(path, as_string(wav::encode(samples, 44100)));
        auto res = wav::read_pcm16_mono(path, 16000);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("44100") != std::string::npos);
    }

    SECTION("StereoRejected") {
        auto bytes = wav::encode(samples, 16000);
        put_u16(bytes, 22, 2);
        auto path = dir.file("c.wav");
        test::write_bytes(path, as_string(bytes));
        REQUIRE_FALSE(wav::read_pcm16_mono(path, 16000).has_value());
    }

    SECTION("MissingFile") {
        REQUIRE_FALSE(wav::read_pcm16_mono(dir.file("none.wav"), 16000).has_value());
    }
}
