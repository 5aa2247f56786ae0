#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <expected>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <vector>

// RIFF/WAVE encoding and decoding for 16-bit PCM.
namespace wav {

struct Info {
    uint16_t format = 0;          // 1 = PCM
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    uint64_t data_offset = 0;
    uint32_t data_size = 0;

    bool is_pcm16() const { return format == 1 && bits_per_sample == 16; }

    uint64_t frame_count() const {
        uint32_t block = static_cast<uint32_t>(channels) * bits_per_sample / 8;
        return block ? data_size / block : 0;
    }

    double duration_s() const {
        return sample_rate ? static_cast<double>(frame_count()) / sample_rate : 0.0;
    }
};

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size) std::memcpy(out.data() + 44, samples.data(), data_size);

    return out;
}

// Walks the chunk list up to the "data" chunk. Unknown chunks are skipped.
inline std::optional<Info> read_info(std::istream& in) {
    char tag[4];
    uint32_t size = 0;
    auto read_tag = [&]() { return static_cast<bool>(in.read(tag, 4)); };
    auto read32 = [&](uint32_t& v) { return static_cast<bool>(in.read(reinterpret_cast<char*>(&v), 4)); };
    auto read16 = [&](uint16_t& v) { return static_cast<bool>(in.read(reinterpret_cast<char*>(&v), 2)); };

    if (!read_tag() || std::memcmp(tag, "RIFF", 4) != 0) return std::nullopt;
    if (!read32(size)) return std::nullopt;
    if (!read_tag() || std::memcmp(tag, "WAVE", 4) != 0) return std::nullopt;

    Info info;
    bool have_fmt = false;
    while (read_tag() && read32(size)) {
        if (std::memcmp(tag, "fmt ", 4) == 0) {
            uint32_t byte_rate;
            uint16_t block_align;
            if (size < 16) return std::nullopt;
            if (!read16(info.format) || !read16(info.channels) || !read32(info.sample_rate) ||
                !read32(byte_rate) || !read16(block_align) || !read16(info.bits_per_sample)) {
                return std::nullopt;
            }
            in.seekg(size - 16 + (size & 1), std::ios::cur);
            have_fmt = true;
        } else if (std::memcmp(tag, "data", 4) == 0) {
            if (!have_fmt) return std::nullopt;
            info.data_offset = static_cast<uint64_t>(in.tellg());
            info.data_size = size;
            return info;
        } else {
            in.seekg(size + (size & 1), std::ios::cur);
        }
    }
    return std::nullopt;
}

inline std::optional<Info> read_info(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return std::nullopt;
    auto info = read_info(f);
    if (!info) return info;

    // Clamp a streamed (unpatched) data size to what is actually on disk.
    f.clear();
    f.seekg(0, std::ios::end);
    auto file_end = static_cast<uint64_t>(f.tellg());
    if (info->data_offset + info->data_size > file_end) {
        info->data_size = static_cast<uint32_t>(file_end - info->data_offset);
    }
    return info;
}

// Loads a 16-bit PCM mono file. Other layouts are rejected; callers decode
// those through ffmpeg instead.
inline std::expected<std::vector<int16_t>, std::string>
read_pcm16_mono(const std::string& path, uint32_t expected_rate) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return std::unexpected("cannot open " + path);

    auto info = read_info(f);
    if (!info) return std::unexpected("not a RIFF/WAVE file: " + path);
    if (!info->is_pcm16() || info->channels != 1) {
        return std::unexpected("not 16-bit mono PCM: " + path);
    }
    if (info->sample_rate != expected_rate) {
        return std::unexpected("sample rate " + std::to_string(info->sample_rate) +
                               " != " + std::to_string(expected_rate));
    }

    // ffmpeg writes 0xFFFFFFFF as data size when streaming to a pipe.
    f.seekg(0, std::ios::end);
    uint64_t file_end = static_cast<uint64_t>(f.tellg());
    uint64_t data_size = std::min<uint64_t>(info->data_size, file_end - info->data_offset);

    std::vector<int16_t> samples(data_size / sizeof(int16_t));
    f.seekg(static_cast<std::streamoff>(info->data_offset));
    f.read(reinterpret_cast<char*>(samples.data()),
           static_cast<std::streamsize>(samples.size() * sizeof(int16_t)));
    if (!f) return std::unexpected("truncated data chunk: " + path);
    return samples;
}

} // namespace wav
