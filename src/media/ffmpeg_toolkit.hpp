#pragma once

#include "config.hpp"
#include "media/media_toolkit.hpp"

class FfmpegToolkit : public MediaToolkit {
public:
    explicit FfmpegToolkit(Config::Media cfg);

    std::expected<double, std::string> probe_duration(const std::string& path) override;

    std::expected<void, ToolFailure>
        extract_audio(const std::string& input, const std::string& output,
                      uint32_t sample_rate, std::stop_token stop) override;

    std::expected<std::vector<int16_t>, ToolFailure>
        decode_pcm(const std::string& input, uint32_t sample_rate, std::stop_token stop) override;

private:
    Config::Media cfg_;
};
