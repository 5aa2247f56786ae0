#include "whisper/lan_backend.hpp"

#include "media/wav_codec.hpp"

#include <cmath>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static std::string trim(const std::string& s) {
    auto start_pos = s.find_first_not_of(" \t\n\r");
    if (start_pos == std::string::npos) return {};
    auto end_pos = s.find_last_not_of(" \t\n\r");
    return s.substr(start_pos, end_pos - start_pos + 1);
}

static std::string available_models() {
    std::string names;
    for (const auto& m : model_catalog()) {
        if (!names.empty()) names += ", ";
        names += m.name;
    }
    return names;
}

LanBackend::LanBackend(std::string url, std::string api_format, long timeout_s,
                       ModelCache& models)
    : url_(std::move(url)), api_format_(std::move(api_format)),
      timeout_s_(timeout_s), models_(models) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanBackend::~LanBackend() {
    curl_global_cleanup();
}

std::expected<void, std::string> LanBackend::load_model(std::string_view model_name) {
    const ModelInfo* info = find_model(model_name);
    if (!info) {
        return std::unexpected("unknown model '" + std::string(model_name) +
                               "' (available: " + available_models() + ")");
    }

    // OpenAI-style servers resolve the model per request.
    if (api_format_ == "openai") {
        model_name_ = std::string(info->name);
        return {};
    }

    auto path = models_.ensure(*info, download_progress_);
    if (!path) return std::unexpected(path.error());

    auto res = post_load(*path);
    if (!res) return res;

    model_name_ = std::string(info->name);
    return {};
}

std::expected<void, std::string> LanBackend::post_load(const std::string& model_path) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "model");
    curl_mime_data(part, model_path.c_str(), CURL_ZERO_TERMINATED);

    std::string endpoint = url_ + "/load";
    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (status >= 400) {
        return std::unexpected("server refused model " + model_path + ": " + trim(response_body));
    }
    return {};
}

std::expected<ChunkTranscript, std::string>
LanBackend::transcribe(std::span<const int16_t> audio, uint32_t sample_rate,
                       const std::string& language) {
    if (audio.empty()) {
        return ChunkTranscript{};
    }

    double duration_s = static_cast<double>(audio.size()) / sample_rate;

    // Encode to WAV
    auto wav_data = wav::encode(audio, sample_rate);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    // Build URL and form based on API format
    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    if (api_format_ == "openai") {
        endpoint = url_ + "/v1/audio/transcriptions";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "model");
        curl_mime_data(part, model_name_.c_str(), CURL_ZERO_TERMINATED);
    } else {
        // whisper.cpp server format
        endpoint = url_ + "/inference";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "temperature");
        curl_mime_data(part, "0.0", CURL_ZERO_TERMINATED);
    }

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "response_format");
    curl_mime_data(part, "verbose_json", CURL_ZERO_TERMINATED);

    if (!language.empty()) {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "language");
        curl_mime_data(part, language.c_str(), CURL_ZERO_TERMINATED);
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (status >= 400 && response_body.empty()) {
        return std::unexpected("server returned HTTP " + std::to_string(status));
    }

    return parse_response(response_body, duration_s);
}

std::expected<ChunkTranscript, std::string>
LanBackend::parse_response(const std::string& body, double audio_duration_s) {
    try {
        auto j = json::parse(body);

        if (j.contains("error")) {
            auto& err = j["error"];
            if (err.is_string()) return std::unexpected("server error: " + err.get<std::string>());
            return std::unexpected("server error: " + err.value("message", err.dump()));
        }

        ChunkTranscript chunk;
        if (j.contains("language") && j["language"].is_string()) {
            chunk.language = j["language"].get<std::string>();
        }

        if (j.contains("segments") && j["segments"].is_array()) {
            for (auto& s : j["segments"]) {
                TranscriptSegment seg{
                    .start_s = s.value("start", 0.0),
                    .end_s = s.value("end", 0.0),
                    .text = trim(s.value("text", std::string{})),
                    .confidence = std::nullopt,
                };
                if (s.contains("avg_logprob") && s["avg_logprob"].is_number()) {
                    seg.confidence = std::exp(s["avg_logprob"].get<double>());
                }
                chunk.segments.push_back(std::move(seg));
            }
            return chunk;
        }

        // Plain json responses carry no timing: one segment spanning the audio.
        if (j.contains("text")) {
            auto text = trim(j["text"].get<std::string>());
            if (!text.empty()) {
                chunk.segments.push_back(TranscriptSegment{
                    .start_s = 0.0, .end_s = audio_duration_s,
                    .text = std::move(text), .confidence = std::nullopt});
            }
            return chunk;
        }

        return std::unexpected("unexpected response: " + body);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
