#include "whisper/transcriber.hpp"

#include "media/wav_codec.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <span>
#include <thread>

namespace {

using ChunkResult = std::expected<ChunkTranscript, std::string>;

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\n\r") == std::string::npos;
}

} // namespace

Transcriber::Transcriber(WhisperBackend& backend, MediaToolkit& toolkit, TranscriberOptions opts)
    : backend_(backend), toolkit_(toolkit), opts_(opts) {
    if (opts_.chunk_seconds == 0) opts_.chunk_seconds = 30;
    if (opts_.parallel_requests == 0) opts_.parallel_requests = 1;
    if (opts_.sample_rate == 0) opts_.sample_rate = 16000;
}

std::expected<std::vector<TranscriptSegment>, PipelineError>
Transcriber::transcribe(const NormalizedAudio& audio, const std::string& language,
                        const std::string& model_name, const ProgressCallback& on_progress,
                        std::stop_token stop) {
    detected_language_.clear();
    if (stop.stop_requested()) {
        return std::unexpected(PipelineError{ErrorKind::Cancelled, "interrupted before model load"});
    }

    if (auto loaded = backend_.load_model(model_name); !loaded) {
        return std::unexpected(PipelineError{
            ErrorKind::ModelLoadFailed,
            loaded.error() + " (check network connectivity and the model cache)"});
    }

    auto loaded_samples = load_samples(audio, stop);
    if (!loaded_samples) return std::unexpected(loaded_samples.error());
    const std::vector<int16_t> samples = std::move(*loaded_samples);

    const uint32_t rate = opts_.sample_rate;
    const size_t total = samples.size();
    const size_t chunk_len = static_cast<size_t>(opts_.chunk_seconds) * rate;
    const size_t n_chunks = (total + chunk_len - 1) / chunk_len;

    if (n_chunks == 0) {
        if (on_progress) on_progress({.fraction_complete = 1.0, .segment_end_s = 0.0});
        return std::vector<TranscriptSegment>{};
    }

    std::vector<std::optional<ChunkResult>> results(n_chunks);
    std::mutex mu;
    std::condition_variable cv;
    std::atomic<size_t> next_chunk{0};
    std::atomic<bool> abort{false};
    size_t workers_done = 0;
    const size_t n_workers = std::min<size_t>(opts_.parallel_requests, n_chunks);

    std::vector<std::jthread> workers;
    workers.reserve(n_workers);
    for (size_t w = 0; w < n_workers; ++w) {
        workers.emplace_back([&] {
            while (!abort.load(std::memory_order_acquire) && !stop.stop_requested()) {
                size_t i = next_chunk.fetch_add(1);
                if (i >= n_chunks) break;

                size_t begin = i * chunk_len;
                size_t len = std::min(chunk_len, total - begin);
                auto r = backend_.transcribe(std::span(samples).subspan(begin, len), rate, language);
                if (!r) abort.store(true, std::memory_order_release);
                {
                    std::lock_guard lock(mu);
                    results[i] = std::move(r);
                }
                cv.notify_all();
            }
            {
                std::lock_guard lock(mu);
                ++workers_done;
            }
            cv.notify_all();
        });
    }

    std::vector<TranscriptSegment> collected;
    std::optional<PipelineError> failure;
    double last_end = 0.0;

    for (size_t emitted = 0; emitted < n_chunks; ++emitted) {
        std::unique_lock lock(mu);
        cv.wait(lock, [&] { return results[emitted].has_value() || workers_done == n_workers; });
        if (!results[emitted]) {
            failure = PipelineError{ErrorKind::Cancelled, "interrupted during transcription"};
            break;
        }
        ChunkResult r = std::move(*results[emitted]);
        lock.unlock();

        if (!r) {
            failure = PipelineError{ErrorKind::InferenceFailed, r.error()};
            break;
        }

        double offset = static_cast<double>(emitted * chunk_len) / rate;
        double limit = static_cast<double>(std::min(total, (emitted + 1) * chunk_len)) / rate;
        if (detected_language_.empty()) detected_language_ = r->language;
        for (auto& seg : r->segments) {
            seg.start_s = std::clamp(seg.start_s + offset, offset, limit);
            seg.end_s = std::clamp(seg.end_s + offset, seg.start_s, limit);
            last_end = std::max(last_end, seg.end_s);
            collected.push_back(std::move(seg));
        }

        bool last = emitted + 1 == n_chunks;
        if (stop.stop_requested()) {
            failure = PipelineError{ErrorKind::Cancelled, "interrupted during transcription"};
            break;
        }

        size_t processed = std::min(total, (emitted + 1) * chunk_len);
        double fraction = last ? 1.0 : static_cast<double>(processed) / static_cast<double>(total);
        if (on_progress) on_progress({.fraction_complete = fraction, .segment_end_s = last_end});
    }

    abort.store(true, std::memory_order_release);
    workers.clear();

    if (failure) return std::unexpected(*failure);
    return sequence_segments(std::move(collected));
}

std::expected<std::vector<int16_t>, PipelineError>
Transcriber::load_samples(const NormalizedAudio& audio, std::stop_token stop) {
    auto info = wav::read_info(audio.path);
    if (info && info->is_pcm16() && info->channels == 1 && info->sample_rate == opts_.sample_rate) {
        auto samples = wav::read_pcm16_mono(audio.path, opts_.sample_rate);
        if (!samples) {
            return std::unexpected(PipelineError{ErrorKind::InferenceFailed, samples.error()});
        }
        return std::move(*samples);
    }

    auto decoded = toolkit_.decode_pcm(audio.path, opts_.sample_rate, stop);
    if (!decoded) {
        if (decoded.error().cancelled) {
            return std::unexpected(PipelineError{ErrorKind::Cancelled, decoded.error().message});
        }
        return std::unexpected(PipelineError{
            ErrorKind::InferenceFailed, "cannot decode audio: " + decoded.error().message});
    }
    return std::move(*decoded);
}

std::vector<TranscriptSegment> Transcriber::sequence_segments(std::vector<TranscriptSegment> segments) {
    std::erase_if(segments, [](const TranscriptSegment& s) { return is_blank(s.text); });
    std::stable_sort(segments.begin(), segments.end(),
                     [](const TranscriptSegment& a, const TranscriptSegment& b) {
                         return a.start_s < b.start_s;
                     });

    std::vector<TranscriptSegment> out;
    out.reserve(segments.size());
    for (auto& seg : segments) {
        seg.end_s = std::max(seg.end_s, seg.start_s);

        if (!out.empty()) {
            auto& prev = out.back();
            if (seg.start_s <= prev.start_s) {
                prev.text += " " + seg.text;
                prev.end_s = std::max(prev.end_s, seg.end_s);
                if (prev.confidence && seg.confidence) {
                    prev.confidence = std::min(*prev.confidence, *seg.confidence);
                }
                continue;
            }
            if (prev.end_s > seg.start_s) prev.end_s = seg.start_s;
        }
        out.push_back(std::move(seg));
    }
    return out;
}
