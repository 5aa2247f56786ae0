#pragma once

#include "document/assembler.hpp"
#include "errors.hpp"
#include "media/normalizer.hpp"
#include "transcript.hpp"
#include "whisper/transcriber.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>

enum class SessionState { Idle, Normalizing, Transcribing, Assembling, Done, Failed, Cancelled };

std::string_view to_string(SessionState state);

struct SessionFailure {
    SessionState stage;     // the state the run was in when it stopped
    PipelineError error;
};

// Drives one request through normalize -> transcribe -> assemble. Owns the
// run's temporary workspace and removes it on every exit path.
class Session {
public:
    using StateObserver = std::function<void(SessionState)>;

    Session(MediaNormalizer& normalizer, Transcriber& transcriber, DocumentAssembler& assembler,
            std::string temp_dir, bool verbose = false);

    void set_state_observer(StateObserver observer) { observer_ = std::move(observer); }
    void set_progress_callback(Transcriber::ProgressCallback cb) { on_progress_ = std::move(cb); }
    void set_timestamps(bool enabled) { timestamps_ = enabled; }

    // A session runs one request. Calling run() again throws std::logic_error.
    std::expected<OutputDocument, SessionFailure>
        run(const TranscriptionRequest& request, const std::filesystem::path& output_dir,
            std::stop_token stop = {});

    SessionState state() const { return state_; }
    const NormalizedAudio& audio() const { return audio_; }
    double elapsed_seconds() const;

private:
    void transition(SessionState next);
    std::unexpected<SessionFailure> fail(PipelineError error);
    void log(std::string_view msg) const;

    MediaNormalizer& normalizer_;
    Transcriber& transcriber_;
    DocumentAssembler& assembler_;
    std::string temp_dir_;
    bool verbose_;
    bool timestamps_ = true;

    StateObserver observer_;
    Transcriber::ProgressCallback on_progress_;

    SessionState state_ = SessionState::Idle;
    NormalizedAudio audio_;
    std::chrono::steady_clock::time_point started_;
    std::chrono::steady_clock::time_point finished_;
};
