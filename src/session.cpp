#include "session.hpp"

#include "document/time_format.hpp"
#include "media/run_workspace.hpp"
#include "whisper/catalog.hpp"

#include <format>
#include <print>
#include <stdexcept>

namespace fs = std::filesystem;

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Normalizing: return "normalizing";
        case SessionState::Transcribing: return "transcribing";
        case SessionState::Assembling: return "assembling";
        case SessionState::Done: return "done";
        case SessionState::Failed: return "failed";
        case SessionState::Cancelled: return "cancelled";
    }
    return "unknown";
}

Session::Session(MediaNormalizer& normalizer, Transcriber& transcriber,
                 DocumentAssembler& assembler, std::string temp_dir, bool verbose)
    : normalizer_(normalizer), transcriber_(transcriber), assembler_(assembler),
      temp_dir_(std::move(temp_dir)), verbose_(verbose) {}

void Session::log(std::string_view msg) const {
    if (verbose_) std::println(stderr, "[mediascribe] {}", msg);
}

void Session::transition(SessionState next) {
    log(std::format("session: {} -> {}", to_string(state_), to_string(next)));
    state_ = next;
    if (observer_) observer_(next);
}

std::unexpected<SessionFailure> Session::fail(PipelineError error) {
    SessionFailure failure{.stage = state_, .error = std::move(error)};
    finished_ = std::chrono::steady_clock::now();
    transition(failure.error.kind == ErrorKind::Cancelled ? SessionState::Cancelled
                                                          : SessionState::Failed);
    return std::unexpected(std::move(failure));
}

double Session::elapsed_seconds() const {
    if (state_ == SessionState::Idle) return 0.0;
    auto end = (state_ == SessionState::Done || state_ == SessionState::Failed ||
                state_ == SessionState::Cancelled)
                   ? finished_
                   : std::chrono::steady_clock::now();
    return std::chrono::duration<double>(end - started_).count();
}

std::expected<OutputDocument, SessionFailure>
Session::run(const TranscriptionRequest& request, const fs::path& output_dir,
             std::stop_token stop) {
    if (state_ != SessionState::Idle) {
        throw std::logic_error("session: run() called on a session that already ran");
    }

    started_ = std::chrono::steady_clock::now();
    transition(SessionState::Normalizing);

    // Rejected inputs never get a workspace.
    if (auto checked = normalizer_.check_input(request.input_path); !checked) {
        return fail(checked.error());
    }

    auto workspace = RunWorkspace::create(temp_dir_);
    if (!workspace) {
        return fail({ErrorKind::ExtractionFailed, "cannot create workspace: " + workspace.error()});
    }
    log("workspace: " + workspace->path().string());

    auto audio = normalizer_.normalize(request.input_path, workspace->path(), stop);
    if (!audio) {
        return fail(audio.error());
    }
    audio_ = *audio;
    log(std::format("audio: {} ({:.1f}s{})", audio_.path, audio_.duration_s,
                    audio_.temporary ? ", extracted" : ""));

    transition(SessionState::Transcribing);
    auto segments = transcriber_.transcribe(audio_, request.language_code, request.model_name,
                                            on_progress_, stop);
    if (!segments) {
        return fail(segments.error());
    }
    log(std::format("transcription: {} segments", segments->size()));

    // Interrupts that land after the last chunk still count: no document.
    if (stop.stop_requested()) {
        return fail({ErrorKind::Cancelled, "interrupted before writing the document"});
    }

    // The normalized audio is no longer needed.
    workspace->remove();

    transition(SessionState::Assembling);

    const LanguageInfo* lang = find_language(request.language_code);
    fs::path input(request.input_path);
    DocumentMetadata meta{
        .title = input.stem().string(),
        .file_name = input.filename().string(),
        .duration = audio_.duration_s > 0 ? format_clock(audio_.duration_s) : "unknown",
        .model = request.model_name,
        .language = lang ? std::string(lang->name) : request.language_code,
        .created = format_local_now(),
        .timestamps = timestamps_,
    };

    auto doc = assembler_.assemble(*segments, output_dir, request.input_path, meta);
    if (!doc) return fail(doc.error());

    finished_ = std::chrono::steady_clock::now();
    transition(SessionState::Done);
    log("output: " + doc->path);
    return std::move(*doc);
}
