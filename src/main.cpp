#include "cli/prompt.hpp"
#include "config.hpp"
#include "document/assembler.hpp"
#include "document/time_format.hpp"
#include "media/ffmpeg_toolkit.hpp"
#include "media/normalizer.hpp"
#include "platform/desktop.hpp"
#include "platform/linux/signal_watcher.hpp"
#include "platform/platform_paths.hpp"
#include "progress/progress_reporter.hpp"
#include "session.hpp"
#include "storage/history_db.hpp"
#include "whisper/catalog.hpp"
#include "whisper/lan_backend.hpp"
#include "whisper/model_cache.hpp"
#include "whisper/transcriber.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

struct Options {
    std::string input;
    std::string language;
    std::string model;
    std::string output_dir;
    std::string format;
    std::string config_path;
    bool no_timestamps = false;
    bool no_reveal = false;
    bool verbose = false;
    bool interactive = false;
    bool list_models = false;
    bool list_languages = false;
    int history = 0;            // 0: off
};

void usage(std::FILE* out) {
    std::println(out, "Usage: mediascribe [options] [FILE]");
    std::println(out, "Transcribes an audio or video file into a document.");
    std::println(out, "Without FILE, asks for language, model and file interactively.");
    std::println(out, "Options:");
    std::println(out, "  -l, --language CODE    Spoken language (default: nl)");
    std::println(out, "  -m, --model NAME       Whisper model (default: medium)");
    std::println(out, "  -o, --output-dir DIR   Where to write the document (default: Downloads)");
    std::println(out, "  -f, --format FMT       docx, txt or srt (default: docx)");
    std::println(out, "      --no-timestamps    Omit [MM:SS] prefixes");
    std::println(out, "      --no-reveal        Do not open the output folder when done");
    std::println(out, "  -c, --config PATH      Config file path");
    std::println(out, "  -i, --interactive      Ask for language and model even with FILE");
    std::println(out, "      --history [N]      Show the last N runs (default 10)");
    std::println(out, "      --list-models      Show available models");
    std::println(out, "      --list-languages   Show available languages");
    std::println(out, "  -v, --verbose          Enable verbose logging");
    std::println(out, "  -h, --help             Show this help");
}

bool parse_int(std::string_view s, int& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size() && out > 0;
}

// Returns an exit code when parsing should stop the program.
std::optional<int> parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto value = [&](std::string& dest) -> bool {
            if (i + 1 >= argc) {
                std::println(stderr, "mediascribe: {} needs a value", arg);
                return false;
            }
            dest = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            usage(stdout);
            return kExitOk;
        } else if (arg == "--language" || arg == "-l") {
            if (!value(opts.language)) return kExitUsage;
        } else if (arg == "--model" || arg == "-m") {
            if (!value(opts.model)) return kExitUsage;
        } else if (arg == "--output-dir" || arg == "-o") {
            if (!value(opts.output_dir)) return kExitUsage;
        } else if (arg == "--format" || arg == "-f") {
            if (!value(opts.format)) return kExitUsage;
        } else if (arg == "--config" || arg == "-c") {
            if (!value(opts.config_path)) return kExitUsage;
        } else if (arg == "--no-timestamps") {
            opts.no_timestamps = true;
        } else if (arg == "--no-reveal") {
            opts.no_reveal = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--interactive" || arg == "-i") {
            opts.interactive = true;
        } else if (arg == "--list-models") {
            opts.list_models = true;
        } else if (arg == "--list-languages") {
            opts.list_languages = true;
        } else if (arg == "--history") {
            opts.history = 10;
            if (i + 1 < argc && parse_int(argv[i + 1], opts.history)) ++i;
        } else if (arg.starts_with("-") && arg != "-") {
            std::println(stderr, "mediascribe: unknown option {}", arg);
            usage(stderr);
            return kExitUsage;
        } else if (opts.input.empty()) {
            opts.input = arg;
        } else {
            std::println(stderr, "mediascribe: only one input file is supported");
            return kExitUsage;
        }
    }
    return std::nullopt;
}

void list_models() {
    for (const auto& m : model_catalog()) {
        std::println("{:10} {:>6}  x{:.1f} realtime  {}", m.name, m.params, m.realtime_factor,
                     m.description);
    }
}

void list_languages() {
    for (const auto& l : language_catalog()) {
        std::println("{}  {}", l.code, l.name);
    }
}

int show_history(int limit) {
    HistoryDb db;
    if (!db.open(platform::data_dir() + "/history.db")) return kExitFailed;
    for (const auto& e : db.recent(limit)) {
        std::println("[{}] {} ({}, {}) {}", e.timestamp, e.run.status, e.run.model,
                     e.run.language, e.run.input_path);
        if (!e.run.output_path.empty()) std::println("  -> {}", e.run.output_path);
        if (!e.run.error.empty()) std::println("  {}", e.run.error);
    }
    return kExitOk;
}

void print_summary(MediaToolkit& toolkit, const TranscriptionRequest& req) {
    std::error_code ec;
    auto size = fs::file_size(req.input_path, ec);
    std::println("  File: {} ({:.1f} MB)", fs::path(req.input_path).filename().string(),
                 ec ? 0.0 : static_cast<double>(size) / (1024 * 1024));

    auto duration = toolkit.probe_duration(req.input_path);
    if (duration && *duration > 0) {
        std::println("  Duration: {}", format_clock(*duration));
        if (const ModelInfo* m = find_model(req.model_name)) {
            std::println("  Estimated processing time: {}",
                         format_estimate(*duration * m->realtime_factor));
        }
    } else {
        std::println("  Duration: unknown");
    }

    const LanguageInfo* lang = find_language(req.language_code);
    std::println("  Language: {}  Model: {}", lang ? lang->name : req.language_code,
                 req.model_name);
    std::println("");
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (auto code = parse_args(argc, argv, opts)) return *code;

    if (opts.list_models) { list_models(); return kExitOk; }
    if (opts.list_languages) { list_languages(); return kExitOk; }
    if (opts.history > 0) return show_history(opts.history);

    Config config = opts.config_path.empty() ? Config::load_default()
                                             : Config::load(opts.config_path);
    if (!opts.language.empty()) config.transcription.language = opts.language;
    if (!opts.model.empty()) config.transcription.model = opts.model;
    if (!opts.output_dir.empty()) config.output.directory = opts.output_dir;
    if (!opts.format.empty()) config.output.format = opts.format;
    if (opts.no_timestamps) config.output.timestamps = false;
    if (opts.no_reveal) config.output.reveal = false;

    auto writer = make_document_writer(config.output.format);
    if (!writer) {
        std::println(stderr, "mediascribe: unknown format '{}' (docx, txt or srt)",
                     config.output.format);
        return kExitUsage;
    }

    bool interactive = opts.interactive || opts.input.empty();
    if (interactive && !::isatty(STDIN_FILENO)) {
        std::println(stderr, "mediascribe: no input file given and stdin is not a terminal");
        usage(stderr);
        return kExitUsage;
    }

    TranscriptionRequest request{
        .input_path = opts.input,
        .language_code = config.transcription.language,
        .model_name = config.transcription.model,
    };

    if (interactive) {
        std::println("\n  mediascribe: audio/video transcription\n");
        if (opts.language.empty()) {
            request.language_code = cli::choose_language(std::cin, std::cout, request.language_code);
        }
        if (opts.model.empty()) {
            request.model_name = cli::choose_model(std::cin, std::cout, request.model_name);
        }
        if (request.input_path.empty()) {
            auto picked = cli::select_input_file(std::cin, std::cout);
            if (!picked) {
                std::println(stderr, "mediascribe: no file selected");
                return kExitUsage;
            }
            request.input_path = *picked;
        }
    }

    if (!find_language(request.language_code)) {
        std::println(stderr, "mediascribe: unknown language '{}' (see --list-languages)",
                     request.language_code);
        return kExitUsage;
    }

    // Must precede every thread so the blocked mask is inherited.
    std::stop_source stop;
    SignalWatcher signals(stop);
    if (!signals.start()) {
        std::println(stderr, "mediascribe: Ctrl-C will not cancel cleanly");
    }

    FfmpegToolkit toolkit(config.media);
    print_summary(toolkit, request);

    std::string cache_dir = config.models.cache_dir.empty()
                                ? platform::cache_dir() + "/models"
                                : config.models.cache_dir;
    ModelCache models(cache_dir, config.models.download_url);
    if (const ModelInfo* m = find_model(request.model_name);
        m && config.backend.api_format != "openai" && !models.is_cached(*m)) {
        std::println("  Model {} is not cached yet, downloading to {}", m->name, models.dir());
    }
    LanBackend backend(config.backend.url, config.backend.api_format,
                       static_cast<long>(config.backend.timeout_seconds), models);

    std::unique_ptr<ProgressReporter> download_bar;
    backend.set_download_progress([&](uint64_t received, uint64_t total) {
        if (total == 0) return;
        if (!download_bar) download_bar = std::make_unique<ProgressReporter>(stdout, "Model download");
        download_bar->update(static_cast<double>(received) / static_cast<double>(total));
    });

    Transcriber transcriber(backend, toolkit, {
        .sample_rate = config.media.sample_rate,
        .chunk_seconds = config.transcription.chunk_seconds,
        .parallel_requests = config.backend.parallel_requests,
    });
    MediaNormalizer normalizer(toolkit, config.media);
    DocumentAssembler assembler(*writer);

    Session session(normalizer, transcriber, assembler, config.media.temp_dir, opts.verbose);
    session.set_timestamps(config.output.timestamps);

    ProgressReporter transcribe_bar(stdout, "Transcription");
    session.set_progress_callback([&](const TranscriptionProgress& p) {
        if (download_bar) download_bar.reset();
        transcribe_bar.report(p);
    });
    session.set_state_observer([&](SessionState s) {
        switch (s) {
            case SessionState::Normalizing:
                std::println("Processing started...");
                break;
            case SessionState::Transcribing:
                std::println("  Loading model {}...", request.model_name);
                break;
            case SessionState::Assembling:
                transcribe_bar.finish();
                std::println("  Writing {} document...", writer->extension());
                break;
            default:
                download_bar.reset();
                transcribe_bar.finish();
                break;
        }
    });

    fs::path output_dir = config.output.directory.empty() ? fs::path(platform::downloads_dir())
                                                          : fs::path(config.output.directory);

    auto result = session.run(request, output_dir, stop.get_token());

    std::error_code ec;
    fs::path input_abs = fs::absolute(request.input_path, ec);
    RunRecord record{
        .input_path = ec ? request.input_path : input_abs.string(),
        .model = request.model_name,
        .language = request.language_code,
        .audio_duration = session.audio().duration_s,
        .processing_time = session.elapsed_seconds(),
    };

    int code = kExitOk;
    if (result) {
        record.output_path = result->path;
        record.segments = static_cast<int64_t>(result->segments.size());
        record.status = "done";

        std::println("\n  Done in {}", format_clock(session.elapsed_seconds()));
        if (!transcriber.detected_language().empty()) {
            std::println("  Detected language: {}", transcriber.detected_language());
        }
        std::println("  Output: {}\n", result->path);
        if (config.output.reveal && !platform::reveal_in_file_browser(result->path)) {
            if (opts.verbose) std::println(stderr, "[mediascribe] could not open a file browser");
        }
    } else {
        const auto& f = result.error();
        record.status = f.error.kind == ErrorKind::Cancelled ? "cancelled" : "failed";
        record.error = std::string(to_string(f.error.kind)) + ": " + f.error.message;
        std::println(stderr, "mediascribe: {} failed: {}: {}", to_string(f.stage),
                     to_string(f.error.kind), f.error.message);
        code = f.error.kind == ErrorKind::Cancelled ? kExitCancelled : kExitFailed;
    }

    HistoryDb history;
    if (history.open(platform::data_dir() + "/history.db") && !history.insert(record)) {
        std::println(stderr, "mediascribe: run not recorded in history");
    }

    return code;
}
