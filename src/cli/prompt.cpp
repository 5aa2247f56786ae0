#include "cli/prompt.hpp"

#include "media/media_kind.hpp"
#include "platform/desktop.hpp"
#include "whisper/catalog.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <istream>
#include <ostream>
#include <print>

namespace fs = std::filesystem;

namespace cli {

namespace {

std::string trim(const std::string& s) {
    auto start_pos = s.find_first_not_of(" \t\n\r");
    if (start_pos == std::string::npos) return {};
    auto end_pos = s.find_last_not_of(" \t\n\r");
    return s.substr(start_pos, end_pos - start_pos + 1);
}

// 0-based index into a menu of size n, or nullopt when the answer is unusable.
std::optional<size_t> parse_choice(const std::string& answer, size_t n) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(answer.data(), answer.data() + answer.size(), value);
    if (ec != std::errc{} || ptr != answer.data() + answer.size()) return std::nullopt;
    if (value < 1 || value > n) return std::nullopt;
    return value - 1;
}

size_t read_choice(std::istream& in, std::ostream& out, std::string_view prompt,
                   size_t n, size_t default_index) {
    std::print(out, "  {} [{}]: ", prompt, default_index + 1);
    out.flush();

    std::string line;
    if (!std::getline(in, line)) {
        std::println(out, "");
        return default_index;
    }
    line = trim(line);
    if (line.empty()) return default_index;

    auto choice = parse_choice(line, n);
    if (!choice) {
        std::println(out, "  Invalid choice, using the default.");
        return default_index;
    }
    return *choice;
}

} // namespace

std::string choose_language(std::istream& in, std::ostream& out, std::string_view default_code) {
    const auto& langs = language_catalog();
    size_t def = 0;
    for (size_t i = 0; i < langs.size(); ++i) {
        if (langs[i].code == default_code) def = i;
    }

    std::println(out, "Choose the spoken language:\n");
    for (size_t i = 0; i < langs.size(); ++i) {
        std::println(out, "  {:>2}. {} ({}){}", i + 1, langs[i].name, langs[i].code,
                     i == def ? " (default)" : "");
    }
    std::println(out, "");

    size_t idx = read_choice(in, out, "Language", langs.size(), def);
    std::println(out, "  -> {}\n", langs[idx].name);
    return std::string(langs[idx].code);
}

std::string choose_model(std::istream& in, std::ostream& out, std::string_view default_model) {
    const auto& models = model_catalog();
    size_t def = 0;
    for (size_t i = 0; i < models.size(); ++i) {
        if (models[i].name == default_model) def = i;
    }

    std::println(out, "Choose the Whisper model:\n");
    for (size_t i = 0; i < models.size(); ++i) {
        std::println(out, "  {}. {:10} {:>6}  {}{}", i + 1, models[i].name, models[i].params,
                     models[i].description, i == def ? " (default)" : "");
    }
    std::println(out, "");

    size_t idx = read_choice(in, out, "Model", models.size(), def);
    std::println(out, "  -> {}\n", models[idx].name);
    return std::string(models[idx].name);
}

std::optional<std::string> ask_file_path(std::istream& in, std::ostream& out) {
    std::print(out, "  Path to an audio or video file: ");
    out.flush();

    std::string line;
    if (!std::getline(in, line)) return std::nullopt;
    line = trim(line);

    // Terminals quote dropped paths.
    if (line.size() >= 2 && (line.front() == '\'' || line.front() == '"') &&
        line.back() == line.front()) {
        line = line.substr(1, line.size() - 2);
    }
    if (line.empty()) return std::nullopt;

    if (line.front() == '~') {
        if (const char* home = std::getenv("HOME")) line = home + line.substr(1);
    }

    std::error_code ec;
    if (!fs::is_regular_file(line, ec)) {
        std::println(out, "  File not found: {}", line);
        return std::nullopt;
    }
    return line;
}

std::optional<std::string> select_input_file(std::istream& in, std::ostream& out) {
    std::println(out, "Select an audio or video file...");
    if (auto picked = platform::pick_file("Select an audio or video file", supported_extensions())) {
        return picked;
    }
    std::println(out, "  No file selected in the file dialog.");
    return ask_file_path(in, out);
}

} // namespace cli
