#include "progress/progress_reporter.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <print>
#include <stdexcept>

std::string format_bar(double fraction, int width) {
    if (width < 1) width = 1;
    if (!std::isfinite(fraction)) fraction = 0.0;
    fraction = std::clamp(fraction, 0.0, 1.0);

    int filled = static_cast<int>(fraction * width);
    std::string bar = "[";
    if (filled >= width) {
        bar.append(static_cast<size_t>(width), '=');
    } else {
        bar.append(static_cast<size_t>(filled), '=');
        bar += '>';
        bar.append(static_cast<size_t>(width - filled - 1), ' ');
    }
    bar += ']';
    return bar;
}

std::string format_progress_line(std::string_view label, double fraction, int width) {
    if (!std::isfinite(fraction)) fraction = 0.0;
    fraction = std::clamp(fraction, 0.0, 1.0);
    return std::format("  {}: {} {:6.2f}%", label, format_bar(fraction, width), fraction * 100.0);
}

ProgressReporter::ProgressReporter(std::FILE* out, std::string label, int width)
    : out_(out), label_(std::move(label)), width_(width) {}

ProgressReporter::~ProgressReporter() {
    finish();
}

void ProgressReporter::report(const TranscriptionProgress& progress) {
    render(progress.fraction_complete);
}

void ProgressReporter::update(double fraction) {
    render(fraction);
}

void ProgressReporter::render(double fraction) {
    if (finished_) return;
    try {
        if (!out_) throw std::runtime_error("no output stream");
        auto line = format_progress_line(label_, fraction, width_);
        if (std::fprintf(out_, "\r%s", line.c_str()) < 0 || std::fflush(out_) != 0) {
            throw std::runtime_error("write to terminal failed");
        }
        started_ = true;
        last_fraction_ = std::clamp(fraction, 0.0, 1.0);
    } catch (const std::exception& e) {
        if (!error_logged_) {
            std::println(stderr, "progress: cannot render: {}", e.what());
            error_logged_ = true;
        }
    }
}

void ProgressReporter::finish() {
    if (finished_) return;
    finished_ = true;
    if (started_ && out_) {
        std::fputc('\n', out_);
        std::fflush(out_);
    }
}
