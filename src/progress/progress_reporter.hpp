#pragma once

#include "transcript.hpp"

#include <cstdio>
#include <string>
#include <string_view>

// Renders "[=====>     ]" for a fraction in [0,1]. Out-of-range values are clamped.
std::string format_bar(double fraction, int width = 40);

// Full status line without the leading carriage return: "  LABEL: [...]  45.67%".
std::string format_progress_line(std::string_view label, double fraction, int width = 40);

// In-place terminal progress bar. Each update overwrites the previous one.
// Rendering problems are logged once and otherwise ignored.
class ProgressReporter {
public:
    explicit ProgressReporter(std::FILE* out, std::string label, int width = 40);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void report(const TranscriptionProgress& progress);
    void update(double fraction);

    // Ends the line. Further calls are no-ops.
    void finish();

    double last_fraction() const { return last_fraction_; }

private:
    void render(double fraction);

    std::FILE* out_;
    std::string label_;
    int width_;
    double last_fraction_ = 0.0;
    bool started_ = false;
    bool finished_ = false;
    bool error_logged_ = false;
};
