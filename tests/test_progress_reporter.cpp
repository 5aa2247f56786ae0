#include <catch2/catch_test_macros.hpp>

#include "progress/progress_reporter.hpp"

#include <cstdio>
#include <string>

namespace {

// Everything written to a tmpfile() so far.
std::string contents(std::FILE* f) {
    std::fflush(f);
    std::rewind(f);
    std::string out;
    char buf[256];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
    return out;
}

} // namespace

TEST_CASE("format_bar", "[progress]") {
    REQUIRE(format_bar(0.0, 10) == "[>         ]");
    REQUIRE(format_bar(0.5, 10) == "[=====>    ]");
    REQUIRE(format_bar(0.99, 10) == "[=========>]");
    REQUIRE(format_bar(1.0, 10) == "[==========]");
    REQUIRE(format_bar(-1.0, 10) == format_bar(0.0, 10));
    REQUIRE(format_bar(7.0, 10) == format_bar(1.0, 10));
    REQUIRE(format_bar(0.5).size() == 42);
}

TEST_CASE("format_progress_line", "[progress]") {
    REQUIRE(format_progress_line("Transcription", 0.4567) ==
            "  Transcription: [" + std::string(18, '=') + ">" + std::string(21, ' ') + "]  45.67%");
    REQUIRE(format_progress_line("Export", 1.0, 4) == "  Export: [====] 100.00%");
}

TEST_CASE("ProgressReporter", "[progress]") {
    std::FILE* f = std::tmpfile();
    REQUIRE(f != nullptr);

    SECTION("RendersInPlace") {
        {
            ProgressReporter bar(f, "Job", 4);
            bar.update(0.25);
            bar.report({.fraction_complete = 1.0, .segment_end_s = 12.0});
            REQUIRE(bar.last_fraction() == 1.0);
        }
        REQUIRE(contents(f) == "\r  Job: [=>  ]  25.00%\r  Job: [====] 100.00%\n");
    }

    SECTION("FinishOnlyOnce") {
        ProgressReporter bar(f, "Job", 4);
        bar.update(0.5);
        bar.finish();
        bar.finish();
        bar.update(0.9);
        REQUIRE(contents(f) == "\r  Job: [==> ]  50.00%\n");
    }

    SECTION("NothingWrittenWhenUnused") {
        { ProgressReporter bar(f, "Job"); }
        REQUIRE(contents(f).empty());
    }

    SECTION("NullStreamIgnored") {
        ProgressReporter bar(nullptr, "Job");
        bar.update(0.5);
        bar.update(0.6);
        REQUIRE(bar.last_fraction() == 0.0);
    }

    std::fclose(f);
}
