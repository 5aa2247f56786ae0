#include <catch2/catch_test_macros.hpp>

#include "document/assembler.hpp"
#include "document/docx_writer.hpp"
#include "document/text_writers.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::vector<TranscriptSegment> sample_segments() {
    return {
        {.start_s = 0.0, .end_s = 4.0, .text = "Goedemorgen allemaal.", .confidence = std::nullopt},
        {.start_s = 5.0, .end_s = 9.0, .text = "  ", .confidence = std::nullopt},
        {.start_s = 65.0, .end_s = 70.0, .text = "Welkom bij het college.", .confidence = std::nullopt},
    };
}

DocumentMetadata sample_meta() {
    return {.title = "lecture", .file_name = "lecture.mp4", .duration = "01:10",
            .model = "tiny", .language = "Nederlands", .created = "19/10/2026 10:00",
            .timestamps = true};
}

} // namespace

TEST_CASE("DocumentAssembler", "[assembler]") {
    test::TmpDir out;
    TextWriter writer;
    DocumentAssembler assembler(writer);

    SECTION("NamedAfterInputStem") {
        auto res = assembler.assemble(sample_segments(), out.path, "/media/lecture.mp4", sample_meta());
        REQUIRE(res.has_value());
        REQUIRE(fs::path(res->path) == out.path / "lecture.txt");
    }

    SECTION("OneLinePerNonBlankSegmentInOrder") {
        auto res = assembler.assemble(sample_segments(), out.path, "lecture.mp4", sample_meta());
        REQUIRE(res.has_value());
        REQUIRE(res->segments.size() == 2);

        auto text = read_file(res->path);
        auto first = text.find("[00:00] Goedemorgen allemaal.");
        auto second = text.find("[01:05] Welkom bij het college.");
        REQUIRE(first != std::string::npos);
        REQUIRE(second != std::string::npos);
        REQUIRE(first < second);
    }

    SECTION("TimestampsOptional") {
        auto meta = sample_meta();
        meta.timestamps = false;
        auto res = assembler.assemble(sample_segments(), out.path, "lecture.mp4", meta);
        REQUIRE(res.has_value());
        auto text = read_file(res->path);
        REQUIRE(text.find("[00:00]") == std::string::npos);
        REQUIRE(text.find("Goedemorgen allemaal.\n") != std::string::npos);
    }

    SECTION("ExistingFileOverwritten") {
        test::write_bytes(out.file("lecture.txt"), "old transcript");
        auto res = assembler.assemble(sample_segments(), out.path, "lecture.mp4", sample_meta());
        REQUIRE(res.has_value());
        REQUIRE(read_file(res->path).find("old transcript") == std::string::npos);
        REQUIRE(out.entry_count() == 1);
    }

    SECTION("NoTemporaryFilesLeft") {
        REQUIRE(assembler.assemble(sample_segments(), out.path, "a.mp3", sample_meta()).has_value());
        REQUIRE(assembler.assemble(sample_segments(), out.path, "b.mp3", sample_meta()).has_value());
        REQUIRE(out.entry_count() == 2);
    }

    SECTION("CreatesMissingDirectory") {
        auto nested = out.path / "transcripts" / "2026";
        auto res = assembler.assemble(sample_segments(), nested, "lecture.mp4", sample_meta());
        REQUIRE(res.has_value());
        REQUIRE(fs::exists(nested / "lecture.txt"));
    }

    SECTION("DirectoryUnderRegularFileFails") {
        test::write_bytes(out.file("blocker"), "x");
        auto res = assembler.assemble(sample_segments(), out.path / "blocker" / "docs",
                                      "lecture.mp4", sample_meta());
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::WriteFailed);
        REQUIRE(out.entry_count() == 1);
    }

    SECTION("ReadOnlyDirectoryFails") {
        // Root ignores directory permissions.
        if (::geteuid() == 0) SKIP("running as root");

        auto ro = out.path / "ro";
        fs::create_directory(ro);
        fs::permissions(ro, fs::perms::owner_read | fs::perms::owner_exec);

        auto res = assembler.assemble(sample_segments(), ro, "lecture.mp4", sample_meta());
        fs::permissions(ro, fs::perms::owner_all);

        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::WriteFailed);
        REQUIRE(fs::is_empty(ro));
    }

    SECTION("DocxExtension") {
        DocxWriter docx;
        DocumentAssembler docx_assembler(docx);
        auto res = docx_assembler.assemble(sample_segments(), out.path, "lecture.mp4", sample_meta());
        REQUIRE(res.has_value());
        REQUIRE(fs::path(res->path).extension() == ".docx");
        REQUIRE(read_file(res->path).substr(0, 4) == std::string("PK\x03\x04", 4));
    }
}

TEST_CASE("make_document_writer", "[assembler]") {
    REQUIRE(make_document_writer("docx")->extension() == "docx");
    REQUIRE(make_document_writer("txt")->extension() == "txt");
    REQUIRE(make_document_writer("srt")->extension() == "srt");
    REQUIRE(make_document_writer("pdf") == nullptr);
}
