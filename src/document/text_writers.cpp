#include "document/text_writers.hpp"

#include "document/docx_writer.hpp"
#include "document/time_format.hpp"

#include <format>

namespace {

std::vector<uint8_t> to_bytes(const std::string& s) {
    return {s.begin(), s.end()};
}

} // namespace

std::expected<std::vector<uint8_t>, std::string>
TextWriter::render(const std::vector<TranscriptSegment>& segments, const DocumentMetadata& meta) {
    std::string out;
    out += meta.title + "\n\n";
    out += std::format("File:     {}\n", meta.file_name);
    out += std::format("Duration: {}\n", meta.duration);
    out += std::format("Model:    {}\n", meta.model);
    out += std::format("Language: {}\n", meta.language);
    out += std::format("Date:     {}\n\n", meta.created);

    for (const auto& seg : segments) {
        if (meta.timestamps) out += "[" + format_clock(seg.start_s) + "] ";
        out += seg.text;
        out += '\n';
    }
    return to_bytes(out);
}

std::expected<std::vector<uint8_t>, std::string>
SrtWriter::render(const std::vector<TranscriptSegment>& segments, const DocumentMetadata&) {
    std::string out;
    int index = 1;
    for (const auto& seg : segments) {
        out += std::format("{}\n{} --> {}\n{}\n\n", index++,
                           format_srt_time(seg.start_s), format_srt_time(seg.end_s), seg.text);
    }
    return to_bytes(out);
}

std::unique_ptr<DocumentWriter> make_document_writer(std::string_view format) {
    if (format == "docx") return std::make_unique<DocxWriter>();
    if (format == "txt") return std::make_unique<TextWriter>();
    if (format == "srt") return std::make_unique<SrtWriter>();
    return nullptr;
}
