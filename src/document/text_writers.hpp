#pragma once

#include "document/document_writer.hpp"

// Plain UTF-8 text: a short header block, then one line per segment.
class TextWriter : public DocumentWriter {
public:
    std::string_view extension() const override { return "txt"; }

    std::expected<std::vector<uint8_t>, std::string>
        render(const std::vector<TranscriptSegment>& segments, const DocumentMetadata& meta) override;
};

// SubRip subtitles. Timestamps are always written.
class SrtWriter : public DocumentWriter {
public:
    std::string_view extension() const override { return "srt"; }

    std::expected<std::vector<uint8_t>, std::string>
        render(const std::vector<TranscriptSegment>& segments, const DocumentMetadata& meta) override;
};
