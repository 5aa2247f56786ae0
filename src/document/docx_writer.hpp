#pragma once

#include "document/document_writer.hpp"

#include <string>
#include <string_view>

// Office Open XML word processing document: title, information table,
// "Transcript" heading, one paragraph per segment and a footer line.
class DocxWriter : public DocumentWriter {
public:
    std::string_view extension() const override { return "docx"; }

    std::expected<std::vector<uint8_t>, std::string>
        render(const std::vector<TranscriptSegment>& segments, const DocumentMetadata& meta) override;

    // word/document.xml on its own, for inspection.
    static std::string document_xml(const std::vector<TranscriptSegment>& segments,
                                    const DocumentMetadata& meta);
};

// Escapes &, <, >, " and ' and drops characters XML 1.0 does not allow.
std::string xml_escape(std::string_view text);
