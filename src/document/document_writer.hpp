#pragma once

#include "transcript.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct DocumentMetadata {
    std::string title;          // input file stem
    std::string file_name;      // input file name with extension
    std::string duration;       // "MM:SS" or "unknown"
    std::string model;
    std::string language;       // display name, e.g. "Nederlands"
    std::string created;        // "DD/MM/YYYY HH:MM"
    bool timestamps = true;
};

// Renders a transcript into the bytes of one output file format.
class DocumentWriter {
public:
    virtual ~DocumentWriter() = default;

    virtual std::string_view extension() const = 0;

    virtual std::expected<std::vector<uint8_t>, std::string>
        render(const std::vector<TranscriptSegment>& segments, const DocumentMetadata& meta) = 0;
};

// "docx", "txt" or "srt"; nullptr for anything else.
std::unique_ptr<DocumentWriter> make_document_writer(std::string_view format);
