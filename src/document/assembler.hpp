#pragma once

#include "document/document_writer.hpp"
#include "errors.hpp"
#include "transcript.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

// Writes data to path via a hidden temporary file in the same directory,
// fsync and rename. The destination is either the old file or the complete
// new one; the temporary file never survives a failure.
std::expected<void, std::string> write_file_atomic(const std::filesystem::path& path,
                                                   std::span<const uint8_t> data);

class DocumentAssembler {
public:
    explicit DocumentAssembler(DocumentWriter& writer) : writer_(writer) {}

    // Output goes to output_dir/<stem of base_name>.<ext>, replacing any
    // existing file of that name.
    std::expected<OutputDocument, PipelineError>
        assemble(const std::vector<TranscriptSegment>& segments,
                 const std::filesystem::path& output_dir, const std::string& base_name,
                 const DocumentMetadata& meta);

    std::filesystem::path output_path(const std::filesystem::path& output_dir,
                                      const std::string& base_name) const;

private:
    DocumentWriter& writer_;
};
