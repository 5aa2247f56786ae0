#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

// Builds a ZIP archive in memory. Entries are deflate-compressed with zlib.
// Enough for OOXML containers; no ZIP64, no encryption.
class ZipWriter {
public:
    std::expected<void, std::string> add(std::string_view name, std::string_view data);

    // Appends the central directory and returns the archive bytes.
    std::vector<uint8_t> finish();

    size_t entry_count() const { return entries_.size(); }

private:
    struct Entry {
        std::string name;
        uint32_t crc;
        uint32_t compressed_size;
        uint32_t size;
        uint32_t offset;
    };

    std::vector<uint8_t> buf_;
    std::vector<Entry> entries_;
};
