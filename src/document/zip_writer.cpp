#include "document/zip_writer.hpp"

#include <limits>
#include <zlib.h>

namespace {

constexpr uint32_t kLocalHeaderSig = 0x04034b50;
constexpr uint32_t kCentralHeaderSig = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSig = 0x06054b50;
constexpr uint16_t kVersion = 20;
constexpr uint16_t kMethodDeflate = 8;
// 1980-01-01 00:00, the DOS epoch. Keeps output reproducible.
constexpr uint16_t kDosTime = 0;
constexpr uint16_t kDosDate = (1 << 5) | 1;

void put_u16(std::vector<uint8_t>& buf, uint16_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void put_u32(std::vector<uint8_t>& buf, uint32_t v) {
    put_u16(buf, static_cast<uint16_t>(v & 0xFFFF));
    put_u16(buf, static_cast<uint16_t>(v >> 16));
}

void put_bytes(std::vector<uint8_t>& buf, std::string_view s) {
    buf.insert(buf.end(), s.begin(), s.end());
}

std::expected<std::vector<uint8_t>, std::string> raw_deflate(std::string_view data) {
    z_stream zs{};
    // Negative window bits: raw deflate stream, no zlib header.
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::unexpected(std::string("deflateInit2 failed"));
    }

    std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(data.size())));
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());

    int rc = deflate(&zs, Z_FINISH);
    out.resize(zs.total_out);
    deflateEnd(&zs);

    if (rc != Z_STREAM_END) {
        return std::unexpected("deflate failed: " + std::to_string(rc));
    }
    return out;
}

} // namespace

std::expected<void, std::string> ZipWriter::add(std::string_view name, std::string_view data) {
    if (name.empty() || name.size() > std::numeric_limits<uint16_t>::max()) {
        return std::unexpected(std::string("invalid entry name"));
    }
    if (data.size() > std::numeric_limits<uint32_t>::max() ||
        buf_.size() > std::numeric_limits<uint32_t>::max()) {
        return std::unexpected(std::string("archive too large"));
    }

    auto compressed = raw_deflate(data);
    if (!compressed) return std::unexpected(compressed.error());

    Entry e{
        .name = std::string(name),
        .crc = static_cast<uint32_t>(
            crc32(0L, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()))),
        .compressed_size = static_cast<uint32_t>(compressed->size()),
        .size = static_cast<uint32_t>(data.size()),
        .offset = static_cast<uint32_t>(buf_.size()),
    };

    put_u32(buf_, kLocalHeaderSig);
    put_u16(buf_, kVersion);
    put_u16(buf_, 0);                    // flags
    put_u16(buf_, kMethodDeflate);
    put_u16(buf_, kDosTime);
    put_u16(buf_, kDosDate);
    put_u32(buf_, e.crc);
    put_u32(buf_, e.compressed_size);
    put_u32(buf_, e.size);
    put_u16(buf_, static_cast<uint16_t>(e.name.size()));
    put_u16(buf_, 0);                    // extra field length
    put_bytes(buf_, e.name);
    buf_.insert(buf_.end(), compressed->begin(), compressed->end());

    entries_.push_back(std::move(e));
    return {};
}

std::vector<uint8_t> ZipWriter::finish() {
    auto cd_offset = static_cast<uint32_t>(buf_.size());

    for (const auto& e : entries_) {
        put_u32(buf_, kCentralHeaderSig);
        put_u16(buf_, kVersion);         // made by
        put_u16(buf_, kVersion);         // needed to extract
        put_u16(buf_, 0);
        put_u16(buf_, kMethodDeflate);
        put_u16(buf_, kDosTime);
        put_u16(buf_, kDosDate);
        put_u32(buf_, e.crc);
        put_u32(buf_, e.compressed_size);
        put_u32(buf_, e.size);
        put_u16(buf_, static_cast<uint16_t>(e.name.size()));
        put_u16(buf_, 0);                // extra
        put_u16(buf_, 0);                // comment
        put_u16(buf_, 0);                // disk number
        put_u16(buf_, 0);                // internal attributes
        put_u32(buf_, 0);                // external attributes
        put_u32(buf_, e.offset);
        put_bytes(buf_, e.name);
    }

    auto cd_size = static_cast<uint32_t>(buf_.size() - cd_offset);
    auto count = static_cast<uint16_t>(entries_.size());

    put_u32(buf_, kEndOfCentralDirSig);
    put_u16(buf_, 0);
    put_u16(buf_, 0);
    put_u16(buf_, count);
    put_u16(buf_, count);
    put_u32(buf_, cd_size);
    put_u32(buf_, cd_offset);
    put_u16(buf_, 0);

    entries_.clear();
    return std::move(buf_);
}
