#include <catch2/catch_test_macros.hpp>

#include "document/zip_writer.hpp"

#include <cstring>
#include <string>
#include <zlib.h>

namespace {

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(read_u16(p)) | (static_cast<uint32_t>(read_u16(p + 2)) << 16);
}

std::string inflate_raw(const uint8_t* data, size_t size, size_t expected) {
    std::string out(expected, '\0');
    z_stream zs{};
    REQUIRE(inflateInit2(&zs, -MAX_WBITS) == Z_OK);
    zs.next_in = const_cast<Bytef*>(data);
    zs.avail_in = static_cast<uInt>(size);
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    int rc = inflate(&zs, Z_FINISH);
    inflateEnd(&zs);
    REQUIRE(rc == Z_STREAM_END);
    return out;
}

} // namespace

TEST_CASE("ZipWriter", "[zip]") {
    const std::string body = "<w:document>" + std::string(500, 'x') + "</w:document>";

    SECTION("LocalHeaderDescribesEntry") {
        ZipWriter zip;
        REQUIRE(zip.add("word/document.xml", body).has_value());
        auto bytes = zip.finish();
        const uint8_t* p = bytes.data();

        REQUIRE(read_u32(p) == 0x04034b50);
        REQUIRE(read_u16(p + 8) == 8);          // deflate
        uint32_t crc = read_u32(p + 14);
        uint32_t csize = read_u32(p + 18);
        uint32_t usize = read_u32(p + 22);
        uint16_t name_len = read_u16(p + 26);

        REQUIRE(usize == body.size());
        REQUIRE(csize < usize);
        REQUIRE(crc == crc32(0L, reinterpret_cast<const Bytef*>(body.data()),
                             static_cast<uInt>(body.size())));
        REQUIRE(std::string(reinterpret_cast<const char*>(p + 30), name_len) == "word/document.xml");
        REQUIRE(inflate_raw(p + 30 + name_len, csize, usize) == body);
    }

    SECTION("EndRecordCountsEntries") {
        ZipWriter zip;
        REQUIRE(zip.add("a.xml", "<a/>").has_value());
        REQUIRE(zip.add("b/c.xml", "<c/>").has_value());
        REQUIRE(zip.entry_count() == 2);
        auto bytes = zip.finish();

        REQUIRE(bytes.size() > 22);
        const uint8_t* eocd = bytes.data() + bytes.size() - 22;
        REQUIRE(read_u32(eocd) == 0x06054b50);
        REQUIRE(read_u16(eocd + 10) == 2);
        uint32_t cd_size = read_u32(eocd + 12);
        uint32_t cd_offset = read_u32(eocd + 16);
        REQUIRE(cd_offset + cd_size == bytes.size() - 22);
        REQUIRE(read_u32(bytes.data() + cd_offset) == 0x02014b50);
    }

    SECTION("EmptyEntryAllowed") {
        ZipWriter zip;
        REQUIRE(zip.add("empty.txt", "").has_value());
        auto bytes = zip.finish();
        REQUIRE(read_u32(bytes.data() + 22) == 0);
    }

    SECTION("EmptyNameRejected") {
        ZipWriter zip;
        REQUIRE_FALSE(zip.add("", "data").has_value());
    }
}
