#include "document/docx_writer.hpp"

#include "document/time_format.hpp"
#include "document/zip_writer.hpp"

#include <format>

namespace {

constexpr std::string_view kContentTypes =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    "\n"
    R"(<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">)"
    R"(<Default Extension="rels" ContentType="application/vnd.openxmlformats-package.relationships+xml"/>)"
    R"(<Default Extension="xml" ContentType="application/xml"/>)"
    R"(<Override PartName="/word/document.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml"/>)"
    R"(<Override PartName="/word/styles.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml"/>)"
    R"(<Override PartName="/docProps/core.xml" ContentType="application/vnd.openxmlformats-package.core-properties+xml"/>)"
    R"(</Types>)";

constexpr std::string_view kPackageRels =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    "\n"
    R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
    R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument" Target="word/document.xml"/>)"
    R"(<Relationship Id="rId2" Type="http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties" Target="docProps/core.xml"/>)"
    R"(</Relationships>)";

constexpr std::string_view kDocumentRels =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    "\n"
    R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
    R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles" Target="styles.xml"/>)"
    R"(</Relationships>)";

constexpr std::string_view kStyles =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    "\n"
    R"(<w:styles xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
    R"(<w:docDefaults><w:rPrDefault><w:rPr>)"
    R"(<w:rFonts w:ascii="Calibri" w:hAnsi="Calibri" w:eastAsia="Calibri" w:cs="Calibri"/>)"
    R"(<w:sz w:val="22"/><w:szCs w:val="22"/>)"
    R"(</w:rPr></w:rPrDefault>)"
    R"(<w:pPrDefault><w:pPr><w:spacing w:after="120"/></w:pPr></w:pPrDefault></w:docDefaults>)"
    R"(<w:style w:type="paragraph" w:default="1" w:styleId="Normal"><w:name w:val="Normal"/></w:style>)"
    R"(<w:style w:type="paragraph" w:styleId="Title"><w:name w:val="Title"/><w:basedOn w:val="Normal"/>)"
    R"(<w:pPr><w:jc w:val="center"/></w:pPr><w:rPr><w:b/><w:sz w:val="48"/></w:rPr></w:style>)"
    R"(<w:style w:type="paragraph" w:styleId="Heading1"><w:name w:val="heading 1"/><w:basedOn w:val="Normal"/>)"
    R"(<w:pPr><w:spacing w:before="240"/></w:pPr><w:rPr><w:b/><w:sz w:val="28"/></w:rPr></w:style>)"
    R"(</w:styles>)";

constexpr std::string_view kGrey = "808080";

std::string run(std::string_view text, std::string_view props = {}) {
    std::string r = "<w:r>";
    if (!props.empty()) r += std::format("<w:rPr>{}</w:rPr>", props);
    r += std::format(R"(<w:t xml:space="preserve">{}</w:t></w:r>)", xml_escape(text));
    return r;
}

std::string paragraph(std::string_view runs, std::string_view style = {},
                      std::string_view align = {}) {
    std::string p = "<w:p>";
    if (!style.empty() || !align.empty()) {
        p += "<w:pPr>";
        if (!style.empty()) p += std::format(R"(<w:pStyle w:val="{}"/>)", style);
        if (!align.empty()) p += std::format(R"(<w:jc w:val="{}"/>)", align);
        p += "</w:pPr>";
    }
    p += runs;
    p += "</w:p>";
    return p;
}

std::string table_cell(std::string_view text, bool bold) {
    return std::format(R"(<w:tc><w:tcPr><w:tcW w:w="{}" w:type="dxa"/></w:tcPr>{}</w:tc>)",
                       bold ? 2400 : 6600, paragraph(run(text, bold ? "<w:b/>" : "")));
}

std::string info_table(const DocumentMetadata& meta) {
    const std::pair<std::string_view, const std::string&> rows[] = {
        {"File", meta.file_name},
        {"Duration", meta.duration},
        {"Model", meta.model},
        {"Language", meta.language},
        {"Date", meta.created},
    };

    std::string t = "<w:tbl><w:tblPr><w:tblW w:w=\"9000\" w:type=\"dxa\"/><w:tblBorders>";
    for (std::string_view side : {"top", "left", "bottom", "right", "insideH", "insideV"}) {
        t += std::format(R"(<w:{} w:val="single" w:sz="4" w:space="0" w:color="4F81BD"/>)", side);
    }
    t += "</w:tblBorders></w:tblPr>";
    t += R"(<w:tblGrid><w:gridCol w:w="2400"/><w:gridCol w:w="6600"/></w:tblGrid>)";
    for (const auto& [key, value] : rows) {
        t += "<w:tr>" + table_cell(key, true) + table_cell(value, false) + "</w:tr>";
    }
    t += "</w:tbl>";
    return t;
}

std::string core_xml(const DocumentMetadata& meta) {
    return std::format(
        R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
        "\n"
        R"(<cp:coreProperties xmlns:cp="http://schemas.openxmlformats.org/package/2006/metadata/core-properties" )"
        R"(xmlns:dc="http://purl.org/dc/elements/1.1/">)"
        R"(<dc:title>{}</dc:title><dc:creator>mediascribe</dc:creator><dc:language>{}</dc:language>)"
        R"(</cp:coreProperties>)",
        xml_escape(meta.title), xml_escape(meta.language));
}

} // namespace

std::string xml_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        auto u = static_cast<unsigned char>(c);
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:
                if (u < 0x20 && c != '\t' && c != '\n' && c != '\r') break;
                out += c;
        }
    }
    return out;
}

std::string DocxWriter::document_xml(const std::vector<TranscriptSegment>& segments,
                                     const DocumentMetadata& meta) {
    std::string body;
    body += paragraph(run(meta.title.empty() ? "Transcript" : meta.title), "Title");
    body += paragraph("");
    body += paragraph(run("Information"), "Heading1");
    body += info_table(meta);
    body += paragraph("");
    body += paragraph(run("Transcript"), "Heading1");

    for (const auto& seg : segments) {
        std::string runs;
        if (meta.timestamps) {
            runs += run("[" + format_clock(seg.start_s) + "] ",
                        std::format(R"(<w:color w:val="{}"/><w:sz w:val="18"/>)", kGrey));
        }
        runs += run(seg.text);
        body += paragraph(runs);
    }

    body += paragraph("");
    body += paragraph(run("Generated on " + meta.created + " with mediascribe",
                          std::format(R"(<w:color w:val="{}"/><w:sz w:val="16"/>)", kGrey)),
                      {}, "center");

    return std::string(R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)") + "\n" +
           R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main"><w:body>)" +
           body +
           R"(<w:sectPr><w:pgSz w:w="11906" w:h="16838"/>)"
           R"(<w:pgMar w:top="1440" w:right="1440" w:bottom="1440" w:left="1440"/></w:sectPr>)"
           "</w:body></w:document>";
}

std::expected<std::vector<uint8_t>, std::string>
DocxWriter::render(const std::vector<TranscriptSegment>& segments, const DocumentMetadata& meta) {
    ZipWriter zip;
    const std::pair<std::string_view, std::string> parts[] = {
        {"[Content_Types].xml", std::string(kContentTypes)},
        {"_rels/.rels", std::string(kPackageRels)},
        {"word/_rels/document.xml.rels", std::string(kDocumentRels)},
        {"word/document.xml", document_xml(segments, meta)},
        {"word/styles.xml", std::string(kStyles)},
        {"docProps/core.xml", core_xml(meta)},
    };
    for (const auto& [name, data] : parts) {
        if (auto r = zip.add(name, data); !r) {
            return std::unexpected("docx: " + std::string(name) + ": " + r.error());
        }
    }
    return zip.finish();
}
