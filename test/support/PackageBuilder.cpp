#include "support/PackageBuilder.hpp"
#include "splitsheet/archive/ZipWriter.hpp"
#include <fmt/format.h>
#include <webp/encode.h>
#include <atomic>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace splitsheet {
namespace test {

namespace {

std::string styleAttribute(int style) {
    return style >= 0 ? fmt::format(R"( s="{}")", style) : std::string();
}

void appendBigEndian(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>(value >> 16));
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

} // namespace

TempDirectory::TempDirectory(const std::string& prefix) {
    static std::atomic<int> counter{0};
    const auto base = std::filesystem::temp_directory_path();
    const auto dir = base / fmt::format("{}_{}_{}", prefix, static_cast<long>(::getpid()), counter++);
    std::filesystem::create_directories(dir);
    path_ = core::Path(dir.u8string());
}

TempDirectory::~TempDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::u8path(path_.string()), ec);
}

PackageBuilder& PackageBuilder::addPart(const std::string& name, std::string content) {
    parts_[name] = std::vector<uint8_t>(content.begin(), content.end());
    return *this;
}

PackageBuilder& PackageBuilder::addBinary(const std::string& name, std::vector<uint8_t> data) {
    parts_[name] = std::move(data);
    return *this;
}

PackageBuilder& PackageBuilder::withWorkbook(const std::string& sheet_name) {
    addPart("xl/workbook.xml", fmt::format(
        R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
        R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" )"
        R"(xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">)"
        R"(<sheets><sheet name="{}" sheetId="1" r:id="rId1"/></sheets></workbook>)", sheet_name));
    addPart("xl/_rels/workbook.xml.rels", relationshipsXml({
        {"rId1", "http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet", "worksheets/sheet1.xml"}
    }));
    return *this;
}

PackageBuilder& PackageBuilder::withSheet(const std::string& sheet_data, const std::string& merge_cells,
                                          const std::string& before_data, const std::string& after_data) {
    return addPart("xl/worksheets/sheet1.xml", worksheetXml(sheet_data, merge_cells, before_data, after_data));
}

PackageBuilder& PackageBuilder::withSharedStrings(const std::vector<std::string>& strings) {
    std::string xml = fmt::format(
        R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
        R"(<sst xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" count="{0}" uniqueCount="{0}">)",
        strings.size());
    for (const auto& text : strings) {
        xml += fmt::format("<si><t>{}</t></si>", text);
    }
    xml += "</sst>";
    return addPart("xl/sharedStrings.xml", std::move(xml));
}

PackageBuilder& PackageBuilder::withStyles(const std::string& styles_xml) {
    return addPart("xl/styles.xml", styles_xml);
}

core::Path PackageBuilder::build(const core::Path& path) const {
    archive::ZipWriter writer(path);
    if (!writer.open()) {
        throw std::runtime_error("cannot create test package " + path.string());
    }
    for (const auto& [name, data] : parts_) {
        if (archive::isError(writer.addFile(name, data.data(), data.size()))) {
            throw std::runtime_error("cannot write part " + name);
        }
    }
    if (!writer.close()) {
        throw std::runtime_error("cannot finish test package " + path.string());
    }
    return path;
}

std::string PackageBuilder::worksheetXml(const std::string& sheet_data, const std::string& merge_cells,
                                         const std::string& before_data, const std::string& after_data) {
    std::string xml =
        R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
        R"(<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" )"
        R"(xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">)";
    xml += before_data;
    xml += "<sheetData>" + sheet_data + "</sheetData>";
    if (!merge_cells.empty()) {
        xml += "<mergeCells>" + merge_cells + "</mergeCells>";
    }
    xml += after_data;
    xml += "</worksheet>";
    return xml;
}

std::string PackageBuilder::numberCell(const std::string& ref, const std::string& value, int style) {
    return fmt::format(R"(<c r="{}"{}><v>{}</v></c>)", ref, styleAttribute(style), value);
}

std::string PackageBuilder::sharedStringCell(const std::string& ref, int index, int style) {
    return fmt::format(R"(<c r="{}"{} t="s"><v>{}</v></c>)", ref, styleAttribute(style), index);
}

std::string PackageBuilder::inlineStringCell(const std::string& ref, const std::string& text, int style) {
    return fmt::format(R"(<c r="{}"{} t="inlineStr"><is><t>{}</t></is></c>)", ref, styleAttribute(style), text);
}

std::string PackageBuilder::formulaCell(const std::string& ref, const std::string& formula, int style) {
    return fmt::format(R"(<c r="{}"{}><f>{}</f><v>0</v></c>)", ref, styleAttribute(style), formula);
}

std::string PackageBuilder::relationshipsXml(const std::vector<std::vector<std::string>>& id_type_target) {
    std::string xml =
        R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
        R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)";
    for (const auto& rel : id_type_target) {
        xml += fmt::format(R"(<Relationship Id="{}" Type="{}" Target="{}"/>)", rel.at(0), rel.at(1), rel.at(2));
    }
    xml += "</Relationships>";
    return xml;
}

std::vector<uint8_t> PackageBuilder::pngHeader(uint32_t width, uint32_t height) {
    std::vector<uint8_t> png = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    appendBigEndian(png, 13);
    png.insert(png.end(), {'I', 'H', 'D', 'R'});
    appendBigEndian(png, width);
    appendBigEndian(png, height);
    png.insert(png.end(), {8, 6, 0, 0, 0});  // 8 位 RGBA
    appendBigEndian(png, 0);                 // CRC（stb_image 不校验）
    appendBigEndian(png, 0);
    png.insert(png.end(), {'I', 'E', 'N', 'D'});
    appendBigEndian(png, 0xAE426082);
    return png;
}

std::vector<uint8_t> PackageBuilder::webpImage(int width, int height) {
    std::vector<uint8_t> rgba;
    rgba.reserve(static_cast<size_t>(width) * static_cast<size_t>(height) * 4);
    for (int i = 0; i < width * height; ++i) {
        rgba.insert(rgba.end(), {0x20, 0x80, 0xE0, 0xFF});
    }

    uint8_t* encoded = nullptr;
    const size_t size = WebPEncodeLosslessRGBA(rgba.data(), width, height, width * 4, &encoded);
    if (size == 0 || !encoded) {
        throw std::runtime_error(fmt::format("WebP encode failed ({}x{})", width, height));
    }
    std::vector<uint8_t> webp(encoded, encoded + size);
    WebPFree(encoded);
    return webp;
}

}} // namespace splitsheet::test
