#include "splitsheet/core/WorkbookWriter.hpp"
#include "splitsheet/core/Exception.hpp"
#include "splitsheet/core/Image.hpp"
#include "splitsheet/core/ProgressLog.hpp"
#include "splitsheet/core/WorksheetMetadata.hpp"
#include "splitsheet/archive/ZipWriter.hpp"
#include "splitsheet/xml/ContentTypes.hpp"
#include "splitsheet/xml/Relationships.hpp"
#include "splitsheet/xml/StyleSerializer.hpp"
#include "splitsheet/xml/WorkbookXMLGenerator.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace splitsheet {
namespace core {

namespace {

constexpr const char* kWorkbookPart = "xl/workbook.xml";
constexpr const char* kWorksheetPart = "xl/worksheets/sheet1.xml";
constexpr const char* kStylesPart = "xl/styles.xml";
constexpr const char* kSharedStringsPart = "xl/sharedStrings.xml";
constexpr const char* kDrawingPart = "xl/drawings/drawing1.xml";
constexpr const char* kDrawingRelsPart = "xl/drawings/_rels/drawing1.xml.rels";
constexpr const char* kSheetRelsPart = "xl/worksheets/_rels/sheet1.xml.rels";
constexpr const char* kDrawingRelationshipId = "rId1";

constexpr const char* kContentTypeWorkbook =
    "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml";
constexpr const char* kContentTypeWorksheet =
    "application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml";
constexpr const char* kContentTypeStyles =
    "application/vnd.openxmlformats-officedocument.spreadsheetml.styles+xml";
constexpr const char* kContentTypeSharedStrings =
    "application/vnd.openxmlformats-officedocument.spreadsheetml.sharedStrings+xml";
constexpr const char* kContentTypeDrawing =
    "application/vnd.openxmlformats-officedocument.drawing+xml";

std::string stripFormulaPrefix(const std::string& formula) {
    if (!formula.empty() && formula.front() == '=') {
        return formula.substr(1);
    }
    return formula;
}

} // namespace

WorkbookWriter::WorkbookWriter(const WorksheetMetadata& metadata, ProgressLog& progress)
    : metadata_(metadata), progress_(progress) {
}

void WorkbookWriter::reset() {
    formats_ = FormatRepository();
    shared_strings_.clear();
    model_ = xml::WorksheetModel();
    drawing_images_.clear();
    media_.clear();
    media_index_.clear();
    failed_images_ = 0;
}

FormatDescriptor WorkbookWriter::formatFor(const StyledCellValue& cell) {
    FormatDescriptor format;
    format.bordered = true;
    format.background_color = cell.style.background_color;
    if (cell.is_weight_cell) {
        format.number_format = "0.00";
    } else if (cell.style.number_format && *cell.style.number_format != "General") {
        format.number_format = cell.style.number_format;
    }
    return format;
}

void WorkbookWriter::build(const CellGrid& grid) {
    reset();

    model_.default_column_width = metadata_.default_column_width;
    model_.row_height = kRowHeight;
    model_.row_count = static_cast<int>(grid.size());

    // 列宽在写单元格之前确定，以第一行的列数为准
    const size_t col_count = grid.empty() ? 0 : grid.front().size();
    for (size_t col = 0; col < col_count; ++col) {
        model_.column_widths[static_cast<int>(col)] = metadata_.columnWidth(static_cast<int>(col));
    }

    size_t image_count = 0;
    for (const auto& row : grid) {
        for (const auto& cell : row) {
            if (cell.image) {
                ++image_count;
            }
        }
    }
    if (image_count > 0) {
        progress_.addf("发现 {} 个图片待嵌入", image_count);
    }

    for (size_t r = 0; r < grid.size(); ++r) {
        const int row = static_cast<int>(r);
        auto& cells = model_.rows[row];
        cells.reserve(grid[r].size());

        for (size_t c = 0; c < grid[r].size(); ++c) {
            const int col = static_cast<int>(c);
            const StyledCellValue& value = grid[r][c];

            if (value.image) {
                auto embedded = embedImage(row, col, *value.image);
                if (!embedded) {
                    ++failed_images_;
                    progress_.addf("嵌入图片失败 ({}, {}): {}", row + 1, col + 1, embedded.error().fullMessage());
                }
                // 图片单元格本身只保留格式
                xml::WorksheetCell blank;
                blank.col = col;
                blank.format_id = formats_.addFormat(formatFor(value));
                cells.push_back(std::move(blank));
                continue;
            }

            cells.push_back(makeCell(col, value));
        }
    }

    if (!drawing_images_.empty()) {
        model_.drawing_relationship_id = kDrawingRelationshipId;
    }

    auto stats = formats_.getDeduplicationStats();
    CORE_DEBUG("Built worksheet: {} rows, {} columns, {} formats ({} requests), {} strings, {} images, {} media",
               model_.row_count, col_count, stats.unique_formats, stats.total_requests,
               shared_strings_.size(), drawing_images_.size(), media_.size());
}

xml::WorksheetCell WorkbookWriter::makeCell(int col, const StyledCellValue& value) {
    xml::WorksheetCell cell;
    cell.col = col;
    cell.format_id = formats_.addFormat(formatFor(value));

    switch (value.value.type()) {
        case CellValue::Type::Empty:
            cell.type = xml::WorksheetCell::Type::Blank;
            break;
        case CellValue::Type::String:
            cell.type = xml::WorksheetCell::Type::SharedString;
            cell.string_index = shared_strings_.addString(value.value.asString());
            break;
        case CellValue::Type::Number:
            cell.type = xml::WorksheetCell::Type::Number;
            cell.number = value.value.asNumber();
            break;
        case CellValue::Type::Integer:
            cell.type = xml::WorksheetCell::Type::Number;
            cell.number = static_cast<double>(value.value.asInteger());
            break;
        case CellValue::Type::Formula:
            cell.type = xml::WorksheetCell::Type::Formula;
            cell.formula = stripFormulaPrefix(value.value.formulaText());
            break;
    }
    return cell;
}

VoidResult WorkbookWriter::embedImage(int row, int col, const EmbeddedImage& image) {
    if (!image.bytes || image.bytes->empty()) {
        return makeError(ErrorCode::ImageTooSmall, "图片数据为空");
    }
    if (image.bytes->size() < kMinImageSize) {
        return makeError(ErrorCode::ImageTooSmall, "图片数据太短，无法识别格式");
    }

    int width = 0;
    int height = 0;
    if (!ImageUtils::readDimensions(*image.bytes, width, height)) {
        return makeError(ErrorCode::ImageDecodeFailed,
                         fmt::format("无法读取图片尺寸 ({})", image.id));
    }

    double scaled_width = 0.0;
    double scaled_height = 0.0;
    ImageUtils::fitInto(width, height, kImageBox, scaled_width, scaled_height);

    const MediaEntry& media = mediaFor(image);

    xml::DrawingImage drawing;
    drawing.anchor = ImageAnchor(row, col, scaled_width, scaled_height, kImageOffsetX, kImageOffsetY);
    drawing.name = fmt::format("Picture {}", drawing_images_.size() + 1);
    drawing.media_file = media.file_name;
    drawing_images_.push_back(std::move(drawing));

    CORE_DEBUG("Embedded image {} at ({}, {}): {}x{} -> {:.1f}x{:.1f} as {}",
               image.id, row + 1, col + 1, width, height, scaled_width, scaled_height, media.file_name);
    return success();
}

const WorkbookWriter::MediaEntry& WorkbookWriter::mediaFor(const EmbeddedImage& image) {
    auto it = media_index_.find(image.bytes.get());
    if (it != media_index_.end()) {
        return media_[it->second];
    }

    MediaEntry entry;
    entry.extension = image.extension.empty() ? "png" : image.extension;
    entry.file_name = fmt::format("image{}.{}", media_.size() + 1, entry.extension);
    entry.bytes = image.bytes;

    media_index_.emplace(image.bytes.get(), media_.size());
    media_.push_back(std::move(entry));
    return media_.back();
}

void WorkbookWriter::write(const CellGrid& grid, const Path& output_path) {
    build(grid);
    progress_.add("保存文件...");
    save(output_path);
}

void WorkbookWriter::save(const Path& output_path) const {
    const Path temp_path(output_path.string() + ".tmp");
    if (temp_path.exists()) {
        temp_path.remove();
    }

    try {
        writePackage(temp_path);
    } catch (...) {
        // 不留下半成品，异常继续向上传播
        temp_path.remove();
        throw;
    }

    if (!temp_path.moveTo(output_path)) {
        temp_path.remove();
        throw WriteException(fmt::format("保存 Excel 文件失败: 无法移动到 {}", output_path.string()),
                             output_path.string(), __FILE__, __LINE__);
    }
    CORE_INFO("Workbook written: {}", output_path.string());
}

void WorkbookWriter::writePackage(const Path& path) const {
    archive::ZipWriter zip(path);
    if (!zip.open()) {
        throw WriteException(fmt::format("保存 Excel 文件失败: 无法创建 {}", path.string()),
                             path.string(), __FILE__, __LINE__);
    }

    auto addPart = [&](const std::string& name, std::string_view content) {
        archive::ZipError result = zip.addFile(name, content);
        if (!archive::isSuccess(result)) {
            throw WriteException(fmt::format("保存 Excel 文件失败: 写入 {} 出错 ({})", name,
                                             archive::toString(result)),
                                 path.string(), __FILE__, __LINE__);
        }
    };

    addPart("[Content_Types].xml", generateContentTypes());
    addPart("_rels/.rels", generateRootRelationships());
    addPart(kWorkbookPart, xml::WorkbookXMLGenerator({kSheetName}).generate());
    addPart("xl/_rels/workbook.xml.rels", generateWorkbookRelationships());
    addPart(kStylesPart, xml::StyleSerializer::serialize(formats_));
    addPart(kSharedStringsPart, shared_strings_.generate());
    addPart(kWorksheetPart, xml::WorksheetXMLGenerator(model_).generate());

    if (!drawing_images_.empty()) {
        xml::DrawingXMLGenerator drawing(drawing_images_);
        addPart(kSheetRelsPart, generateSheetRelationships());
        addPart(kDrawingPart, drawing.generateDrawingXML());
        addPart(kDrawingRelsPart, drawing.generateDrawingRelsXML());

        for (const auto& media : media_) {
            const std::string name = "xl/media/" + media.file_name;
            archive::ZipError result = zip.addFile(name, media.bytes->data(), media.bytes->size());
            if (!archive::isSuccess(result)) {
                throw WriteException(fmt::format("保存 Excel 文件失败: 写入 {} 出错 ({})", name,
                                                 archive::toString(result)),
                                     path.string(), __FILE__, __LINE__);
            }
        }
    }

    if (!zip.close()) {
        throw WriteException(fmt::format("保存 Excel 文件失败: 无法完成 {}", path.string()),
                             path.string(), __FILE__, __LINE__);
    }

    auto stats = zip.getStats();
    CORE_DEBUG("Package {}: {} entries, {} bytes", path.string(), stats.entries_written, stats.bytes_written);
}

std::string WorkbookWriter::generateContentTypes() const {
    xml::ContentTypes content_types;
    content_types.addExcelDefaults();
    if (!drawing_images_.empty()) {
        for (const auto& media : media_) {
            content_types.addDefault(media.extension, ImageUtils::mimeTypeForExtension(media.extension));
        }
    }

    content_types.addOverride(std::string("/") + kWorkbookPart, kContentTypeWorkbook);
    content_types.addOverride(std::string("/") + kWorksheetPart, kContentTypeWorksheet);
    content_types.addOverride(std::string("/") + kStylesPart, kContentTypeStyles);
    content_types.addOverride(std::string("/") + kSharedStringsPart, kContentTypeSharedStrings);
    if (!drawing_images_.empty()) {
        content_types.addOverride(std::string("/") + kDrawingPart, kContentTypeDrawing);
    }
    return content_types.generate();
}

std::string WorkbookWriter::generateRootRelationships() {
    xml::Relationships rels;
    rels.addRelationship("rId1", xml::rel_type::kOfficeDocument, kWorkbookPart);
    return rels.generate();
}

std::string WorkbookWriter::generateWorkbookRelationships() {
    xml::Relationships rels;
    rels.addRelationship("rId1", xml::rel_type::kWorksheet, "worksheets/sheet1.xml");
    rels.addRelationship("rId2", xml::rel_type::kStyles, "styles.xml");
    rels.addRelationship("rId3", xml::rel_type::kSharedStrings, "sharedStrings.xml");
    return rels.generate();
}

std::string WorkbookWriter::generateSheetRelationships() {
    xml::Relationships rels;
    rels.addRelationship(kDrawingRelationshipId, xml::rel_type::kDrawing, "../drawings/drawing1.xml");
    return rels.generate();
}

}} // namespace splitsheet::core
