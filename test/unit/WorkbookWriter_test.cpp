#include "splitsheet/core/WorkbookWriter.hpp"
#include "splitsheet/core/ProgressLog.hpp"
#include "splitsheet/core/WorksheetMetadata.hpp"
#include "splitsheet/archive/PackageArchive.hpp"
#include "splitsheet/reader/SheetValueReader.hpp"
#include "splitsheet/reader/StylesCatalog.hpp"
#include "splitsheet/reader/WorksheetMetadataParser.hpp"
#include "splitsheet/utils/Logger.hpp"
#include "support/PackageBuilder.hpp"
#include <gtest/gtest.h>

namespace splitsheet {
namespace core {

namespace {

StyledCellValue valueCell(CellValue value) {
    StyledCellValue cell;
    cell.value = std::move(value);
    return cell;
}

StyledCellValue weightCell(double weight, std::optional<std::string> color = std::nullopt) {
    StyledCellValue cell;
    cell.value = CellValue::number(weight);
    cell.style.background_color = std::move(color);
    cell.is_weight_cell = true;
    return cell;
}

StyledCellValue imageCell(EmbeddedImage image) {
    StyledCellValue cell;
    cell.image = std::move(image);
    return cell;
}

} // namespace

class WorkbookWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/WorkbookWriter_test.log", Logger::Level::DEBUG, false);
        metadata_.default_column_width = 9.0;
        metadata_.column_widths[1] = 25.5;
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    WorksheetMetadata metadata_;
    ProgressLog progress_;
    test::TempDirectory temp_{"workbook_writer"};
};

TEST_F(WorkbookWriterTest, FormatForWeightCellForcesTwoDecimals) {
    StyledCellValue weight = weightCell(20.0, std::string("FFFF00"));
    weight.style.number_format = "0.000";

    auto format = WorkbookWriter::formatFor(weight);
    EXPECT_TRUE(format.bordered);
    EXPECT_EQ(format.number_format, std::optional<std::string>("0.00"));
    EXPECT_EQ(format.background_color, std::optional<std::string>("FFFF00"));
}

TEST_F(WorkbookWriterTest, FormatForKeepsSourceFormatExceptGeneral) {
    StyledCellValue general = valueCell(CellValue::integer(1));
    general.style.number_format = "General";
    EXPECT_FALSE(WorkbookWriter::formatFor(general).number_format.has_value());

    StyledCellValue percent = valueCell(CellValue::number(0.5));
    percent.style.number_format = "0%";
    EXPECT_EQ(WorkbookWriter::formatFor(percent).number_format, std::optional<std::string>("0%"));
    EXPECT_FALSE(WorkbookWriter::formatFor(percent).background_color.has_value());
}

TEST_F(WorkbookWriterTest, BuildsWorksheetModel) {
    CellGrid grid = {
        {valueCell(CellValue::string("品名")), valueCell(CellValue::string("数量")),
         valueCell(CellValue::formula("=B2*2"))},
        {valueCell(CellValue::string("品名")), valueCell(CellValue::integer(3)), weightCell(12.5)},
    };

    WorkbookWriter writer(metadata_, progress_);
    writer.build(grid);

    const auto& model = writer.worksheetModel();
    EXPECT_EQ(model.row_count, 2);
    EXPECT_DOUBLE_EQ(model.row_height, 20.0);
    EXPECT_DOUBLE_EQ(model.default_column_width, 9.0);
    ASSERT_EQ(model.column_widths.size(), 3u);
    EXPECT_DOUBLE_EQ(model.column_widths.at(0), 9.0);
    EXPECT_DOUBLE_EQ(model.column_widths.at(1), 25.5);
    EXPECT_TRUE(model.drawing_relationship_id.empty());

    const auto& first = model.rows.at(0);
    ASSERT_EQ(first.size(), 3u);
    EXPECT_EQ(first[0].type, xml::WorksheetCell::Type::SharedString);
    EXPECT_EQ(first[2].type, xml::WorksheetCell::Type::Formula);
    EXPECT_EQ(first[2].formula, "B2*2");

    const auto& second = model.rows.at(1);
    EXPECT_EQ(second[0].string_index, first[0].string_index);
    EXPECT_EQ(second[1].type, xml::WorksheetCell::Type::Number);
    EXPECT_DOUBLE_EQ(second[1].number, 3.0);

    EXPECT_EQ(writer.sharedStrings().size(), 2u);
    EXPECT_EQ(writer.formats().getFormat(second[2].format_id).number_format, std::optional<std::string>("0.00"));
    EXPECT_EQ(first[0].format_id, first[1].format_id);
    EXPECT_NE(first[0].format_id, 0);
    EXPECT_TRUE(progress_.empty());
}

TEST_F(WorkbookWriterTest, ShortImageDegradesToBlankCell) {
    CellGrid grid = {
        {valueCell(CellValue::string("A")), imageCell(EmbeddedImage("ID_TINY", {0x89, 'P', 'N', 'G'}, "png")),
         valueCell(CellValue::integer(5))},
    };

    WorkbookWriter writer(metadata_, progress_);
    writer.build(grid);

    EXPECT_EQ(writer.getFailedImageCount(), 1u);
    EXPECT_TRUE(writer.drawingImages().empty());
    EXPECT_EQ(writer.getMediaCount(), 0u);
    EXPECT_TRUE(writer.worksheetModel().drawing_relationship_id.empty());

    const auto& cells = writer.worksheetModel().rows.at(0);
    ASSERT_EQ(cells.size(), 3u);
    EXPECT_EQ(cells[1].type, xml::WorksheetCell::Type::Blank);
    EXPECT_TRUE(writer.formats().getFormat(cells[1].format_id).bordered);
    EXPECT_EQ(cells[2].type, xml::WorksheetCell::Type::Number);

    size_t failures = 0;
    for (const auto& line : progress_.lines()) {
        if (line.find("嵌入图片失败") != std::string::npos) {
            ++failures;
            EXPECT_EQ(line, "嵌入图片失败 (1, 2): 图片数据太短，无法识别格式");
        }
    }
    EXPECT_EQ(failures, 1u);

    const core::Path output = temp_.file("scenario_c.xlsx");
    writer.save(output);
    archive::PackageArchive archive(output);
    EXPECT_FALSE(archive.hasPart("xl/drawings/drawing1.xml"));
    EXPECT_TRUE(archive.hasPart("xl/worksheets/sheet1.xml"));
}

TEST_F(WorkbookWriterTest, EmbedsImageScaledIntoBox) {
    EmbeddedImage wide("ID_WIDE", test::PackageBuilder::pngHeader(40, 20), "png");
    CellGrid grid = {
        {valueCell(CellValue::string("A")), imageCell(wide)},
        {valueCell(CellValue::string("B")), imageCell(wide)},
    };

    WorkbookWriter writer(metadata_, progress_);
    writer.build(grid);

    ASSERT_EQ(writer.drawingImages().size(), 2u);
    EXPECT_EQ(writer.getMediaCount(), 1u);
    EXPECT_EQ(writer.worksheetModel().drawing_relationship_id, "rId1");
    EXPECT_TRUE(progress_.contains("发现 2 个图片待嵌入"));

    const auto& first = writer.drawingImages()[0];
    EXPECT_EQ(first.anchor.from_row, 0);
    EXPECT_EQ(first.anchor.from_col, 1);
    EXPECT_EQ(first.anchor.to_row, 0);
    EXPECT_EQ(first.anchor.to_col, 1);
    EXPECT_DOUBLE_EQ(first.anchor.width, 18.0);
    EXPECT_DOUBLE_EQ(first.anchor.height, 9.0);
    EXPECT_DOUBLE_EQ(first.anchor.offset_x, 21.0);
    EXPECT_DOUBLE_EQ(first.anchor.offset_y, 4.0);
    EXPECT_EQ(first.media_file, "image1.png");
    EXPECT_EQ(first.name, "Picture 1");
    EXPECT_EQ(writer.drawingImages()[1].anchor.from_row, 1);
    EXPECT_EQ(writer.drawingImages()[1].media_file, "image1.png");
}

TEST_F(WorkbookWriterTest, UndecodableImageIsReported) {
    WorkbookWriter writer(metadata_, progress_);
    auto result = writer.embedImage(0, 0, EmbeddedImage("ID_BAD", {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'g'}, "png"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ImageDecodeFailed);
    EXPECT_TRUE(writer.drawingImages().empty());
    EXPECT_EQ(writer.getMediaCount(), 0u);
}

TEST_F(WorkbookWriterTest, SavedWorkbookReadsBack) {
    EmbeddedImage photo("ID_PHOTO", test::PackageBuilder::pngHeader(12, 24), "png");
    CellGrid grid = {
        {valueCell(CellValue::string("箱号")), weightCell(20.0, std::string("FFFF00")), imageCell(photo)},
        {valueCell(CellValue::string("箱号")), weightCell(30.0), valueCell(CellValue::empty())},
    };

    const core::Path output = temp_.file("round_trip.xlsx");
    WorkbookWriter writer(metadata_, progress_);
    writer.write(grid, output);

    EXPECT_TRUE(output.exists());
    EXPECT_FALSE(core::Path(output.string() + ".tmp").exists());
    EXPECT_TRUE(progress_.contains("保存文件..."));

    archive::PackageArchive archive(output);
    for (const char* part : {"[Content_Types].xml", "_rels/.rels", "xl/workbook.xml", "xl/_rels/workbook.xml.rels",
                             "xl/styles.xml", "xl/sharedStrings.xml", "xl/worksheets/sheet1.xml",
                             "xl/worksheets/_rels/sheet1.xml.rels", "xl/drawings/drawing1.xml",
                             "xl/drawings/_rels/drawing1.xml.rels", "xl/media/image1.png"}) {
        EXPECT_TRUE(archive.hasPart(part)) << part;
    }
    EXPECT_EQ(archive.readBytes("xl/media/image1.png"), *photo.bytes);

    auto values = reader::SheetValueReader::open(archive);
    EXPECT_EQ(values.rowCount(), 2);
    EXPECT_EQ(values.getString(0, 0), "箱号");
    EXPECT_DOUBLE_EQ(values.getFloat(0, 1).value(), 20.0);
    EXPECT_DOUBLE_EQ(values.getFloat(1, 1).value(), 30.0);

    auto styles = reader::StylesCatalog::parse(archive.readText("xl/styles.xml"));
    auto metadata = reader::WorksheetMetadataParser::parse(archive.readText("xl/worksheets/sheet1.xml"), styles);
    const CellStyle* weight_style = metadata.styleAt({0, 1});
    ASSERT_NE(weight_style, nullptr);
    EXPECT_EQ(weight_style->number_format, std::optional<std::string>("0.00"));
    EXPECT_EQ(weight_style->background_color, std::optional<std::string>("FFFF00"));
    EXPECT_DOUBLE_EQ(metadata.columnWidth(1), 25.5);
}

TEST_F(WorkbookWriterTest, SaveOverwritesExistingOutput) {
    const core::Path output = temp_.file("existing.xlsx");
    CellGrid grid = {{valueCell(CellValue::string("first"))}};

    WorkbookWriter writer(metadata_, progress_);
    writer.write(grid, output);
    CellGrid replacement = {{valueCell(CellValue::string("second"))}};
    writer.write(replacement, output);

    archive::PackageArchive archive(output);
    auto values = reader::SheetValueReader::open(archive);
    EXPECT_EQ(values.getString(0, 0), "second");
}

}} // namespace splitsheet::core
