#include "splitsheet/reader/WorksheetMetadataParser.hpp"
#include "splitsheet/reader/StylesCatalog.hpp"
#include "splitsheet/core/Exception.hpp"
#include "splitsheet/utils/Logger.hpp"
#include "support/PackageBuilder.hpp"
#include <gtest/gtest.h>

namespace splitsheet {
namespace reader {

using test::PackageBuilder;

class WorksheetMetadataParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/WorksheetMetadataParser_test.log", Logger::Level::DEBUG, false);
        styles_ = StylesCatalog::parse(R"(<styleSheet>
  <fills count="3">
    <fill><patternFill patternType="none"/></fill>
    <fill><patternFill patternType="gray125"/></fill>
    <fill><patternFill patternType="solid"><fgColor rgb="FF00B0F0"/></patternFill></fill>
  </fills>
  <cellXfs count="3">
    <xf numFmtId="0" fillId="0"/>
    <xf numFmtId="2" fillId="0" applyNumberFormat="1"/>
    <xf numFmtId="0" fillId="2" applyFill="1"/>
  </cellXfs>
</styleSheet>)");
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    StylesCatalog styles_;
};

TEST_F(WorksheetMetadataParserTest, CollectsMergedRegions) {
    auto xml = PackageBuilder::worksheetXml("",
        R"(<mergeCell ref="L5:L7"/><mergeCell ref="A1:C2"/>)");
    auto metadata = WorksheetMetadataParser::parse(xml, styles_);

    ASSERT_EQ(metadata.merged_regions.size(), 2u);
    EXPECT_EQ(metadata.merged_regions[0], core::MergedRegion(4, 11, 6, 11));
    EXPECT_EQ(metadata.merged_regions[1], core::MergedRegion(0, 0, 1, 2));

    const core::MergedRegion* region = metadata.findRegion(5, 11);
    ASSERT_NE(region, nullptr);
    EXPECT_EQ(region->rowCount(), 3);
    EXPECT_EQ(metadata.findRegion(7, 11), nullptr);
}

TEST_F(WorksheetMetadataParserTest, InvalidMergeReferenceIsIgnored) {
    auto xml = PackageBuilder::worksheetXml("",
        R"(<mergeCell ref="garbage"/><mergeCell ref="B2:B3"/>)");
    auto metadata = WorksheetMetadataParser::parse(xml, styles_);

    ASSERT_EQ(metadata.merged_regions.size(), 1u);
    EXPECT_EQ(metadata.merged_regions[0], core::MergedRegion(1, 1, 2, 1));
}

TEST_F(WorksheetMetadataParserTest, ExpandsColumnWidthRanges) {
    auto xml = PackageBuilder::worksheetXml("", "",
        R"(<sheetFormatPr defaultColWidth="10.5"/><cols><col min="2" max="4" width="15.25" customWidth="1"/><col min="6" max="6" width="30"/></cols>)");
    auto metadata = WorksheetMetadataParser::parse(xml, styles_);

    EXPECT_DOUBLE_EQ(metadata.default_column_width, 10.5);
    EXPECT_EQ(metadata.column_widths.size(), 4u);
    EXPECT_DOUBLE_EQ(metadata.columnWidth(1), 15.25);
    EXPECT_DOUBLE_EQ(metadata.columnWidth(3), 15.25);
    EXPECT_DOUBLE_EQ(metadata.columnWidth(5), 30.0);
    EXPECT_DOUBLE_EQ(metadata.columnWidth(0), 10.5);
    EXPECT_DOUBLE_EQ(metadata.columnWidth(4), 10.5);
}

TEST_F(WorksheetMetadataParserTest, DefaultWidthWithoutSheetFormat) {
    auto metadata = WorksheetMetadataParser::parse(PackageBuilder::worksheetXml(""), styles_);
    EXPECT_DOUBLE_EQ(metadata.default_column_width, core::WorksheetMetadata::kFallbackColumnWidth);
    EXPECT_TRUE(metadata.column_widths.empty());
}

TEST_F(WorksheetMetadataParserTest, KeepsOnlyNonDefaultStyles) {
    const std::string rows = R"(<row r="1">)" +
        PackageBuilder::numberCell("A1", "1", 0) +
        PackageBuilder::numberCell("B1", "2", 1) +
        PackageBuilder::numberCell("C1", "3", 2) +
        PackageBuilder::numberCell("D1", "4") +
        "</row>";
    auto metadata = WorksheetMetadataParser::parse(PackageBuilder::worksheetXml(rows), styles_);

    EXPECT_EQ(metadata.cell_styles.size(), 2u);
    EXPECT_EQ(metadata.styleAt({0, 0}), nullptr);
    EXPECT_EQ(metadata.styleAt({0, 3}), nullptr);

    const core::CellStyle* number_style = metadata.styleAt({0, 1});
    ASSERT_NE(number_style, nullptr);
    EXPECT_EQ(number_style->number_format, std::optional<std::string>("0.00"));

    const core::CellStyle* fill_style = metadata.styleAt({0, 2});
    ASSERT_NE(fill_style, nullptr);
    EXPECT_EQ(fill_style->background_color, std::optional<std::string>("00B0F0"));
}

TEST_F(WorksheetMetadataParserTest, NormalizesFormulas) {
    const std::string rows = R"(<row r="3">)" +
        PackageBuilder::formulaCell("A3", "SUM(B3:C3)") +
        PackageBuilder::formulaCell("D3", "_xlfn.DISPIMG(&quot;ID_1&quot;,1)") +
        PackageBuilder::numberCell("E3", "7") +
        "</row>";
    auto metadata = WorksheetMetadataParser::parse(PackageBuilder::worksheetXml(rows), styles_);

    ASSERT_EQ(metadata.cell_formulas.size(), 2u);
    EXPECT_EQ(*metadata.formulaAt({2, 0}), "=SUM(B3:C3)");
    EXPECT_EQ(*metadata.formulaAt({2, 3}), "=_xlfn.DISPIMG(\"ID_1\",1)");
    EXPECT_EQ(metadata.formulaAt({2, 4}), nullptr);
}

TEST_F(WorksheetMetadataParserTest, MalformedXmlThrows) {
    EXPECT_THROW(WorksheetMetadataParser::parse("<worksheet><sheetData>", styles_), core::ParseException);
}

}} // namespace splitsheet::reader
