#include "splitsheet/reader/SheetValueReader.hpp"
#include "splitsheet/reader/SharedStringsParser.hpp"
#include "splitsheet/archive/PackageArchive.hpp"
#include "splitsheet/core/Exception.hpp"
#include "splitsheet/utils/Logger.hpp"
#include "support/PackageBuilder.hpp"
#include <gtest/gtest.h>

namespace splitsheet {
namespace reader {

using test::PackageBuilder;

class SheetValueReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/SheetValueReader_test.log", Logger::Level::DEBUG, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    test::TempDirectory temp_{"sheet_value_reader"};
};

TEST_F(SheetValueReaderTest, ReadsEveryCellKind) {
    const std::string rows =
        R"(<row r="1">)" +
        PackageBuilder::sharedStringCell("A1", 1) +
        PackageBuilder::inlineStringCell("B1", "内联") +
        R"(<c r="C1" t="b"><v>1</v></c>)" +
        R"(<c r="D1" t="e"><v>#DIV/0!</v></c>)" +
        PackageBuilder::numberCell("E1", "5.0") +
        PackageBuilder::numberCell("F1", "0.25") +
        R"(<c r="G1" t="str"><f>A1&amp;B1</f><v>箱号内联</v></c>)" +
        "</row>";

    auto path = PackageBuilder()
        .withWorkbook()
        .withSheet(rows)
        .withSharedStrings({"箱号", "品名"})
        .build(temp_.file("kinds.xlsx"));

    archive::PackageArchive archive(path);
    auto reader = SheetValueReader::open(archive);

    EXPECT_EQ(reader.getString(0, 0), "品名");
    EXPECT_EQ(reader.getString(0, 1), "内联");
    EXPECT_EQ(reader.getString(0, 2), "true");
    EXPECT_TRUE(reader.isEmpty(0, 3));
    EXPECT_EQ(reader.getString(0, 4), "5");
    EXPECT_DOUBLE_EQ(reader.getFloat(0, 4).value(), 5.0);
    EXPECT_EQ(reader.getString(0, 5), "0.25");
    EXPECT_EQ(reader.getString(0, 6), "箱号内联");
    EXPECT_FALSE(reader.getFloat(0, 0).has_value());
}

TEST_F(SheetValueReaderTest, BoundsFollowHighestPopulatedCell) {
    SheetValueReader reader;
    reader.load(PackageBuilder::worksheetXml(
        R"(<row r="2">)" + PackageBuilder::numberCell("B2", "1") + "</row>" +
        R"(<row r="7">)" + PackageBuilder::numberCell("M7", "3") + "</row>"), nullptr);

    EXPECT_EQ(reader.rowCount(), 7);
    EXPECT_EQ(reader.colCount(), 13);
    EXPECT_EQ(reader.getCellCount(), 2u);
    EXPECT_TRUE(reader.isEmpty(0, 0));
    EXPECT_TRUE(reader.isEmpty(100, 100));
    EXPECT_EQ(reader.getString(6, 12), "3");
}

TEST_F(SheetValueReaderTest, CellsWithoutReferenceUsePosition) {
    SheetValueReader reader;
    reader.load(PackageBuilder::worksheetXml(
        "<row><c><v>1</v></c><c><v>2</v></c></row><row><c><v>3</v></c></row>"), nullptr);

    EXPECT_EQ(reader.getString(0, 0), "1");
    EXPECT_EQ(reader.getString(0, 1), "2");
    EXPECT_EQ(reader.getString(1, 0), "3");
}

TEST_F(SheetValueReaderTest, SharedStringOutOfRangeIsSkipped) {
    SharedStringsParser strings;
    strings.parse(R"(<sst><si><t>only</t></si></sst>)");

    SheetValueReader reader;
    reader.load(PackageBuilder::worksheetXml(
        R"(<row r="1">)" + PackageBuilder::sharedStringCell("A1", 5) +
        PackageBuilder::sharedStringCell("B1", 0) + "</row>"), &strings);

    EXPECT_TRUE(reader.isEmpty(0, 0));
    EXPECT_EQ(reader.getString(0, 1), "only");
}

TEST_F(SheetValueReaderTest, FallsBackToFirstSheetPartWithoutWorkbook) {
    auto path = PackageBuilder()
        .withSheet(R"(<row r="1">)" + PackageBuilder::numberCell("A1", "42") + "</row>")
        .build(temp_.file("no_workbook.xlsx"));

    archive::PackageArchive archive(path);
    auto reader = SheetValueReader::open(archive);

    EXPECT_EQ(reader.sheetPart(), "xl/worksheets/sheet1.xml");
    EXPECT_EQ(reader.getString(0, 0), "42");
}

TEST_F(SheetValueReaderTest, MissingWorksheetIsFatal) {
    auto path = PackageBuilder()
        .withWorkbook()
        .build(temp_.file("no_sheet.xlsx"));

    archive::PackageArchive archive(path);
    EXPECT_THROW(SheetValueReader::open(archive), core::FileException);
}

}} // namespace splitsheet::reader
