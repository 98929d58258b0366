#include "splitsheet/archive/PackageArchive.hpp"
#include "splitsheet/core/Exception.hpp"
#include "splitsheet/utils/Logger.hpp"
#include "support/PackageBuilder.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <fstream>

namespace splitsheet {
namespace archive {

class PackageArchiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/PackageArchive_test.log", Logger::Level::DEBUG, false);
        package_ = test::PackageBuilder()
            .withWorkbook()
            .withSheet(test::PackageBuilder::numberCell("A1", "1"))
            .addBinary("xl/media/image1.png", test::PackageBuilder::pngHeader(4, 4))
            .build(temp_.file("book.xlsx"));
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    test::TempDirectory temp_{"package_archive"};
    core::Path package_;
};

TEST_F(PackageArchiveTest, ReadsRequiredAndOptionalParts) {
    PackageArchive archive(package_);

    EXPECT_TRUE(archive.hasPart("xl/workbook.xml"));
    EXPECT_FALSE(archive.hasPart("xl/sharedStrings.xml"));

    const std::string sheet = archive.readText("xl/worksheets/sheet1.xml");
    EXPECT_NE(sheet.find("<sheetData>"), std::string::npos);

    EXPECT_FALSE(archive.tryReadText("xl/styles.xml").has_value());

    auto image = archive.tryReadBytes("xl/media/image1.png");
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(*image, test::PackageBuilder::pngHeader(4, 4));
}

TEST_F(PackageArchiveTest, ListsEveryPart) {
    PackageArchive archive(package_);
    auto parts = archive.listParts();

    for (const char* expected : {"xl/workbook.xml", "xl/_rels/workbook.xml.rels",
                                 "xl/worksheets/sheet1.xml", "xl/media/image1.png"}) {
        EXPECT_NE(std::find(parts.begin(), parts.end(), expected), parts.end()) << expected;
    }
}

TEST_F(PackageArchiveTest, MissingRequiredPartThrows) {
    PackageArchive archive(package_);
    try {
        archive.readText("xl/worksheets/sheet9.xml");
        FAIL() << "expected FileException";
    } catch (const core::FileException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::MissingPart);
        EXPECT_EQ(e.getCategory(), core::ErrorCategory::FileError);
    }
}

TEST_F(PackageArchiveTest, OpeningMissingFileThrows) {
    EXPECT_THROW(PackageArchive(temp_.file("absent.xlsx")), core::FileException);
}

TEST_F(PackageArchiveTest, OpeningNonZipThrows) {
    const core::Path text_file = temp_.file("plain.xlsx");
    {
        std::ofstream out(text_file.string());
        out << "this is not a zip archive";
    }
    try {
        PackageArchive archive(text_file);
        FAIL() << "expected FileException";
    } catch (const core::FileException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::FileCorrupted);
    }
}

}} // namespace splitsheet::archive
