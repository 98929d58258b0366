#include "splitsheet/reader/ImageReferenceGraph.hpp"
#include "splitsheet/reader/MediaLibrary.hpp"
#include "splitsheet/archive/PackageArchive.hpp"
#include "splitsheet/core/Exception.hpp"
#include "splitsheet/utils/Logger.hpp"
#include "support/PackageBuilder.hpp"
#include <gtest/gtest.h>

namespace splitsheet {
namespace reader {

using test::PackageBuilder;

namespace {

const char* kImageRelType = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/image";

std::string cellImagesXml(const std::vector<std::pair<std::string, std::string>>& name_embed) {
    std::string xml =
        R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
        R"(<etc:cellImages xmlns:etc="http://www.wps.cn/officeDocument/2017/etCustomData" )"
        R"(xmlns:xdr="http://schemas.openxmlformats.org/drawingml/2006/spreadsheetDrawing" )"
        R"(xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main" )"
        R"(xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">)";
    for (const auto& [name, embed] : name_embed) {
        xml += "<etc:cellImage><xdr:pic><xdr:nvPicPr><xdr:cNvPr id=\"1\" name=\"" + name +
               "\"/></xdr:nvPicPr><xdr:blipFill><a:blip r:embed=\"" + embed +
               "\"/></xdr:blipFill></xdr:pic></etc:cellImage>";
    }
    xml += "</etc:cellImages>";
    return xml;
}

std::string anchorXml(const char* kind, int row, int col, const std::string& name, const std::string& embed) {
    return std::string("<xdr:") + kind + ">" +
           "<xdr:from><xdr:col>" + std::to_string(col) + "</xdr:col><xdr:colOff>0</xdr:colOff><xdr:row>" +
           std::to_string(row) + "</xdr:row><xdr:rowOff>0</xdr:rowOff></xdr:from>" +
           "<xdr:to><xdr:col>" + std::to_string(col + 1) + "</xdr:col><xdr:row>" + std::to_string(row + 1) +
           "</xdr:row></xdr:to>" +
           "<xdr:pic><xdr:nvPicPr><xdr:cNvPr id=\"2\" name=\"" + name + "\"/></xdr:nvPicPr>" +
           "<xdr:blipFill><a:blip r:embed=\"" + embed + "\"/></xdr:blipFill></xdr:pic>" +
           "<xdr:clientData/></xdr:" + kind + ">";
}

std::string drawingXml(const std::string& anchors) {
    return R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
           R"(<xdr:wsDr xmlns:xdr="http://schemas.openxmlformats.org/drawingml/2006/spreadsheetDrawing" )"
           R"(xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main" )"
           R"(xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">)" +
           anchors + "</xdr:wsDr>";
}

} // namespace

class ImageReferenceGraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/ImageReferenceGraph_test.log", Logger::Level::DEBUG, false);
        media_.add("image1.png", PackageBuilder::pngHeader(40, 20));
        media_.add("image2.png", PackageBuilder::pngHeader(10, 30));
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    MediaLibrary media_;
};

TEST_F(ImageReferenceGraphTest, ExtractsImageIdFromDispimg) {
    EXPECT_EQ(ImageReferenceGraph::extractImageId("=DISPIMG(\"ID_ABC\",1)"), std::optional<std::string>("ID_ABC"));
    EXPECT_EQ(ImageReferenceGraph::extractImageId("=_xlfn.DISPIMG(\"ID_1F2E\",1)"), std::optional<std::string>("ID_1F2E"));
    EXPECT_FALSE(ImageReferenceGraph::extractImageId("=SUM(A1:A3)").has_value());
    EXPECT_FALSE(ImageReferenceGraph::extractImageId("=DISPIMG(\"ID_OPEN").has_value());

    EXPECT_TRUE(ImageReferenceGraph::isImageFormula("=DISPIMG(\"ID_ABC\",1)"));
    EXPECT_FALSE(ImageReferenceGraph::isImageFormula("=A1*2"));
}

TEST_F(ImageReferenceGraphTest, ResolvesCellImageChain) {
    ImageReferenceGraph graph(media_);
    graph.parseCellImages(cellImagesXml({{"ID_ABC", "rId1"}, {"ID_DEF", "rId2"}}));
    graph.parseCellImageRelationships(PackageBuilder::relationshipsXml({
        {"rId1", kImageRelType, "media/image1.png"},
        {"rId2", kImageRelType, "media/missing.png"}
    }));

    EXPECT_EQ(graph.getCellImageCount(), 2u);

    auto image = graph.resolveFormulaImage("=DISPIMG(\"ID_ABC\",1)");
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->id, "ID_ABC");
    EXPECT_EQ(image->extension, "png");
    EXPECT_EQ(*image->bytes, PackageBuilder::pngHeader(40, 20));

    EXPECT_FALSE(graph.resolveFormulaImage("=DISPIMG(\"ID_DEF\",1)").has_value());
    EXPECT_FALSE(graph.resolveFormulaImage("=DISPIMG(\"ID_NONE\",1)").has_value());
}

TEST_F(ImageReferenceGraphTest, FallsBackToDrawingMaps) {
    ImageReferenceGraph graph(media_);
    graph.parseDrawing(drawingXml(anchorXml("oneCellAnchor", 4, 2, "ID_XYZ", "rId5")));
    graph.parseDrawingRelationships(PackageBuilder::relationshipsXml({
        {"rId5", kImageRelType, "../media/image2.png"}
    }), "xl/drawings/_rels/drawing1.xml.rels");

    EXPECT_EQ(graph.getCellImageCount(), 0u);
    EXPECT_EQ(graph.getDrawingImageCount(), 1u);

    auto image = graph.resolveFormulaImage("=DISPIMG(\"ID_XYZ\",1)");
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(*image->bytes, PackageBuilder::pngHeader(10, 30));
}

TEST_F(ImageReferenceGraphTest, CollectsFloatingAnchors) {
    ImageReferenceGraph graph(media_);
    graph.parseDrawing(drawingXml(
        anchorXml("twoCellAnchor", 3, 5, "图片 1", "rId1") +
        anchorXml("oneCellAnchor", 7, 0, "ID_SECOND", "rId2")));
    graph.parseDrawingRelationships(PackageBuilder::relationshipsXml({
        {"rId1", kImageRelType, "../media/image1.png"},
        {"rId2", kImageRelType, "../media/image2.png"}
    }), "xl/drawings/_rels/drawing1.xml.rels");

    const auto& anchors = graph.resolveFloatingImages();
    ASSERT_EQ(anchors.size(), 2u);
    EXPECT_EQ(anchors[0].row, 3);
    EXPECT_EQ(anchors[0].col, 5);
    EXPECT_EQ(anchors[0].relationship_id, "rId1");
    EXPECT_EQ(anchors[1].row, 7);
    EXPECT_EQ(anchors[1].col, 0);

    // 只有 ID_ 开头的名字进入 ID 映射
    EXPECT_EQ(graph.getDrawingImageCount(), 1u);

    auto image = graph.resolveFloatingImage(anchors[0]);
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->id, "floating_3_5_rId1");
}

TEST_F(ImageReferenceGraphTest, LinkIntoPrefersFormulaImages) {
    ImageReferenceGraph graph(media_);
    graph.parseCellImages(cellImagesXml({{"ID_ABC", "rId1"}}));
    graph.parseCellImageRelationships(PackageBuilder::relationshipsXml({
        {"rId1", kImageRelType, "media/image1.png"}
    }));
    graph.parseDrawing(drawingXml(
        anchorXml("twoCellAnchor", 1, 1, "Picture 1", "rId9") +
        anchorXml("twoCellAnchor", 2, 3, "Picture 2", "rId9")));
    graph.parseDrawingRelationships(PackageBuilder::relationshipsXml({
        {"rId9", kImageRelType, "../media/image2.png"}
    }), "xl/drawings/_rels/drawing1.xml.rels");

    core::WorksheetMetadata metadata;
    metadata.cell_formulas[{1, 1}] = "=DISPIMG(\"ID_ABC\",1)";
    metadata.cell_formulas[{0, 0}] = "=SUM(B1:B2)";

    EXPECT_EQ(graph.linkInto(metadata), 2u);
    ASSERT_EQ(metadata.cell_images.size(), 2u);
    EXPECT_EQ(metadata.imageAt({1, 1})->id, "ID_ABC");
    EXPECT_EQ(*metadata.imageAt({1, 1})->bytes, PackageBuilder::pngHeader(40, 20));
    EXPECT_EQ(metadata.imageAt({2, 3})->id, "floating_2_3_rId9");
    EXPECT_EQ(metadata.imageAt({0, 0}), nullptr);
}

TEST_F(ImageReferenceGraphTest, EmptyMediaLinksNothing) {
    MediaLibrary empty;
    ImageReferenceGraph graph(empty);
    graph.parseDrawing(drawingXml(anchorXml("twoCellAnchor", 0, 0, "ID_A", "rId1")));

    core::WorksheetMetadata metadata;
    EXPECT_EQ(graph.linkInto(metadata), 0u);
    EXPECT_TRUE(metadata.cell_images.empty());
}

TEST_F(ImageReferenceGraphTest, BuildReadsPartsFromPackage) {
    test::TempDirectory temp("image_graph");
    auto path = PackageBuilder()
        .withWorkbook()
        .withSheet("")
        .addPart(ImageReferenceGraph::kCellImagesPart, cellImagesXml({{"ID_PKG", "rId1"}}))
        .addPart(ImageReferenceGraph::kCellImagesRelsPart, PackageBuilder::relationshipsXml({
            {"rId1", kImageRelType, "media/image1.png"}
        }))
        .addBinary("xl/media/image1.png", PackageBuilder::pngHeader(16, 16))
        .build(temp.file("graph.xlsx"));

    archive::PackageArchive archive(path);
    auto media = MediaLibrary::scan(archive);
    auto graph = ImageReferenceGraph::build(archive, media);

    EXPECT_EQ(graph.getCellImageCount(), 1u);
    EXPECT_TRUE(graph.resolveFloatingImages().empty());
    EXPECT_TRUE(graph.resolveFormulaImage("=DISPIMG(\"ID_PKG\",1)").has_value());
}

TEST_F(ImageReferenceGraphTest, MalformedCellImagesThrow) {
    ImageReferenceGraph graph(media_);
    EXPECT_THROW(graph.parseCellImages("<etc:cellImages><etc:cellImage>"), core::ParseException);
}

}} // namespace splitsheet::reader
