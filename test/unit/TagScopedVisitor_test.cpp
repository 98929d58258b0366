#include "splitsheet/reader/TagScopedVisitor.hpp"
#include "splitsheet/core/Exception.hpp"
#include "splitsheet/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace splitsheet {
namespace reader {

class TagScopedVisitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/TagScopedVisitor_test.log", Logger::Level::DEBUG, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    const std::string drawing_xml_ = R"(<?xml version="1.0" encoding="UTF-8"?>
<xdr:wsDr xmlns:xdr="http://schemas.openxmlformats.org/drawingml/2006/spreadsheetDrawing"
          xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main"
          xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">
  <xdr:twoCellAnchor>
    <xdr:from><xdr:col>3</xdr:col><xdr:row>5</xdr:row></xdr:from>
    <xdr:to><xdr:col>4</xdr:col><xdr:row>6</xdr:row></xdr:to>
    <xdr:pic>
      <xdr:nvPicPr><xdr:cNvPr id="2" name="ID_ABC"/></xdr:nvPicPr>
      <xdr:blipFill><a:blip r:embed="rId7"/></xdr:blipFill>
    </xdr:pic>
  </xdr:twoCellAnchor>
</xdr:wsDr>)";
};

TEST_F(TagScopedVisitorTest, ScopeMatchingAllowsGapsButKeepsOrder) {
    using Segments = std::vector<std::string>;
    EXPECT_TRUE(TagScopedVisitor::matches({"si", "t"}, {"sst", "si", "t"}));
    EXPECT_TRUE(TagScopedVisitor::matches({"si", "t"}, {"sst", "si", "r", "t"}));
    EXPECT_FALSE(TagScopedVisitor::matches({"si", "t"}, {"sst", "t"}));
    EXPECT_FALSE(TagScopedVisitor::matches({"from", "row"}, {"to", "row"}));
    EXPECT_FALSE(TagScopedVisitor::matches({"a", "b"}, Segments{"b", "a", "c"}));
    EXPECT_FALSE(TagScopedVisitor::matches({"row"}, Segments{}));
}

TEST_F(TagScopedVisitorTest, DeliversAttributesTextAndLeaveInOrder) {
    std::vector<std::string> events;

    TagScopedVisitor visitor;
    visitor
        .onElement("twoCellAnchor", [&](const TagScopedVisitor::Attributes&) { events.push_back("enter"); })
        .onText("twoCellAnchor/from/row", [&](std::string_view text) { events.push_back("row=" + std::string(text)); })
        .onText("twoCellAnchor/from/col", [&](std::string_view text) { events.push_back("col=" + std::string(text)); })
        .onAttribute("twoCellAnchor/pic/cNvPr", "name", [&](std::string_view v) { events.push_back("name=" + std::string(v)); })
        .onAttribute("twoCellAnchor/pic/blip", "embed", [&](std::string_view v) { events.push_back("embed=" + std::string(v)); })
        .onLeave("twoCellAnchor", [&] { events.push_back("leave"); });
    visitor.visit(drawing_xml_, "xl/drawings/drawing1.xml");

    const std::vector<std::string> expected = {
        "enter", "col=3", "row=5", "name=ID_ABC", "embed=rId7", "leave"
    };
    EXPECT_EQ(events, expected);
}

TEST_F(TagScopedVisitorTest, ToMarkerDoesNotMatchFromRules) {
    std::vector<std::string> rows;
    TagScopedVisitor visitor;
    visitor.onText("from/row", [&](std::string_view text) { rows.emplace_back(text); });
    visitor.visit(drawing_xml_, "xl/drawings/drawing1.xml");

    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], "5");
}

TEST_F(TagScopedVisitorTest, PreservesWhitespaceWhenAsked) {
    const std::string xml = R"(<sst><si><t xml:space="preserve">  两端空格  </t></si></sst>)";

    std::string trimmed;
    TagScopedVisitor trimming;
    trimming.onText("si/t", [&](std::string_view text) { trimmed.assign(text); });
    trimming.visit(xml, "xl/sharedStrings.xml");

    std::string preserved;
    TagScopedVisitor preserving;
    preserving.preserveWhitespace().onText("si/t", [&](std::string_view text) { preserved.assign(text); });
    preserving.visit(xml, "xl/sharedStrings.xml");

    EXPECT_EQ(trimmed, "两端空格");
    EXPECT_EQ(preserved, "  两端空格  ");
}

TEST_F(TagScopedVisitorTest, MalformedXmlThrowsWithPartName) {
    TagScopedVisitor visitor;
    try {
        visitor.visit("<a><b></a>", "xl/broken.xml");
        FAIL() << "expected ParseException";
    } catch (const core::ParseException& e) {
        EXPECT_EQ(e.getPartName(), "xl/broken.xml");
        EXPECT_EQ(e.getCategory(), core::ErrorCategory::ParseError);
    }
}

}} // namespace splitsheet::reader
