#include "splitsheet/xml/XMLStreamReader.hpp"
#include "splitsheet/xml/XMLStreamWriter.hpp"
#include "splitsheet/core/Exception.hpp"
#include "splitsheet/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace splitsheet {
namespace xml {

class XMLStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/XMLStream_test.log", Logger::Level::DEBUG, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    const std::string declaration_ = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
};

TEST_F(XMLStreamTest, WriterNestsElementsAndClosesEmptyOnes) {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("row");
    writer.writeAttribute("r", 3);
    writer.writeAttribute("ht", 20.0);
    writer.writeAttribute("customHeight", true);
    writer.startElement("c");
    writer.writeAttribute("r", "A3");
    writer.endElement();
    writer.writeEmptyElement("c");
    writer.endDocument();

    EXPECT_EQ(writer.toString(), declaration_ + "<row r=\"3\" ht=\"20\" customHeight=\"1\"><c r=\"A3\" /><c /></row>");
    EXPECT_EQ(writer.depth(), 0u);
}

TEST_F(XMLStreamTest, WriterEscapesTextAndAttributes) {
    XMLStreamWriter writer;
    writer.startElement("t");
    writer.writeAttribute("name", "a\"b<c>\nd");
    writer.writeText("箱 & 袋 <1> \"x\"");
    writer.endElement();

    EXPECT_EQ(writer.toString(), "<t name=\"a&quot;b&lt;c&gt;&#10;d\">箱 &amp; 袋 &lt;1&gt; \"x\"</t>");
}

TEST_F(XMLStreamTest, NumbersUseShortestForm) {
    EXPECT_EQ(formatNumber(20.0), "20");
    EXPECT_EQ(formatNumber(33.33), "33.33");
    EXPECT_EQ(formatNumber(0.5), "0.5");
    EXPECT_EQ(formatNumber(8.43), "8.43");
    EXPECT_EQ(formatNumber(std::numeric_limits<double>::infinity()), "0");
}

TEST_F(XMLStreamTest, WriterRejectsMisuse) {
    XMLStreamWriter writer;
    EXPECT_THROW(writer.endElement(), core::OperationException);
    EXPECT_THROW(writer.startElement(""), core::ParameterException);
    EXPECT_THROW(writer.writeAttribute("x", 1), core::OperationException);
}

TEST_F(XMLStreamTest, ReaderDeliversEventsWithDepth) {
    std::vector<std::string> events;
    XMLStreamReader reader;
    reader.setStartElementCallback([&](std::string_view name, const XMLStreamReader::Attributes& attributes, int depth) {
        std::string event = std::string(name) + "@" + std::to_string(depth);
        for (const auto& attr : attributes) {
            event += " " + std::string(attr.name) + "=" + std::string(attr.value);
        }
        events.push_back(event);
    });
    reader.setTextCallback([&](std::string_view text, int depth) {
        events.push_back("text:" + std::string(text) + "@" + std::to_string(depth));
    });
    reader.setEndElementCallback([&](std::string_view name, int depth) {
        events.push_back("/" + std::string(name) + "@" + std::to_string(depth));
    });

    auto result = reader.parseFromString(R"(<sst count="1"><si><t>  纸箱  </t></si></sst>)");
    ASSERT_TRUE(isSuccess(result));

    const std::vector<std::string> expected = {
        "sst@0 count=1", "si@1", "t@2", "text:纸箱@2", "/t@2", "/si@1", "/sst@0"
    };
    EXPECT_EQ(events, expected);
    EXPECT_EQ(reader.getElementsParsed(), 3u);
}

TEST_F(XMLStreamTest, ReaderCanKeepWhitespace) {
    std::string text;
    XMLStreamReader reader;
    reader.setTrimWhitespace(false);
    reader.setTextCallback([&](std::string_view value, int) { text.assign(value); });

    ASSERT_TRUE(isSuccess(reader.parseFromString("<t>  两端  </t>")));
    EXPECT_EQ(text, "  两端  ");
}

TEST_F(XMLStreamTest, ReaderReportsMalformedInput) {
    XMLStreamReader reader;
    auto result = reader.parseFromString("<a><b></a>");
    EXPECT_EQ(result, XMLParseError::ParseFailed);
    EXPECT_FALSE(reader.getLastErrorMessage().empty());
}

TEST_F(XMLStreamTest, CallbackExceptionStopsParsing) {
    XMLStreamReader reader;
    int seen = 0;
    reader.setStartElementCallback([&](std::string_view name, const XMLStreamReader::Attributes&, int) {
        ++seen;
        if (name == "bad") {
            throw std::runtime_error("unexpected element");
        }
    });

    auto result = reader.parseFromString("<root><bad/><after/></root>");
    EXPECT_EQ(result, XMLParseError::CallbackError);
    EXPECT_EQ(seen, 2);
}

}} // namespace splitsheet::xml
