#include "splitsheet/xml/StyleSerializer.hpp"
#include "splitsheet/xml/XMLStreamWriter.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"

namespace splitsheet {
namespace xml {

namespace {

constexpr int kFirstCustomNumFmtId = 164;
constexpr int kFirstCustomFillId = 2;
constexpr int kThinBorderId = 1;

} // namespace

int StyleSerializer::builtinNumberFormatId(const std::string& format_code) {
    static const std::map<std::string, int> builtins = {
        {"General", 0}, {"0", 1}, {"0.00", 2}, {"#,##0", 3}, {"#,##0.00", 4},
        {"0%", 9}, {"0.00%", 10}, {"0.00E+00", 11}, {"@", 49}
    };
    auto it = builtins.find(format_code);
    return it != builtins.end() ? it->second : -1;
}

StyleSerializer::ComponentMapping StyleSerializer::createComponentMappings(const core::FormatRepository& repository) {
    ComponentMapping mapping;
    int next_numfmt = kFirstCustomNumFmtId;
    int next_fill = kFirstCustomFillId;

    for (const auto& format : repository.formats()) {
        if (format.hasNumberFormat() && mapping.numfmt_ids.count(*format.number_format) == 0) {
            int builtin = builtinNumberFormatId(*format.number_format);
            if (builtin >= 0) {
                mapping.numfmt_ids[*format.number_format] = builtin;
            } else {
                mapping.numfmt_ids[*format.number_format] = next_numfmt++;
                mapping.custom_numfmts.push_back(*format.number_format);
            }
        }
        if (format.background_color && mapping.fill_ids.count(*format.background_color) == 0) {
            mapping.fill_ids[*format.background_color] = next_fill++;
            mapping.fill_colors.push_back(*format.background_color);
        }
    }
    return mapping;
}

std::string StyleSerializer::serialize(const core::FormatRepository& repository) {
    const ComponentMapping mapping = createComponentMappings(repository);

    XMLStreamWriter writer;
    writer.startDocument();

    writer.startElement("styleSheet");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");

    writeNumberFormats(mapping, writer);
    writeFonts(writer);
    writeFills(mapping, writer);
    writeBorders(writer);

    writer.startElement("cellStyleXfs");
    writer.writeAttribute("count", 1);
    writer.startElement("xf");
    writer.writeAttribute("numFmtId", 0);
    writer.writeAttribute("fontId", 0);
    writer.writeAttribute("fillId", 0);
    writer.writeAttribute("borderId", 0);
    writer.endElement(); // xf
    writer.endElement(); // cellStyleXfs

    writeCellXfs(repository, mapping, writer);

    writer.startElement("cellStyles");
    writer.writeAttribute("count", 1);
    writer.startElement("cellStyle");
    writer.writeAttribute("name", "Normal");
    writer.writeAttribute("xfId", 0);
    writer.writeAttribute("builtinId", 0);
    writer.endElement(); // cellStyle
    writer.endElement(); // cellStyles

    writer.endElement(); // styleSheet
    writer.endDocument();

    XML_DEBUG("Serialized {} cell formats ({} custom number formats, {} fills)",
              repository.getFormatCount(), mapping.custom_numfmts.size(), mapping.fill_colors.size());
    return writer.toString();
}

void StyleSerializer::writeNumberFormats(const ComponentMapping& mapping, XMLStreamWriter& writer) {
    if (mapping.custom_numfmts.empty()) {
        return;
    }

    writer.startElement("numFmts");
    writer.writeAttribute("count", static_cast<int>(mapping.custom_numfmts.size()));
    for (const auto& code : mapping.custom_numfmts) {
        writer.startElement("numFmt");
        writer.writeAttribute("numFmtId", mapping.numfmt_ids.at(code));
        writer.writeAttribute("formatCode", code);
        writer.endElement(); // numFmt
    }
    writer.endElement(); // numFmts
}

void StyleSerializer::writeFonts(XMLStreamWriter& writer) {
    writer.startElement("fonts");
    writer.writeAttribute("count", 1);
    writer.startElement("font");
    writer.startElement("sz");
    writer.writeAttribute("val", 11);
    writer.endElement(); // sz
    writer.startElement("color");
    writer.writeAttribute("theme", 1);
    writer.endElement(); // color
    writer.startElement("name");
    writer.writeAttribute("val", "Calibri");
    writer.endElement(); // name
    writer.startElement("family");
    writer.writeAttribute("val", 2);
    writer.endElement(); // family
    writer.startElement("scheme");
    writer.writeAttribute("val", "minor");
    writer.endElement(); // scheme
    writer.endElement(); // font
    writer.endElement(); // fonts
}

void StyleSerializer::writeFills(const ComponentMapping& mapping, XMLStreamWriter& writer) {
    writer.startElement("fills");
    writer.writeAttribute("count", static_cast<int>(mapping.fill_colors.size()) + kFirstCustomFillId);

    // fillId=0: none，fillId=1: gray125（Excel 保留）
    for (const char* pattern : {"none", "gray125"}) {
        writer.startElement("fill");
        writer.startElement("patternFill");
        writer.writeAttribute("patternType", pattern);
        writer.endElement(); // patternFill
        writer.endElement(); // fill
    }

    for (const auto& color : mapping.fill_colors) {
        writer.startElement("fill");
        writer.startElement("patternFill");
        writer.writeAttribute("patternType", "solid");
        writer.startElement("fgColor");
        writer.writeAttribute("rgb", "FF" + color);
        writer.endElement(); // fgColor
        writer.startElement("bgColor");
        writer.writeAttribute("indexed", 64);
        writer.endElement(); // bgColor
        writer.endElement(); // patternFill
        writer.endElement(); // fill
    }

    writer.endElement(); // fills
}

void StyleSerializer::writeBorders(XMLStreamWriter& writer) {
    writer.startElement("borders");
    writer.writeAttribute("count", 2);

    // borderId=0: 无边框
    writer.startElement("border");
    for (const char* side : {"left", "right", "top", "bottom", "diagonal"}) {
        writer.writeEmptyElement(side);
    }
    writer.endElement(); // border

    // borderId=1: 四边细线
    writer.startElement("border");
    for (const char* side : {"left", "right", "top", "bottom"}) {
        writer.startElement(side);
        writer.writeAttribute("style", "thin");
        writer.startElement("color");
        writer.writeAttribute("auto", true);
        writer.endElement(); // color
        writer.endElement(); // side
    }
    writer.writeEmptyElement("diagonal");
    writer.endElement(); // border

    writer.endElement(); // borders
}

void StyleSerializer::writeCellXfs(const core::FormatRepository& repository, const ComponentMapping& mapping,
                                   XMLStreamWriter& writer) {
    writer.startElement("cellXfs");
    writer.writeAttribute("count", static_cast<int>(repository.getFormatCount()));

    for (const auto& format : repository.formats()) {
        const int numfmt_id = format.hasNumberFormat() ? mapping.numfmt_ids.at(*format.number_format) : 0;
        const int fill_id = format.background_color ? mapping.fill_ids.at(*format.background_color) : 0;
        const int border_id = format.bordered ? kThinBorderId : 0;

        writer.startElement("xf");
        writer.writeAttribute("numFmtId", numfmt_id);
        writer.writeAttribute("fontId", 0);
        writer.writeAttribute("fillId", fill_id);
        writer.writeAttribute("borderId", border_id);
        writer.writeAttribute("xfId", 0);
        if (numfmt_id != 0) {
            writer.writeAttribute("applyNumberFormat", true);
        }
        if (fill_id != 0) {
            writer.writeAttribute("applyFill", true);
        }
        if (format.bordered) {
            writer.writeAttribute("applyBorder", true);
            writer.writeAttribute("applyAlignment", true);
            writer.startElement("alignment");
            writer.writeAttribute("horizontal", "center");
            writer.writeAttribute("vertical", "center");
            writer.writeAttribute("wrapText", true);
            writer.endElement(); // alignment
        }
        writer.endElement(); // xf
    }

    writer.endElement(); // cellXfs
}

}} // namespace splitsheet::xml
