#include "splitsheet/xml/WorkbookXMLGenerator.hpp"
#include "splitsheet/xml/XMLStreamWriter.hpp"
#include <fmt/format.h>

namespace splitsheet {
namespace xml {

std::string WorkbookXMLGenerator::generate() const {
    XMLStreamWriter writer;
    writer.startDocument();

    writer.startElement("workbook");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");
    writer.writeAttribute("xmlns:r", "http://schemas.openxmlformats.org/officeDocument/2006/relationships");

    writer.startElement("bookViews");
    writer.startElement("workbookView");
    writer.writeAttribute("activeTab", 0);
    writer.endElement(); // workbookView
    writer.endElement(); // bookViews

    writer.startElement("sheets");
    int index = 1;
    for (const auto& name : sheet_names_) {
        writer.startElement("sheet");
        writer.writeAttribute("name", name);
        writer.writeAttribute("sheetId", index);
        writer.writeAttribute("r:id", fmt::format("rId{}", index));
        writer.endElement(); // sheet
        ++index;
    }
    writer.endElement(); // sheets

    writer.startElement("calcPr");
    writer.writeAttribute("calcId", 191029);
    writer.writeAttribute("fullCalcOnLoad", true);
    writer.endElement(); // calcPr

    writer.endElement(); // workbook
    writer.endDocument();
    return writer.toString();
}

}} // namespace splitsheet::xml
