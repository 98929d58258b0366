#include "splitsheet/xml/WorksheetXMLGenerator.hpp"
#include "splitsheet/xml/XMLStreamWriter.hpp"
#include "splitsheet/utils/CommonUtils.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <iterator>

namespace splitsheet {
namespace xml {

std::string WorksheetXMLGenerator::generate() const {
    XMLStreamWriter writer;
    writer.startDocument();

    writer.startElement("worksheet");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");
    writer.writeAttribute("xmlns:r", "http://schemas.openxmlformats.org/officeDocument/2006/relationships");

    generateDimension(writer);

    writer.startElement("sheetViews");
    writer.startElement("sheetView");
    writer.writeAttribute("tabSelected", true);
    writer.writeAttribute("workbookViewId", 0);
    writer.endElement(); // sheetView
    writer.endElement(); // sheetViews

    writer.startElement("sheetFormatPr");
    writer.writeAttribute("defaultColWidth", model_.default_column_width);
    writer.writeAttribute("defaultRowHeight", model_.row_height);
    writer.writeAttribute("customHeight", true);
    writer.endElement(); // sheetFormatPr

    generateColumns(writer);
    generateSheetData(writer);

    writer.startElement("pageMargins");
    writer.writeAttribute("left", 0.7);
    writer.writeAttribute("right", 0.7);
    writer.writeAttribute("top", 0.75);
    writer.writeAttribute("bottom", 0.75);
    writer.writeAttribute("header", 0.3);
    writer.writeAttribute("footer", 0.3);
    writer.endElement(); // pageMargins

    generateDrawing(writer);

    writer.endElement(); // worksheet
    writer.endDocument();

    XML_DEBUG("Generated worksheet XML: {} rows, {} bytes", model_.rows.size(), writer.getBytesWritten());
    return writer.toString();
}

void WorksheetXMLGenerator::generateDimension(XMLStreamWriter& writer) const {
    int last_row = -1;
    int last_col = -1;
    for (const auto& [row, cells] : model_.rows) {
        if (cells.empty()) {
            continue;
        }
        last_row = std::max(last_row, row);
        last_col = std::max(last_col, cells.back().col);
    }

    writer.startElement("dimension");
    if (last_row >= 0 && last_col >= 0) {
        writer.writeAttribute("ref", utils::CommonUtils::rangeReference(0, 0, last_row, last_col));
    } else {
        writer.writeAttribute("ref", "A1");
    }
    writer.endElement(); // dimension
}

void WorksheetXMLGenerator::generateColumns(XMLStreamWriter& writer) const {
    if (model_.column_widths.empty()) {
        return;
    }

    writer.startElement("cols");
    auto it = model_.column_widths.begin();
    while (it != model_.column_widths.end()) {
        const int min_col = it->first;
        const double width = it->second;
        int max_col = min_col;
        auto next = std::next(it);
        while (next != model_.column_widths.end() && next->first == max_col + 1 && next->second == width) {
            max_col = next->first;
            ++next;
        }

        writer.startElement("col");
        writer.writeAttribute("min", min_col + 1);
        writer.writeAttribute("max", max_col + 1);
        writer.writeAttribute("width", width);
        writer.writeAttribute("customWidth", true);
        writer.endElement(); // col

        it = next;
    }
    writer.endElement(); // cols
}

void WorksheetXMLGenerator::generateSheetData(XMLStreamWriter& writer) const {
    writer.startElement("sheetData");

    // 每一行都写出（包括没有单元格的行），保证行高统一
    for (int row = 0; row < model_.row_count; ++row) {
        writer.startElement("row");
        writer.writeAttribute("r", row + 1);
        writer.writeAttribute("ht", model_.row_height);
        writer.writeAttribute("customHeight", true);

        auto it = model_.rows.find(row);
        if (it != model_.rows.end()) {
            for (const auto& cell : it->second) {
                generateCell(writer, row, cell);
            }
        }
        writer.endElement(); // row
    }

    writer.endElement(); // sheetData
}

void WorksheetXMLGenerator::generateCell(XMLStreamWriter& writer, int row, const WorksheetCell& cell) const {
    writer.startElement("c");
    writer.writeAttribute("r", utils::CommonUtils::cellReference(row, cell.col));
    if (cell.format_id > 0) {
        writer.writeAttribute("s", cell.format_id);
    }

    switch (cell.type) {
        case WorksheetCell::Type::SharedString:
            writer.writeAttribute("t", "s");
            writer.startElement("v");
            writer.writeText(cell.string_index);
            writer.endElement(); // v
            break;
        case WorksheetCell::Type::Number:
            writer.startElement("v");
            writer.writeText(cell.number);
            writer.endElement(); // v
            break;
        case WorksheetCell::Type::Formula:
            writer.startElement("f");
            writer.writeText(cell.formula);
            writer.endElement(); // f
            break;
        case WorksheetCell::Type::Blank:
            break;
    }

    writer.endElement(); // c
}

void WorksheetXMLGenerator::generateDrawing(XMLStreamWriter& writer) const {
    if (model_.drawing_relationship_id.empty()) {
        return;
    }
    writer.startElement("drawing");
    writer.writeAttribute("r:id", model_.drawing_relationship_id);
    writer.endElement(); // drawing
}

}} // namespace splitsheet::xml
