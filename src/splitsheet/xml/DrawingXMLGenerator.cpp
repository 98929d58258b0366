#include "splitsheet/xml/DrawingXMLGenerator.hpp"
#include "splitsheet/xml/Relationships.hpp"
#include "splitsheet/xml/XMLStreamWriter.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"
#include <cmath>
#include <fmt/format.h>

namespace splitsheet {
namespace xml {

std::string DrawingXMLGenerator::generateDrawingXML() const {
    XMLStreamWriter writer;
    writer.startDocument();

    writer.startElement("xdr:wsDr");
    writer.writeAttribute("xmlns:xdr", "http://schemas.openxmlformats.org/drawingml/2006/spreadsheetDrawing");
    writer.writeAttribute("xmlns:a", "http://schemas.openxmlformats.org/drawingml/2006/main");
    writer.writeAttribute("xmlns:r", "http://schemas.openxmlformats.org/officeDocument/2006/relationships");

    int image_index = 0;
    for (const auto& image : images_) {
        generateImageXML(writer, image, image_index++);
    }

    writer.endElement(); // xdr:wsDr
    writer.endDocument();

    XML_DEBUG("Generated drawing XML with {} images", image_index);
    return writer.toString();
}

std::string DrawingXMLGenerator::generateDrawingRelsXML() const {
    Relationships relationships;
    int image_index = 1;
    for (const auto& image : images_) {
        relationships.addRelationship(fmt::format("rId{}", image_index++), rel_type::kImage,
                                      "../media/" + image.media_file);
    }
    return relationships.generate();
}

void DrawingXMLGenerator::generateImageXML(XMLStreamWriter& writer, const DrawingImage& image, int image_index) const {
    const auto& anchor = image.anchor;

    writer.startElement("xdr:twoCellAnchor");
    writer.writeAttribute("editAs", "twoCell");

    writeMarker(writer, "xdr:from", anchor.from_row, anchor.from_col, anchor.offset_x, anchor.offset_y);
    writeMarker(writer, "xdr:to", anchor.to_row, anchor.to_col,
                anchor.offset_x + anchor.width, anchor.offset_y + anchor.height);

    generatePictureXML(writer, image, image_index);

    writer.startElement("xdr:clientData");
    writer.endElement(); // xdr:clientData

    writer.endElement(); // xdr:twoCellAnchor
}

void DrawingXMLGenerator::writeMarker(XMLStreamWriter& writer, const char* element, int row, int col,
                                      double offset_x, double offset_y) {
    writer.startElement(element);
    writer.startElement("xdr:col");
    writer.writeText(col);
    writer.endElement();
    writer.startElement("xdr:colOff");
    writer.writeText(fmt::format("{}", pixelsToEMU(offset_x)));
    writer.endElement();
    writer.startElement("xdr:row");
    writer.writeText(row);
    writer.endElement();
    writer.startElement("xdr:rowOff");
    writer.writeText(fmt::format("{}", pixelsToEMU(offset_y)));
    writer.endElement();
    writer.endElement(); // element
}

void DrawingXMLGenerator::generatePictureXML(XMLStreamWriter& writer, const DrawingImage& image, int image_index) const {
    writer.startElement("xdr:pic");

    writer.startElement("xdr:nvPicPr");
    writer.startElement("xdr:cNvPr");
    writer.writeAttribute("id", image_index + 2); // ID从2开始
    writer.writeAttribute("name", image.name.empty() ? fmt::format("Picture {}", image_index + 1) : image.name);
    writer.endElement(); // xdr:cNvPr
    writer.startElement("xdr:cNvPicPr");
    writer.startElement("a:picLocks");
    writer.writeAttribute("noChangeAspect", true);
    writer.endElement(); // a:picLocks
    writer.endElement(); // xdr:cNvPicPr
    writer.endElement(); // xdr:nvPicPr

    writer.startElement("xdr:blipFill");
    writer.startElement("a:blip");
    writer.writeAttribute("r:embed", fmt::format("rId{}", image_index + 1));
    writer.endElement(); // a:blip
    writer.startElement("a:stretch");
    writer.startElement("a:fillRect");
    writer.endElement();
    writer.endElement(); // a:stretch
    writer.endElement(); // xdr:blipFill

    writer.startElement("xdr:spPr");
    writer.startElement("a:xfrm");
    writer.startElement("a:off");
    writer.writeAttribute("x", 0);
    writer.writeAttribute("y", 0);
    writer.endElement(); // a:off
    writer.startElement("a:ext");
    writer.writeAttribute("cx", pixelsToEMU(image.anchor.width));
    writer.writeAttribute("cy", pixelsToEMU(image.anchor.height));
    writer.endElement(); // a:ext
    writer.endElement(); // a:xfrm
    writer.startElement("a:prstGeom");
    writer.writeAttribute("prst", "rect");
    writer.startElement("a:avLst");
    writer.endElement();
    writer.endElement(); // a:prstGeom
    writer.endElement(); // xdr:spPr

    writer.endElement(); // xdr:pic
}

int64_t DrawingXMLGenerator::pixelsToEMU(double pixels) {
    return static_cast<int64_t>(std::llround(pixels * EMU_PER_PIXEL));
}

}} // namespace splitsheet::xml
