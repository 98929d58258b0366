#include "splitsheet/xml/ContentTypes.hpp"
#include "splitsheet/xml/XMLStreamWriter.hpp"

namespace splitsheet {
namespace xml {

void ContentTypes::addDefault(const std::string& extension, const std::string& content_type) {
    if (hasDefault(extension)) {
        return;
    }
    default_types_.push_back({extension, content_type});
}

void ContentTypes::addOverride(const std::string& part_name, const std::string& content_type) {
    override_types_.push_back({part_name, content_type});
}

bool ContentTypes::hasDefault(const std::string& extension) const {
    for (const auto& def : default_types_) {
        if (def.extension == extension) {
            return true;
        }
    }
    return false;
}

std::string ContentTypes::generate() const {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("Types");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/package/2006/content-types");

    for (const auto& def : default_types_) {
        writer.startElement("Default");
        writer.writeAttribute("Extension", def.extension);
        writer.writeAttribute("ContentType", def.content_type);
        writer.endElement(); // Default
    }

    for (const auto& override : override_types_) {
        writer.startElement("Override");
        writer.writeAttribute("PartName", override.part_name);
        writer.writeAttribute("ContentType", override.content_type);
        writer.endElement(); // Override
    }

    writer.endElement(); // Types
    writer.endDocument();
    return writer.toString();
}

void ContentTypes::clear() {
    default_types_.clear();
    override_types_.clear();
}

void ContentTypes::addExcelDefaults() {
    addDefault("rels", "application/vnd.openxmlformats-package.relationships+xml");
    addDefault("xml", "application/xml");
}

}} // namespace splitsheet::xml
