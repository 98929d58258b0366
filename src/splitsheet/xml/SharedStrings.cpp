#include "splitsheet/xml/SharedStrings.hpp"
#include "splitsheet/xml/XMLStreamWriter.hpp"
#include <cctype>

namespace splitsheet {
namespace xml {

namespace {

bool needsPreserve(const std::string& str) {
    return !str.empty() && (std::isspace(static_cast<unsigned char>(str.front())) ||
                            std::isspace(static_cast<unsigned char>(str.back())));
}

} // namespace

int SharedStrings::addString(const std::string& str) {
    ++reference_count_;
    auto it = string_map_.find(str);
    if (it != string_map_.end()) {
        return it->second;
    }

    int index = static_cast<int>(strings_.size());
    strings_.push_back(str);
    string_map_[str] = index;
    return index;
}

int SharedStrings::getStringIndex(const std::string& str) const {
    auto it = string_map_.find(str);
    return it != string_map_.end() ? it->second : -1;
}

std::string SharedStrings::getString(int index) const {
    if (index >= 0 && index < static_cast<int>(strings_.size())) {
        return strings_[static_cast<size_t>(index)];
    }
    return "";
}

std::string SharedStrings::generate() const {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("sst");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");
    writer.writeAttribute("count", static_cast<int64_t>(reference_count_));
    writer.writeAttribute("uniqueCount", static_cast<int64_t>(strings_.size()));

    for (const auto& str : strings_) {
        writer.startElement("si");
        writer.startElement("t");
        if (needsPreserve(str)) {
            writer.writeAttribute("xml:space", "preserve");
        }
        writer.writeText(str);
        writer.endElement(); // t
        writer.endElement(); // si
    }

    writer.endElement(); // sst
    writer.endDocument();
    return writer.toString();
}

void SharedStrings::clear() {
    strings_.clear();
    string_map_.clear();
    reference_count_ = 0;
}

}} // namespace splitsheet::xml
