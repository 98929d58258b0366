#include "splitsheet/reader/SharedStringsParser.hpp"
#include "splitsheet/reader/TagScopedVisitor.hpp"
#include "splitsheet/core/Exception.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"

namespace splitsheet {
namespace reader {

void SharedStringsParser::parse(std::string_view xml_content) {
    strings_.clear();

    std::string current;
    bool in_phonetic = false;

    TagScopedVisitor visitor;
    visitor.preserveWhitespace()
        .onElement("sst/si", [&](const TagScopedVisitor::Attributes&) {
            current.clear();
            in_phonetic = false;
        })
        .onElement("si/rPh", [&](const TagScopedVisitor::Attributes&) { in_phonetic = true; })
        .onLeave("si/rPh", [&] { in_phonetic = false; })
        .onText("si/t", [&](std::string_view text) {
            if (!in_phonetic) {
                current.append(text);
            }
        })
        .onLeave("sst/si", [&] { strings_.push_back(std::move(current)); current.clear(); });

    try {
        visitor.visit(xml_content, "xl/sharedStrings.xml");
    } catch (const core::ParseException& e) {
        throw core::ParseException(e.what(), "xl/sharedStrings.xml",
                                   core::ErrorCode::CorruptedSharedStrings, __FILE__, __LINE__);
    }

    READER_DEBUG("Loaded {} shared strings", strings_.size());
}

}} // namespace splitsheet::reader
