#include "splitsheet/reader/WorkbookLocator.hpp"
#include "splitsheet/reader/RelationshipsParser.hpp"
#include "splitsheet/reader/TagScopedVisitor.hpp"
#include "splitsheet/archive/PackageArchive.hpp"
#include "splitsheet/utils/CommonUtils.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"

namespace splitsheet {
namespace reader {

std::optional<WorkbookLocator::SheetEntry> WorkbookLocator::firstSheetEntry() const {
    auto xml = archive_.tryReadText(kWorkbookPart);
    if (!xml) {
        return std::nullopt;
    }

    std::optional<SheetEntry> first;
    TagScopedVisitor visitor;
    visitor.onElement("sheets/sheet", [&](const TagScopedVisitor::Attributes& attributes) {
        if (first) {
            return;
        }
        SheetEntry entry;
        for (const auto& attr : attributes) {
            // r:id 按本地名匹配为 "id"
            auto name = BaseSAXParser::localName(attr.name);
            if (name == "name") {
                entry.name.assign(attr.value);
            } else if (name == "id") {
                entry.relationship_id.assign(attr.value);
            }
        }
        first = std::move(entry);
    });
    visitor.visit(*xml, kWorkbookPart);
    return first;
}

std::optional<std::string> WorkbookLocator::firstSheetName() const {
    auto entry = firstSheetEntry();
    if (!entry || entry->name.empty()) {
        return std::nullopt;
    }
    return entry->name;
}

std::string WorkbookLocator::firstSheetPart() const {
    auto entry = firstSheetEntry();
    if (entry && !entry->relationship_id.empty()) {
        if (auto rels_xml = archive_.tryReadText(kWorkbookRelsPart)) {
            RelationshipsParser rels;
            rels.parse(*rels_xml, kWorkbookRelsPart);
            if (const auto* rel = rels.findById(entry->relationship_id)) {
                std::string part = utils::CommonUtils::resolvePartPath("xl", rel->target);
                if (archive_.hasPart(part)) {
                    READER_DEBUG("First worksheet '{}' -> {}", entry->name, part);
                    return part;
                }
                READER_WARN("Worksheet target {} does not exist in package", part);
            }
        }
    }

    READER_DEBUG("Falling back to {}", kFallbackSheetPart);
    return kFallbackSheetPart;
}

std::optional<std::string> WorkbookLocator::drawingPartFor(const std::string& sheet_part) const {
    const std::string rels_part = utils::CommonUtils::relationshipsPartFor(sheet_part);
    auto rels_xml = archive_.tryReadText(rels_part);
    if (!rels_xml) {
        return std::nullopt;
    }

    RelationshipsParser rels;
    rels.parse(*rels_xml, rels_part);
    const auto* rel = rels.findFirstByTypeSuffix("/drawing");
    if (!rel) {
        return std::nullopt;
    }
    return utils::CommonUtils::resolvePartPath(utils::CommonUtils::directoryOf(sheet_part), rel->target);
}

}} // namespace splitsheet::reader
