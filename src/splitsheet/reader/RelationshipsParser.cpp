#include "splitsheet/reader/RelationshipsParser.hpp"
#include "splitsheet/reader/TagScopedVisitor.hpp"
#include "splitsheet/utils/CommonUtils.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"

namespace splitsheet {
namespace reader {

void RelationshipsParser::parse(std::string_view xml_content, const std::string& part_name) {
    clear();

    TagScopedVisitor visitor;
    visitor.onElement("Relationships/Relationship", [this](const TagScopedVisitor::Attributes& attributes) {
        Relationship rel;
        for (const auto& attr : attributes) {
            if (attr.name == "Id") rel.id = std::string(attr.value);
            else if (attr.name == "Type") rel.type = std::string(attr.value);
            else if (attr.name == "Target") rel.target = std::string(attr.value);
            else if (attr.name == "TargetMode") rel.target_mode = std::string(attr.value);
        }

        if (rel.id.empty() || rel.target.empty()) {
            READER_WARN("Skipping incomplete relationship: id='{}', target='{}'", rel.id, rel.target);
            return;
        }

        // 重复 ID 以最后一个为准
        auto existing = id_index_.find(rel.id);
        if (existing != id_index_.end()) {
            relationships_[existing->second] = std::move(rel);
            return;
        }
        id_index_.emplace(rel.id, relationships_.size());
        relationships_.push_back(std::move(rel));
    });
    visitor.visit(xml_content, part_name);

    READER_DEBUG("Parsed {} relationships from {}", relationships_.size(), part_name);
}

const RelationshipsParser::Relationship* RelationshipsParser::findById(const std::string& id) const {
    auto it = id_index_.find(id);
    return it != id_index_.end() ? &relationships_[it->second] : nullptr;
}

const RelationshipsParser::Relationship* RelationshipsParser::findFirstByTypeSuffix(std::string_view suffix) const {
    for (const auto& rel : relationships_) {
        if (rel.type.size() >= suffix.size() &&
            rel.type.compare(rel.type.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return &rel;
        }
    }
    return nullptr;
}

std::unordered_map<std::string, std::string> RelationshipsParser::targetFileNames() const {
    std::unordered_map<std::string, std::string> result;
    result.reserve(relationships_.size());
    for (const auto& rel : relationships_) {
        result[rel.id] = utils::CommonUtils::baseName(rel.target);
    }
    return result;
}

}} // namespace splitsheet::reader
