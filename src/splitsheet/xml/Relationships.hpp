#pragma once

#include <string>
#include <vector>

namespace splitsheet {
namespace xml {

// 常用关系类型
namespace rel_type {
constexpr const char* kOfficeDocument = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";
constexpr const char* kWorksheet = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet";
constexpr const char* kStyles = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles";
constexpr const char* kSharedStrings = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/sharedStrings";
constexpr const char* kDrawing = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/drawing";
constexpr const char* kImage = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/image";
} // namespace rel_type

struct Relationship {
    std::string id;
    std::string type;
    std::string target;
    std::string target_mode; // "Internal" or "External"
};

/**
 * @brief .rels 部件生成器
 */
class Relationships {
public:
    Relationships() = default;

    void addRelationship(const std::string& id, const std::string& type, const std::string& target);
    void addRelationship(const std::string& id, const std::string& type, const std::string& target,
                         const std::string& target_mode);

    // 自动分配 rIdN
    std::string addAutoRelationship(const std::string& type, const std::string& target);

    std::string generate() const;

    void clear() { relationships_.clear(); }
    size_t size() const { return relationships_.size(); }
    const std::vector<Relationship>& relationships() const { return relationships_; }

private:
    std::vector<Relationship> relationships_;

    std::string generateId() const;
};

}} // namespace splitsheet::xml
