#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace splitsheet {
namespace reader {

/**
 * @brief .rels 关系部件解析器
 */
class RelationshipsParser {
public:
    struct Relationship {
        std::string id;          // 如 "rId1"
        std::string type;        // 关系类型 URI
        std::string target;      // 如 "../media/image1.png"
        std::string target_mode = "Internal";
    };

    RelationshipsParser() = default;

    /**
     * @brief 解析关系XML内容
     * @throws core::ParseException XML 格式错误
     */
    void parse(std::string_view xml_content, const std::string& part_name);

    const std::vector<Relationship>& getRelationships() const { return relationships_; }

    const Relationship* findById(const std::string& id) const;

    /**
     * @brief 按类型后缀查找（如 "/worksheet"、"/drawing"），兼容 strict 命名空间
     */
    const Relationship* findFirstByTypeSuffix(std::string_view suffix) const;

    /**
     * @brief 关系ID -> 目标文件名（去掉目录部分）
     */
    std::unordered_map<std::string, std::string> targetFileNames() const;

    size_t getRelationshipCount() const { return relationships_.size(); }

    void clear() {
        relationships_.clear();
        id_index_.clear();
    }

private:
    std::vector<Relationship> relationships_;
    std::unordered_map<std::string, size_t> id_index_;
};

}} // namespace splitsheet::reader
