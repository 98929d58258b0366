#pragma once

#include <string>
#include <vector>

namespace splitsheet {
namespace xml {

/**
 * @brief [Content_Types].xml 生成器
 */
class ContentTypes {
public:
    ContentTypes() = default;

    // 添加默认内容类型（按扩展名），重复的扩展名忽略
    void addDefault(const std::string& extension, const std::string& content_type);

    // 添加覆盖内容类型（按部件名）
    void addOverride(const std::string& part_name, const std::string& content_type);

    // rels / xml 两个默认类型；具体部件的 Override 由写入方按实际内容添加
    void addExcelDefaults();

    std::string generate() const;

    void clear();

    bool hasDefault(const std::string& extension) const;

private:
    struct DefaultType {
        std::string extension;
        std::string content_type;
    };

    struct OverrideType {
        std::string part_name;
        std::string content_type;
    };

    std::vector<DefaultType> default_types_;
    std::vector<OverrideType> override_types_;
};

}} // namespace splitsheet::xml
