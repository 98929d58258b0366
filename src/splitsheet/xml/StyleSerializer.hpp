#pragma once

#include "splitsheet/core/FormatRepository.hpp"
#include <map>
#include <string>
#include <vector>

namespace splitsheet {
namespace xml {

class XMLStreamWriter;

/**
 * @brief 样式序列化器 - 把 FormatRepository 写成 xl/styles.xml
 *
 * - 内置数字格式直接引用内置 ID，其余从 164 开始编号
 * - fills：0=none、1=gray125 固定，自定义背景色从 2 开始
 * - borders：0=无边框、1=四边细线
 * - cellXfs 与仓储中的格式 ID 一一对应
 */
class StyleSerializer {
public:
    static std::string serialize(const core::FormatRepository& repository);

    /**
     * @brief 内置数字格式 ID，不是内置格式返回 -1
     */
    static int builtinNumberFormatId(const std::string& format_code);

private:
    struct ComponentMapping {
        std::vector<std::string> custom_numfmts;
        std::map<std::string, int> numfmt_ids;
        std::vector<std::string> fill_colors;
        std::map<std::string, int> fill_ids;
    };

    static ComponentMapping createComponentMappings(const core::FormatRepository& repository);

    static void writeNumberFormats(const ComponentMapping& mapping, XMLStreamWriter& writer);
    static void writeFonts(XMLStreamWriter& writer);
    static void writeFills(const ComponentMapping& mapping, XMLStreamWriter& writer);
    static void writeBorders(XMLStreamWriter& writer);
    static void writeCellXfs(const core::FormatRepository& repository, const ComponentMapping& mapping,
                             XMLStreamWriter& writer);
};

}} // namespace splitsheet::xml
