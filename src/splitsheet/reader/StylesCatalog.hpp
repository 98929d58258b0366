#pragma once

#include "splitsheet/core/CellTypes.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace splitsheet {
namespace reader {

// cellXfs 中的一条记录，只保留展示需要的两个索引
struct CellXf {
    int num_fmt_id = 0;
    int fill_id = 0;
    bool apply_number_format = false;
    bool apply_fill = false;
};

/**
 * @brief 样式目录（xl/styles.xml）
 *
 * 只解析数字格式表、填充表和 cellXfs：
 * - 内置格式 0/1/2/49 预置（General、"0"、"0.00"、"@"），numFmt 扩展
 * - 填充只识别 patternType="solid" 的 fgColor@rgb（ARGB 取后 6 位），其他图案不带背景色；
 *   主题色、索引色不解析
 */
class StylesCatalog {
public:
    StylesCatalog();

    /**
     * @brief 解析样式部件
     * @throws core::ParseException XML 格式错误（CorruptedStyles）
     */
    static StylesCatalog parse(std::string_view xml_content);

    /**
     * @brief 样式索引 -> 展示样式
     *
     * number_format 保留原始格式码（包括 "General"），未定义的格式为空；
     * 索引越界按 0 号格式处理。是否为默认样式由 CellStyle::isDefault() 判断。
     */
    core::CellStyle resolve(int style_index) const;

    /**
     * @brief 原始格式码（含 "General"），未定义时 nullopt
     */
    std::optional<std::string> formatCode(int num_fmt_id) const;

    /**
     * @brief 填充颜色（6 位 RGB），无颜色或越界时 nullopt
     */
    std::optional<std::string> fillColor(int fill_id) const;

    size_t getCellXfCount() const { return cell_xfs_.size(); }
    size_t getFillCount() const { return fills_.size(); }
    size_t getNumberFormatCount() const { return number_formats_.size(); }

private:
    std::unordered_map<int, std::string> number_formats_;
    std::vector<std::optional<std::string>> fills_;
    std::vector<CellXf> cell_xfs_;
};

}} // namespace splitsheet::reader
