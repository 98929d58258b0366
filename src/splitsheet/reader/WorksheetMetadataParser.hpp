#pragma once

#include "splitsheet/core/WorksheetMetadata.hpp"
#include <string>
#include <string_view>

namespace splitsheet {
namespace reader {

class StylesCatalog;

/**
 * @brief 工作表展示元数据解析器
 *
 * 流式读取 worksheet XML，提取：
 * - mergeCells/mergeCell@ref 合并区域
 * - cols/col@min..max 显式列宽，sheetFormatPr@defaultColWidth 默认列宽（缺省 8.43）
 * - sheetData 中每个单元格的样式（经 StylesCatalog 解析，只保存非默认样式）和公式（补齐前导 "="）
 *
 * 图片不在这里处理，由 ImageReferenceGraph::linkInto() 挂到结果上。
 */
class WorksheetMetadataParser {
public:
    /**
     * @throws core::ParseException XML 格式错误
     */
    static core::WorksheetMetadata parse(std::string_view xml_content, const StylesCatalog& styles,
                                         const std::string& part_name = "xl/worksheets/sheet1.xml");
};

}} // namespace splitsheet::reader
