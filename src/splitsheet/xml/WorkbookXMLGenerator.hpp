#pragma once

#include <string>
#include <utility>
#include <vector>

namespace splitsheet {
namespace xml {

/**
 * @brief 工作簿XML生成器（xl/workbook.xml）
 *
 * 第 i 个工作表（从 0 开始）的 sheetId 为 i+1，关系ID为 rId{i+1}。
 */
class WorkbookXMLGenerator {
public:
    explicit WorkbookXMLGenerator(std::vector<std::string> sheet_names) : sheet_names_(std::move(sheet_names)) {}

    std::string generate() const;

private:
    std::vector<std::string> sheet_names_;
};

}} // namespace splitsheet::xml
