#pragma once

#include <map>
#include <string>
#include <vector>

namespace splitsheet {
namespace xml {

class XMLStreamWriter;

/**
 * @brief 待写出的单元格
 */
struct WorksheetCell {
    enum class Type { Blank, SharedString, Number, Formula };

    int col = 0;
    int format_id = 0;
    Type type = Type::Blank;
    int string_index = -1;
    double number = 0.0;
    std::string formula;  // 不含前导 "="
};

/**
 * @brief 待写出的工作表
 */
struct WorksheetModel {
    double default_column_width = 8.43;
    std::map<int, double> column_widths;       // 列号(0开始) -> 宽度
    double row_height = 20.0;
    int row_count = 0;
    std::map<int, std::vector<WorksheetCell>> rows;  // 行号 -> 按列排序的单元格
    std::string drawing_relationship_id;       // 为空表示没有绘图
};

/**
 * @brief 工作表XML生成器（xl/worksheets/sheetN.xml）
 *
 * 每一行都写出统一的自定义行高；相邻且宽度相同的列合并为一个 col 区间。
 */
class WorksheetXMLGenerator {
public:
    explicit WorksheetXMLGenerator(const WorksheetModel& model) : model_(model) {}

    std::string generate() const;

private:
    const WorksheetModel& model_;

    void generateDimension(XMLStreamWriter& writer) const;
    void generateColumns(XMLStreamWriter& writer) const;
    void generateSheetData(XMLStreamWriter& writer) const;
    void generateCell(XMLStreamWriter& writer, int row, const WorksheetCell& cell) const;
    void generateDrawing(XMLStreamWriter& writer) const;
};

}} // namespace splitsheet::xml
