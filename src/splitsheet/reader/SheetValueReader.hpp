#pragma once

#include "splitsheet/core/CellTypes.hpp"
#include "splitsheet/core/RawValueReader.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace splitsheet {
namespace archive {
class PackageArchive;
}

namespace reader {

class SharedStringsParser;

/**
 * @brief 基于工作表 XML 的原始值读取器
 *
 * 按绝对坐标（0 开始）索引单元格的值：
 * - t="s" 共享字符串，t="inlineStr" 内联字符串，t="str" 公式字符串结果
 * - t="b" 输出 "true" / "false"，t="e" 错误值视为无值
 * - 其余按数值处理，getString() 使用最短往返表示（5.0 -> "5"）
 */
class SheetValueReader : public core::RawValueReader {
public:
    SheetValueReader() = default;

    /**
     * @brief 读取包中第一个工作表
     * @throws core::FileException 工作表部件不存在
     * @throws core::ParseException 工作表或共享字符串格式错误
     */
    static SheetValueReader open(const archive::PackageArchive& archive);

    /**
     * @brief 从工作表 XML 加载
     * @param shared_strings 可以为 nullptr（没有共享字符串表）
     */
    void load(std::string_view sheet_xml, const SharedStringsParser* shared_strings,
              const std::string& part_name = "xl/worksheets/sheet1.xml");

    std::string getString(int row, int col) const override;
    std::optional<double> getFloat(int row, int col) const override;
    int rowCount() const override { return row_count_; }
    int colCount() const override { return col_count_; }
    bool isEmpty(int row, int col) const override;

    size_t getCellCount() const { return cells_.size(); }
    const std::string& sheetPart() const { return sheet_part_; }

private:
    struct RawCell {
        std::string text;
        std::optional<double> number;
    };

    std::unordered_map<core::CellCoordinate, RawCell> cells_;
    int row_count_ = 0;
    int col_count_ = 0;
    std::string sheet_part_;

    const RawCell* find(int row, int col) const;
    void store(int row, int col, RawCell cell);
};

}} // namespace splitsheet::reader
