#pragma once

#include <optional>
#include <string>

namespace splitsheet {
namespace archive {
class PackageArchive;
}

namespace reader {

/**
 * @brief 在包内定位工作表及其关联部件
 *
 * 第一个工作表：xl/workbook.xml 的第一个 sheet@r:id，经 xl/_rels/workbook.xml.rels 得到路径；
 * 任一环节缺失时退回 xl/worksheets/sheet1.xml。
 */
class WorkbookLocator {
public:
    static constexpr const char* kWorkbookPart = "xl/workbook.xml";
    static constexpr const char* kWorkbookRelsPart = "xl/_rels/workbook.xml.rels";
    static constexpr const char* kFallbackSheetPart = "xl/worksheets/sheet1.xml";

    explicit WorkbookLocator(const archive::PackageArchive& archive) : archive_(archive) {}

    /**
     * @brief 第一个工作表的部件路径
     * @throws core::ParseException workbook.xml 或其关系部件格式错误
     */
    std::string firstSheetPart() const;

    /**
     * @brief 第一个工作表的名称（没有 workbook.xml 时为空）
     */
    std::optional<std::string> firstSheetName() const;

    /**
     * @brief 工作表引用的绘图部件，没有关系时为 nullopt
     */
    std::optional<std::string> drawingPartFor(const std::string& sheet_part) const;

private:
    const archive::PackageArchive& archive_;

    struct SheetEntry {
        std::string name;
        std::string relationship_id;
    };
    std::optional<SheetEntry> firstSheetEntry() const;
};

}} // namespace splitsheet::reader
