#pragma once

#include "splitsheet/core/Path.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace splitsheet {
namespace test {

/**
 * @brief 测试用临时目录，析构时递归删除
 */
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix = "splitsheet_test");
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const core::Path& path() const { return path_; }
    core::Path file(const std::string& name) const { return path_ / name; }

private:
    core::Path path_;
};

/**
 * @brief 用 ZipWriter 拼装测试用的 xlsx 包
 *
 * 只写调用方给出的部件；withWorkbook() 补齐 workbook.xml 及其关系部件。
 */
class PackageBuilder {
public:
    PackageBuilder& addPart(const std::string& name, std::string content);
    PackageBuilder& addBinary(const std::string& name, std::vector<uint8_t> data);

    /**
     * @brief workbook.xml + workbook.xml.rels，唯一的工作表指向 worksheets/sheet1.xml
     */
    PackageBuilder& withWorkbook(const std::string& sheet_name = "Sheet1");

    /**
     * @brief xl/worksheets/sheet1.xml
     */
    PackageBuilder& withSheet(const std::string& sheet_data, const std::string& merge_cells = "",
                              const std::string& before_data = "", const std::string& after_data = "");

    PackageBuilder& withSharedStrings(const std::vector<std::string>& strings);
    PackageBuilder& withStyles(const std::string& styles_xml);

    /**
     * @brief 写出包文件
     * @throws std::runtime_error 写入失败
     */
    core::Path build(const core::Path& path) const;

    // XML 片段
    static std::string worksheetXml(const std::string& sheet_data, const std::string& merge_cells = "",
                                    const std::string& before_data = "", const std::string& after_data = "");
    static std::string numberCell(const std::string& ref, const std::string& value, int style = -1);
    static std::string sharedStringCell(const std::string& ref, int index, int style = -1);
    static std::string inlineStringCell(const std::string& ref, const std::string& text, int style = -1);
    static std::string formulaCell(const std::string& ref, const std::string& formula, int style = -1);
    static std::string relationshipsXml(const std::vector<std::vector<std::string>>& id_type_target);

    /**
     * @brief 只有签名和 IHDR 的 PNG（stb_image 可以读出尺寸）
     */
    static std::vector<uint8_t> pngHeader(uint32_t width, uint32_t height);

    /**
     * @brief 用 libwebp 编码的无损 WebP（纯色像素）
     */
    static std::vector<uint8_t> webpImage(int width, int height);

private:
    std::map<std::string, std::vector<uint8_t>> parts_;
};

}} // namespace splitsheet::test
