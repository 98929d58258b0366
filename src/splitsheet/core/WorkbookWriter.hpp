#pragma once

#include "splitsheet/core/Expected.hpp"
#include "splitsheet/core/FormatRepository.hpp"
#include "splitsheet/core/Path.hpp"
#include "splitsheet/core/TransformEngine.hpp"
#include "splitsheet/xml/DrawingXMLGenerator.hpp"
#include "splitsheet/xml/SharedStrings.hpp"
#include "splitsheet/xml/WorksheetXMLGenerator.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace splitsheet {
namespace core {

class ProgressLog;
struct WorksheetMetadata;

/**
 * @brief 把变换结果写成新的 xlsx
 *
 * 输出只有一个工作表 "Sheet1"：
 * - 第一行每一列都写列宽（显式列宽，否则默认列宽），每一行行高 20
 * - 所有单元格居中、垂直居中、自动换行、细边框；重量单元格强制 "0.00" 并保留背景色
 * - 图片缩放进 18x18 像素的方框，单元格内偏移 (21, 4)，随单元格移动和缩放；
 *   单个图片失败只记录进度并退化为空单元格
 * - 先写 "{输出}.tmp"，成功后再移动到目标位置，失败时不留下任何输出文件
 */
class WorkbookWriter {
public:
    static constexpr const char* kSheetName = "Sheet1";
    static constexpr double kRowHeight = 20.0;
    static constexpr double kImageBox = 18.0;
    static constexpr double kImageOffsetX = 21.0;
    static constexpr double kImageOffsetY = 4.0;
    static constexpr size_t kMinImageSize = 8;

    WorkbookWriter(const WorksheetMetadata& metadata, ProgressLog& progress);

    WorkbookWriter(const WorkbookWriter&) = delete;
    WorkbookWriter& operator=(const WorkbookWriter&) = delete;

    /**
     * @brief 把网格转换成待写出的工作表模型（可多次调用，每次重新开始）
     */
    void build(const CellGrid& grid);

    /**
     * @brief 把图片嵌入 (row, col)
     *
     * 校验长度、读取像素尺寸、计算缩放后的锚点并分配媒体文件名。
     * 失败时不修改任何状态。
     */
    VoidResult embedImage(int row, int col, const EmbeddedImage& image);

    /**
     * @brief 写出 xlsx
     * @throws WriteException 任何部件写入失败或无法移动到目标位置
     */
    void save(const Path& output_path) const;

    /**
     * @brief build() + save()
     */
    void write(const CellGrid& grid, const Path& output_path);

    // 构建结果
    const FormatRepository& formats() const { return formats_; }
    const xml::SharedStrings& sharedStrings() const { return shared_strings_; }
    const xml::WorksheetModel& worksheetModel() const { return model_; }
    const std::vector<xml::DrawingImage>& drawingImages() const { return drawing_images_; }
    size_t getMediaCount() const { return media_.size(); }
    size_t getFailedImageCount() const { return failed_images_; }

    /**
     * @brief 单元格使用的格式描述（重量单元格强制 "0.00"）
     */
    static FormatDescriptor formatFor(const StyledCellValue& cell);

private:
    struct MediaEntry {
        std::string file_name;  // image{N}.{ext}
        std::string extension;
        std::shared_ptr<const std::vector<uint8_t>> bytes;
    };

    const WorksheetMetadata& metadata_;
    ProgressLog& progress_;

    FormatRepository formats_;
    xml::SharedStrings shared_strings_;
    xml::WorksheetModel model_;
    std::vector<xml::DrawingImage> drawing_images_;
    std::vector<MediaEntry> media_;
    // 同一份字节只写一个媒体文件
    std::unordered_map<const std::vector<uint8_t>*, size_t> media_index_;
    size_t failed_images_ = 0;

    void reset();
    xml::WorksheetCell makeCell(int col, const StyledCellValue& value);
    const MediaEntry& mediaFor(const EmbeddedImage& image);

    void writePackage(const Path& path) const;
    std::string generateContentTypes() const;
    static std::string generateRootRelationships();
    static std::string generateWorkbookRelationships();
    static std::string generateSheetRelationships();
};

}} // namespace splitsheet::core
