#pragma once

#include "splitsheet/core/CellTypes.hpp"
#include "splitsheet/core/WorksheetMetadata.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace splitsheet {
namespace archive {
class PackageArchive;
}

namespace reader {

class MediaLibrary;

/**
 * @brief 浮动图片的锚点（from 单元格 + 关系ID）
 */
struct FloatingAnchor {
    int row = 0;
    int col = 0;
    std::string relationship_id;
};

/**
 * @brief 图片引用图
 *
 * 两套互相独立的嵌入机制：
 * 1. 单元格图片：xl/cellimages.xml（cellImage: cNvPr@name -> blip@r:embed）
 *    + xl/_rels/cellimages.xml.rels，单元格里用 DISPIMG("ID_xxx",1) 公式引用
 * 2. 绘图：工作表的 drawing 部件（twoCellAnchor / oneCellAnchor 的 from 位置 + blip@r:embed），
 *    名字以 "ID_" 开头的图片同时进入绘图的 ID -> rId 映射
 *
 * 解析顺序：图片ID -> 关系ID -> 媒体文件名 -> 字节。
 * ID 映射和关系映射都优先用单元格图片的，为空时退回绘图的。
 *
 * 借用 MediaLibrary，调用方保证媒体库的生命周期覆盖本对象。
 */
class ImageReferenceGraph {
public:
    static constexpr const char* kCellImagesPart = "xl/cellimages.xml";
    static constexpr const char* kCellImagesRelsPart = "xl/_rels/cellimages.xml.rels";
    static constexpr const char* kDefaultDrawingPart = "xl/drawings/drawing1.xml";

    explicit ImageReferenceGraph(const MediaLibrary& media);

    /**
     * @brief 从包中读取两套机制的全部部件（缺失的部件视为空）
     * @param drawing_part 工作表对应的绘图部件路径
     * @throws core::ParseException 部件存在但 XML 格式错误
     */
    static ImageReferenceGraph build(const archive::PackageArchive& archive, const MediaLibrary& media,
                                     const std::string& drawing_part = kDefaultDrawingPart);

    void parseCellImages(std::string_view xml_content);
    void parseCellImageRelationships(std::string_view xml_content);
    void parseDrawing(std::string_view xml_content, const std::string& part_name = kDefaultDrawingPart);
    void parseDrawingRelationships(std::string_view xml_content, const std::string& part_name);

    /**
     * @brief 解析 DISPIMG 公式引用的图片
     * @return 任一环节缺失或字节少于 8 时返回 nullopt
     */
    std::optional<core::EmbeddedImage> resolveFormulaImage(std::string_view formula) const;

    /**
     * @brief 绘图中的全部浮动锚点（解析一次）
     */
    const std::vector<FloatingAnchor>& resolveFloatingImages() const { return floating_anchors_; }

    /**
     * @brief 通过绘图关系映射解析单个浮动图片，ID 为 floating_{row}_{col}_{rId}
     */
    std::optional<core::EmbeddedImage> resolveFloatingImage(const FloatingAnchor& anchor) const;

    /**
     * @brief 把图片挂到元数据上
     *
     * 先处理带 DISPIMG 公式的单元格，再处理浮动锚点；
     * 同一坐标已经有公式图片时保留公式图片。
     * @return 新挂上的图片数量
     */
    size_t linkInto(core::WorksheetMetadata& metadata) const;

    /**
     * @brief 是否为图片展示公式（包含 DISPIMG）
     */
    static bool isImageFormula(std::string_view formula);

    /**
     * @brief 从 DISPIMG("id", ...) 中提取图片ID
     */
    static std::optional<std::string> extractImageId(std::string_view formula);

    size_t getCellImageCount() const { return cell_image_ids_.size(); }
    size_t getDrawingImageCount() const { return drawing_image_ids_.size(); }

private:
    using StringMap = std::unordered_map<std::string, std::string>;

    const MediaLibrary* media_;

    StringMap cell_image_ids_;      // 图片ID -> rId（cellimages.xml）
    StringMap cell_image_targets_;  // rId -> 文件名（cellimages.xml.rels）
    StringMap drawing_image_ids_;   // 图片ID -> rId（drawing 中 ID_ 开头的名字）
    StringMap drawing_targets_;     // rId -> 文件名（drawing rels）
    std::vector<FloatingAnchor> floating_anchors_;

    const StringMap& idMap() const {
        return cell_image_ids_.empty() ? drawing_image_ids_ : cell_image_ids_;
    }
    const StringMap& targetMap() const {
        return cell_image_targets_.empty() ? drawing_targets_ : cell_image_targets_;
    }

    std::optional<core::EmbeddedImage> lookupMedia(const std::string& image_id, const std::string& file_name) const;
};

}} // namespace splitsheet::reader
