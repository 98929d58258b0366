#pragma once

#include "splitsheet/core/CellTypes.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace splitsheet {
namespace core {

/**
 * @brief 单个工作表的展示元数据
 *
 * 每次请求从源文件构建一次，交给 TransformEngine 之后只读。
 */
struct WorksheetMetadata {
    static constexpr double kFallbackColumnWidth = 8.43;

    std::vector<MergedRegion> merged_regions;
    std::map<int, double> column_widths;  // 显式列宽（字符宽度）
    double default_column_width = kFallbackColumnWidth;

    std::unordered_map<CellCoordinate, CellStyle> cell_styles;
    std::unordered_map<CellCoordinate, std::string> cell_formulas;
    std::unordered_map<CellCoordinate, EmbeddedImage> cell_images;

    // 媒体诊断
    std::vector<std::string> converted_media;
    std::vector<std::string> unsupported_media;

    /**
     * @brief 包含该坐标的合并区域，没有时返回 nullptr（区域互不重叠，取第一个）
     */
    const MergedRegion* findRegion(int row, int col) const {
        for (const auto& region : merged_regions) {
            if (region.contains(row, col)) {
                return &region;
            }
        }
        return nullptr;
    }

    const CellStyle* styleAt(const CellCoordinate& coord) const {
        auto it = cell_styles.find(coord);
        return it != cell_styles.end() ? &it->second : nullptr;
    }

    const std::string* formulaAt(const CellCoordinate& coord) const {
        auto it = cell_formulas.find(coord);
        return it != cell_formulas.end() ? &it->second : nullptr;
    }

    const EmbeddedImage* imageAt(const CellCoordinate& coord) const {
        auto it = cell_images.find(coord);
        return it != cell_images.end() ? &it->second : nullptr;
    }

    double columnWidth(int col) const {
        auto it = column_widths.find(col);
        return it != column_widths.end() ? it->second : default_column_width;
    }
};

}} // namespace splitsheet::core
