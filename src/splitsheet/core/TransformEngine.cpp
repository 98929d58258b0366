#include "splitsheet/core/TransformEngine.hpp"
#include "splitsheet/core/ProgressLog.hpp"
#include "splitsheet/core/RawValueReader.hpp"
#include "splitsheet/core/WorksheetMetadata.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"
#include <cmath>

namespace splitsheet {
namespace core {

namespace {

bool isImageDisplayFormula(const std::string& formula) {
    return formula.find("DISPIMG") != std::string::npos;
}

StyledCellValue makeCell(CellValue value, CellStyle style) {
    StyledCellValue cell;
    cell.value = std::move(value);
    cell.style = std::move(style);
    return cell;
}

StyledCellValue makeImageCell(const EmbeddedImage& image, CellStyle style) {
    StyledCellValue cell;
    cell.style = std::move(style);
    cell.image = image;
    return cell;
}

StyledCellValue makeWeightCell(double weight, CellStyle style) {
    StyledCellValue cell;
    cell.value = CellValue::number(weight);
    cell.style = std::move(style);
    cell.is_weight_cell = true;
    return cell;
}

} // namespace

TransformEngine::TransformEngine(const RawValueReader& values, const WorksheetMetadata& metadata,
                                 const ProcessConfig& config)
    : values_(values), metadata_(metadata), config_(config) {
    config_.validate();
    precomputeWeightDistributions();
}

double TransformEngine::roundToCents(double value) {
    return std::round(value * 100.0) / 100.0;
}

void TransformEngine::precomputeWeightDistributions() {
    const int weight_col = config_.weightIndex();
    const int quantity_col = config_.quantityIndex();

    for (const auto& region : metadata_.merged_regions) {
        if (!region.spansColumn(weight_col)) {
            continue;
        }

        const double total = values_.getFloat(region.start_row, weight_col).value_or(0.0);

        double summed_quantity = 0.0;
        for (int r = region.start_row; r <= region.end_row; ++r) {
            summed_quantity += values_.getFloat(r, quantity_col).value_or(0.0);
        }

        if (summed_quantity == 0.0) {
            for (int r = region.start_row; r <= region.end_row; ++r) {
                weight_distributions_[r] = 0.0;
            }
            CORE_DEBUG("Region rows {}-{}: zero quantity, weights set to 0",
                       region.start_row + 1, region.end_row + 1);
            continue;
        }

        const double unit_weight = total / summed_quantity;
        for (int r = region.start_row; r <= region.end_row; ++r) {
            const double quantity = values_.getFloat(r, quantity_col).value_or(0.0);
            weight_distributions_[r] = roundToCents(unit_weight * quantity);
        }
        CORE_DEBUG("Region rows {}-{}: total {} over quantity {} (unit {})",
                   region.start_row + 1, region.end_row + 1, total, summed_quantity, unit_weight);
    }
}

std::optional<double> TransformEngine::distributedWeight(int row) const {
    auto it = weight_distributions_.find(row);
    if (it == weight_distributions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

CellGrid TransformEngine::transform(ProgressLog* progress) const {
    CellGrid grid;
    const int row_count = values_.rowCount();
    const int col_count = values_.colCount();

    for (int row = 0; row < row_count; ++row) {
        if (values_.isEmpty(row, 0)) {
            if (progress) {
                progress->addf("第 {} 行第一列为空，停止处理", row + 1);
            }
            break;
        }

        std::vector<StyledCellValue> cells;
        cells.reserve(static_cast<size_t>(col_count));
        for (int col = 0; col < col_count; ++col) {
            cells.push_back(transformCell(row, col));
        }
        grid.push_back(std::move(cells));
    }

    CORE_DEBUG("Transformed {} of {} rows ({} columns)", grid.size(), row_count, col_count);
    return grid;
}

StyledCellValue TransformEngine::transformCell(int row, int col) const {
    if (const MergedRegion* region = metadata_.findRegion(row, col)) {
        return transformMergedCell(row, col, *region);
    }
    return transformPlainCell(row, col);
}

StyledCellValue TransformEngine::transformMergedCell(int row, int col, const MergedRegion& region) const {
    const CellStyle start_style = regionStyle(region, row, col);

    if (col == config_.weightIndex()) {
        if (auto weight = distributedWeight(row)) {
            return makeWeightCell(*weight, start_style);
        }
        return makeWeightCell(values_.getFloat(row, col).value_or(0.0), start_style);
    }

    if (col == config_.boxIndex()) {
        CellStyle box_style = styleAt(region.start_row, col);
        if (row == region.start_row) {
            return makeCell(CellValue::sniff(values_.getString(region.start_row, col)), std::move(box_style));
        }
        return makeCell(CellValue::integer(0), std::move(box_style));
    }

    if (const EmbeddedImage* image = imageAt(row, col)) {
        return makeImageCell(*image, styleAt(row, col));
    }
    if (const EmbeddedImage* image = imageAt(region.start_row, region.start_col)) {
        return makeImageCell(*image, start_style);
    }

    if (auto formula = displayFormulaAt(row, col)) {
        return makeCell(CellValue::formula(*formula), styleAt(row, col));
    }
    if (auto formula = displayFormulaAt(region.start_row, region.start_col)) {
        return makeCell(CellValue::formula(*formula), start_style);
    }

    return makeCell(CellValue::sniff(values_.getString(region.start_row, region.start_col)), start_style);
}

StyledCellValue TransformEngine::transformPlainCell(int row, int col) const {
    CellStyle style = styleAt(row, col);

    if (const EmbeddedImage* image = imageAt(row, col)) {
        return makeImageCell(*image, std::move(style));
    }

    if (const std::string* formula = metadata_.formulaAt(CellCoordinate(row, col))) {
        // 图片公式没有解析到图片时输出空单元格
        if (isImageDisplayFormula(*formula)) {
            return makeCell(CellValue::empty(), std::move(style));
        }
        return makeCell(CellValue::formula(*formula), std::move(style));
    }

    return makeCell(CellValue::sniff(values_.getString(row, col)), std::move(style));
}

const EmbeddedImage* TransformEngine::imageAt(int row, int col) const {
    if (!config_.copy_images) {
        return nullptr;
    }
    return metadata_.imageAt(CellCoordinate(row, col));
}

CellStyle TransformEngine::styleAt(int row, int col) const {
    const CellStyle* style = metadata_.styleAt(CellCoordinate(row, col));
    return style ? *style : CellStyle();
}

CellStyle TransformEngine::regionStyle(const MergedRegion& region, int row, int col) const {
    if (const CellStyle* style = metadata_.styleAt(region.start())) {
        return *style;
    }
    return styleAt(row, col);
}

std::optional<std::string> TransformEngine::displayFormulaAt(int row, int col) const {
    const std::string* formula = metadata_.formulaAt(CellCoordinate(row, col));
    if (!formula || isImageDisplayFormula(*formula)) {
        return std::nullopt;
    }
    return *formula;
}

}} // namespace splitsheet::core
