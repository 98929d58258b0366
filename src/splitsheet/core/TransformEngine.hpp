#pragma once

#include "splitsheet/core/CellTypes.hpp"
#include "splitsheet/core/ProcessConfig.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace splitsheet {
namespace core {

class RawValueReader;
class ProgressLog;
struct WorksheetMetadata;

using CellGrid = std::vector<std::vector<StyledCellValue>>;

/**
 * @brief 拆分变换引擎
 *
 * 按行扫描原始值，结合元数据计算每个输出单元格的值、样式和图片：
 * - 合并区域内的重量列：按数量列比例分摊区域总重量，保留两位小数
 * - 合并区域内的箱数列：区域第一行保留原值，其余行为 0
 * - 其他合并单元格：图片 > 非图片公式 > 区域左上角的值，样式取区域左上角
 * - 非合并单元格：图片 > 非图片公式 > 原始值按类型推断
 *
 * 第一列为空的行出现时停止扫描，之后的行全部丢弃。
 * 引擎借用读取器、元数据和配置，调用方保证它们在 transform() 期间有效。
 */
class TransformEngine {
public:
    /**
     * @throws ValidationException 配置不合法
     */
    TransformEngine(const RawValueReader& values, const WorksheetMetadata& metadata,
                    const ProcessConfig& config);

    /**
     * @brief 执行变换
     * @param progress 可选，记录停止行等处理进度
     */
    CellGrid transform(ProgressLog* progress = nullptr) const;

    /**
     * @brief 单个单元格的变换结果
     */
    StyledCellValue transformCell(int row, int col) const;

    /**
     * @brief 预计算的分摊重量，(row, 重量列) 不在任何跨重量列的合并区域内时为 nullopt
     */
    std::optional<double> distributedWeight(int row) const;

    size_t getDistributionCount() const { return weight_distributions_.size(); }

    /**
     * @brief 四舍五入到两位小数（远离零）
     */
    static double roundToCents(double value);

private:
    const RawValueReader& values_;
    const WorksheetMetadata& metadata_;
    const ProcessConfig& config_;

    // 行号 -> 分摊后的重量（只针对重量列）
    std::unordered_map<int, double> weight_distributions_;

    void precomputeWeightDistributions();

    StyledCellValue transformMergedCell(int row, int col, const MergedRegion& region) const;
    StyledCellValue transformPlainCell(int row, int col) const;

    const EmbeddedImage* imageAt(int row, int col) const;
    CellStyle styleAt(int row, int col) const;
    CellStyle regionStyle(const MergedRegion& region, int row, int col) const;
    std::optional<std::string> displayFormulaAt(int row, int col) const;
};

}} // namespace splitsheet::core
