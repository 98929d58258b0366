#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace splitsheet {
namespace core {

/**
 * @brief 处理类型
 */
enum class ProcessType {
    SeaRailWithImage,  // 海铁（带图片）
    SeaRailNoImage,    // 海铁（不带图片）
    AirFreight         // 空运
};

/**
 * @brief 处理类型 -> 字符串键（"sea-rail-with-image" 等）
 */
const char* toString(ProcessType type) noexcept;

/**
 * @brief 字符串键 -> 处理类型，未知时返回 nullopt
 */
std::optional<ProcessType> processTypeFromString(std::string_view text);

/**
 * @brief 全部处理类型（固定顺序）
 */
const std::vector<ProcessType>& allProcessTypes();

/**
 * @brief 一次处理请求的配置
 *
 * 列号从 1 开始；重量列的前一列是数量列。
 * 整个流水线按 const 引用传递，处理过程中不修改。
 */
struct ProcessConfig {
    ProcessType process_type = ProcessType::SeaRailWithImage;
    int weight_column = 13;
    int box_column = 11;
    bool copy_images = true;

    /**
     * @brief 处理类型的默认配置
     *
     * sea-rail-with-image: 13 / 11 / 复制图片
     * sea-rail-no-image:   13 / 11 / 不复制图片
     * air-freight:         15 / 13 / 复制图片
     */
    static ProcessConfig defaultFor(ProcessType type);

    /**
     * @brief 校验列配置
     * @throws ValidationException 列号小于 1、重量列小于 2 或与箱数列相同
     */
    void validate() const;

    // 0 开始的列下标
    int weightIndex() const { return weight_column - 1; }
    int quantityIndex() const { return weight_column - 2; }
    int boxIndex() const { return box_column - 1; }

    bool operator==(const ProcessConfig& other) const {
        return process_type == other.process_type && weight_column == other.weight_column &&
               box_column == other.box_column && copy_images == other.copy_images;
    }
    bool operator!=(const ProcessConfig& other) const { return !(*this == other); }
};

}} // namespace splitsheet::core
