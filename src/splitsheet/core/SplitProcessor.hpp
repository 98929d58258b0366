#pragma once

#include "splitsheet/core/Path.hpp"
#include "splitsheet/core/ProcessConfig.hpp"
#include <string>
#include <vector>

namespace splitsheet {
namespace core {

/**
 * @brief 一次处理的结果
 */
struct ProcessResult {
    bool success = false;
    std::string output_path;
    std::string message;
    std::vector<std::string> logs;  // 按顺序的进度记录
};

/**
 * @brief 拆分表处理流水线
 *
 * 打开源文件 -> 读取第一个工作表的原始值 -> 解析样式、媒体、图片引用和工作表元数据
 * -> TransformEngine 变换 -> WorkbookWriter 写出 "{目录}/{文件名}_拆分表.{扩展名}"。
 *
 * 整个流水线只打开一次源文件，所有子解析器借用同一个句柄。
 * 除单元格级的图片嵌入失败外，任何错误都以异常形式抛出，并且不会留下输出文件。
 */
class SplitProcessor {
public:
    explicit SplitProcessor(const ProcessConfig& config) : config_(config) {}

    /**
     * @brief 处理一个文件
     * @throws FileException 源文件打不开或缺少工作表
     * @throws ParseException 部件 XML 格式错误
     * @throws ValidationException 配置不合法
     * @throws WriteException 输出文件写入失败
     */
    ProcessResult process(const std::string& input_path) const;

    /**
     * @brief 输出文件路径：同目录下的 "{stem}_拆分表.{ext}"，没有扩展名时用 xlsx
     * @throws FileException 输入路径没有文件名
     */
    static Path outputPathFor(const Path& input_path);

    const ProcessConfig& config() const { return config_; }

private:
    const ProcessConfig& config_;
};

}} // namespace splitsheet::core
