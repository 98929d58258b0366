#pragma once

#include "splitsheet/core/Path.hpp"
#include "splitsheet/core/ProcessConfig.hpp"
#include <map>
#include <string>

namespace splitsheet {
namespace core {

/**
 * @brief 处理配置的持久化（JSON）
 *
 * 文件内容是以处理类型字符串为键的对象：
 * @code
 * {
 *   "air-freight": {"process_type": "air-freight", "weight_column": 15, "box_column": 13, "copy_images": true},
 *   ...
 * }
 * @endcode
 * 默认位置 {config_dir}/splitsheet/excel_configs.json，
 * config_dir 取 $XDG_CONFIG_HOME，未设置时为 $HOME/.config。
 */
class ConfigStore {
public:
    using ConfigMap = std::map<std::string, ProcessConfig>;

    static constexpr const char* kAppDirectory = "splitsheet";
    static constexpr const char* kFileName = "excel_configs.json";

    explicit ConfigStore(Path file_path) : file_path_(std::move(file_path)) {}

    /**
     * @brief 使用默认位置
     * @throws ConfigException 无法确定配置目录
     */
    static ConfigStore openDefault();

    /**
     * @brief 默认配置文件路径
     * @throws ConfigException $XDG_CONFIG_HOME 和 $HOME 都未设置
     */
    static Path defaultPath();

    /**
     * @brief 三种处理类型的默认配置
     */
    static ConfigMap defaults();

    /**
     * @brief 读取全部配置，文件不存在时返回默认配置
     * @throws ConfigException 读取失败或 JSON 格式错误
     */
    ConfigMap loadAll() const;

    /**
     * @brief 覆盖写入全部配置（必要时创建目录）
     * @throws ConfigException 写入失败
     */
    void saveAll(const ConfigMap& configs) const;

    /**
     * @brief 读取某个处理类型的配置，没有保存过时返回该类型的默认配置
     * @throws ConfigException 未知的处理类型（UnknownProcessType）或读取失败
     */
    ProcessConfig loadForType(const std::string& process_type) const;

    /**
     * @brief 保存单个配置（读取-修改-写回）
     */
    void saveForType(const ProcessConfig& config) const;

    const Path& path() const { return file_path_; }

private:
    Path file_path_;
};

}} // namespace splitsheet::core
