#include "splitsheet/core/ConfigStore.hpp"
#include "splitsheet/core/Exception.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"

#include <nlohmann/json.hpp>
#include <fmt/format.h>

#include <cstdlib>
#include <fstream>
#include <iterator>

namespace splitsheet {
namespace core {

using json = nlohmann::json;

// nlohmann/json 通过 ADL 查找，必须和 ProcessConfig 在同一命名空间
void to_json(json& j, const ProcessConfig& config) {
    j = json{
        {"process_type", toString(config.process_type)},
        {"weight_column", config.weight_column},
        {"box_column", config.box_column},
        {"copy_images", config.copy_images}
    };
}

void from_json(const json& j, ProcessConfig& config) {
    const std::string type_name = j.at("process_type").get<std::string>();
    auto type = processTypeFromString(type_name);
    if (!type) {
        throw ConfigException(fmt::format("未知的处理类型: {}", type_name),
                              ErrorCode::UnknownProcessType, __FILE__, __LINE__);
    }

    const ProcessConfig defaults = ProcessConfig::defaultFor(*type);
    config.process_type = *type;
    config.weight_column = j.value("weight_column", defaults.weight_column);
    config.box_column = j.value("box_column", defaults.box_column);
    config.copy_images = j.value("copy_images", defaults.copy_images);
}

ConfigStore ConfigStore::openDefault() {
    return ConfigStore(defaultPath());
}

Path ConfigStore::defaultPath() {
    std::string config_dir;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        config_dir = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        config_dir = fmt::format("{}/.config", home);
    } else {
        throw ConfigException("无法获取配置目录", ErrorCode::ConfigReadError, __FILE__, __LINE__);
    }
    return Path(config_dir) / kAppDirectory / kFileName;
}

ConfigStore::ConfigMap ConfigStore::defaults() {
    ConfigMap configs;
    for (ProcessType type : allProcessTypes()) {
        configs.emplace(toString(type), ProcessConfig::defaultFor(type));
    }
    return configs;
}

ConfigStore::ConfigMap ConfigStore::loadAll() const {
    if (!file_path_.exists()) {
        CORE_DEBUG("Config file {} not found, using defaults", file_path_.string());
        return defaults();
    }

    std::ifstream in(file_path_.string(), std::ios::binary);
    if (!in) {
        throw ConfigException(fmt::format("读取配置文件失败: {}", file_path_.string()),
                              ErrorCode::ConfigReadError, __FILE__, __LINE__);
    }
    const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    try {
        const json root = json::parse(content);
        if (!root.is_object()) {
            throw ConfigException("解析配置文件失败: 顶层必须是对象",
                                  ErrorCode::ConfigParseError, __FILE__, __LINE__);
        }
        ConfigMap configs;
        for (auto it = root.begin(); it != root.end(); ++it) {
            configs.emplace(it.key(), it.value().get<ProcessConfig>());
        }
        CORE_DEBUG("Loaded {} process configs from {}", configs.size(), file_path_.string());
        return configs;
    } catch (const json::exception& e) {
        throw ConfigException(fmt::format("解析配置文件失败: {}", e.what()),
                              ErrorCode::ConfigParseError, __FILE__, __LINE__);
    }
}

void ConfigStore::saveAll(const ConfigMap& configs) const {
    const Path dir = file_path_.parent();
    if (!dir.empty() && !dir.exists() && !dir.createDirectories()) {
        throw ConfigException(fmt::format("创建配置目录失败: {}", dir.string()),
                              ErrorCode::ConfigWriteError, __FILE__, __LINE__);
    }

    json root = json::object();
    for (const auto& [key, config] : configs) {
        root[key] = config;
    }

    std::ofstream out(file_path_.string(), std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ConfigException(fmt::format("写入配置文件失败: {}", file_path_.string()),
                              ErrorCode::ConfigWriteError, __FILE__, __LINE__);
    }
    out << root.dump(2);
    out.flush();
    if (!out) {
        throw ConfigException(fmt::format("写入配置文件失败: {}", file_path_.string()),
                              ErrorCode::ConfigWriteError, __FILE__, __LINE__);
    }
    CORE_DEBUG("Saved {} process configs to {}", configs.size(), file_path_.string());
}

ProcessConfig ConfigStore::loadForType(const std::string& process_type) const {
    const ConfigMap configs = loadAll();
    auto it = configs.find(process_type);
    if (it != configs.end()) {
        return it->second;
    }

    auto type = processTypeFromString(process_type);
    if (!type) {
        throw ConfigException(fmt::format("未知的处理类型: {}", process_type),
                              ErrorCode::UnknownProcessType, __FILE__, __LINE__);
    }
    return ProcessConfig::defaultFor(*type);
}

void ConfigStore::saveForType(const ProcessConfig& config) const {
    ConfigMap configs = loadAll();
    configs[toString(config.process_type)] = config;
    saveAll(configs);
}

}} // namespace splitsheet::core
