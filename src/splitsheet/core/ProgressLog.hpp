#pragma once

#include <string>
#include <utility>
#include <vector>
#include <fmt/format.h>

namespace splitsheet {
namespace core {

/**
 * @brief 返回给调用方的处理进度记录
 *
 * 与 Logger 分开：这里的每一行都会出现在处理结果里，同时以 INFO 级别写入日志。
 */
class ProgressLog {
public:
    ProgressLog() = default;

    void add(std::string line);

    template<typename... Args>
    void addf(fmt::format_string<Args...> format_str, Args&&... args) {
        add(fmt::format(format_str, std::forward<Args>(args)...));
    }

    const std::vector<std::string>& lines() const { return lines_; }
    std::vector<std::string> release() { return std::move(lines_); }

    size_t size() const { return lines_.size(); }
    bool empty() const { return lines_.empty(); }

    /**
     * @brief 是否有包含 fragment 的记录
     */
    bool contains(const std::string& fragment) const;

private:
    std::vector<std::string> lines_;
};

}} // namespace splitsheet::core
