#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace splitsheet {
namespace xml {

/**
 * @brief 输出用共享字符串表（去重）
 */
class SharedStrings {
public:
    SharedStrings() = default;

    // 添加共享字符串，已存在时返回原索引
    int addString(const std::string& str);

    // 获取字符串索引，不存在返回 -1
    int getStringIndex(const std::string& str) const;

    std::string getString(int index) const;

    /**
     * @brief 生成 xl/sharedStrings.xml
     */
    std::string generate() const;

    void clear();

    size_t size() const { return strings_.size(); }

    // 引用次数（sst@count）
    size_t referenceCount() const { return reference_count_; }

private:
    std::vector<std::string> strings_;
    std::unordered_map<std::string, int> string_map_;
    size_t reference_count_ = 0;
};

}} // namespace splitsheet::xml
