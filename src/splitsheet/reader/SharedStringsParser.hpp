#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace splitsheet {
namespace reader {

/**
 * @brief 共享字符串表解析器（xl/sharedStrings.xml）
 *
 * 每个 si 拼接其下所有 t 文本（包括富文本 r/t），保留空白；
 * 拼音注释 rPh 中的文本不计入。
 */
class SharedStringsParser {
public:
    SharedStringsParser() = default;

    /**
     * @throws core::ParseException XML 格式错误（CorruptedSharedStrings）
     */
    void parse(std::string_view xml_content);

    const std::string* get(size_t index) const {
        return index < strings_.size() ? &strings_[index] : nullptr;
    }

    size_t size() const { return strings_.size(); }
    const std::vector<std::string>& strings() const { return strings_; }

private:
    std::vector<std::string> strings_;
};

}} // namespace splitsheet::reader
