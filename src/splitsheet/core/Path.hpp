#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace splitsheet {
namespace core {

/**
 * @brief UTF-8路径封装
 *
 * 内部统一保存 UTF-8 字符串，文件系统操作委托给 std::filesystem，
 * 失败时返回 false 并记录调试日志，不抛异常。
 */
class Path {
private:
    std::string utf8_path_;

public:
    explicit Path(const std::string& path) : utf8_path_(path) {}
    explicit Path(const char* path) : utf8_path_(path ? path : "") {}
    Path() = default;

    const std::string& string() const { return utf8_path_; }
    const char* c_str() const { return utf8_path_.c_str(); }
    bool empty() const { return utf8_path_.empty(); }

    // 路径分解
    /**
     * @brief 父目录（"a/b/c.xlsx" -> "a/b"），没有父目录时为空
     */
    Path parent() const;

    /**
     * @brief 不含扩展名的文件名（"a/b/c.xlsx" -> "c"）
     */
    std::string stem() const;

    /**
     * @brief 扩展名，不含点（"a/b/c.xlsx" -> "xlsx"）
     */
    std::string extension() const;

    /**
     * @brief 拼接子路径
     */
    Path operator/(const std::string& child) const;

    // 文件操作
    bool exists() const;
    bool isFile() const;
    uintmax_t fileSize() const;
    bool remove() const;

    /**
     * @brief 重命名/移动到目标路径（目标存在时覆盖）
     */
    bool moveTo(const Path& target) const;

    /**
     * @brief 递归创建目录
     */
    bool createDirectories() const;

    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }

    friend std::ostream& operator<<(std::ostream& os, const Path& path) {
        return os << path.utf8_path_;
    }
};

}} // namespace splitsheet::core
