#pragma once

#include "splitsheet/archive/ZipReader.hpp"
#include "splitsheet/core/Path.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace splitsheet {
namespace archive {

/**
 * @brief 只读的表格包（xlsx）句柄
 *
 * 整个请求只打开一次，所有子解析器以引用方式借用；
 * 句柄的生命周期必须覆盖所有借用者。
 */
class PackageArchive {
public:
    /**
     * @brief 打开包文件
     * @throws core::FileException 文件不存在或不是合法的ZIP容器
     */
    explicit PackageArchive(const core::Path& path);

    PackageArchive(const PackageArchive&) = delete;
    PackageArchive& operator=(const PackageArchive&) = delete;

    bool hasPart(std::string_view name) const;

    /**
     * @brief 读取必需部件
     * @throws core::FileException 部件不存在（MissingPart）或读取失败
     */
    std::string readText(std::string_view name) const;
    std::vector<uint8_t> readBytes(std::string_view name) const;

    // 可选部件：不存在时返回 std::nullopt
    std::optional<std::string> tryReadText(std::string_view name) const;
    std::optional<std::vector<uint8_t>> tryReadBytes(std::string_view name) const;

    /**
     * @brief 包内所有文件部件（归档顺序）
     */
    std::vector<std::string> listParts() const;

    const core::Path& path() const { return path_; }

private:
    core::Path path_;
    ZipReader reader_;

    [[noreturn]] void failRead(std::string_view name, ZipError error) const;
};

}} // namespace splitsheet::archive
