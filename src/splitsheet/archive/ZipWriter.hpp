#pragma once

#include "splitsheet/archive/ZipError.hpp"
#include "splitsheet/core/Path.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace splitsheet {
namespace archive {

/**
 * @brief ZIP写入器（minizip-ng）
 *
 * - 同一路径只写一次，重复条目被跳过
 * - 不使用 Data Descriptor，兼容 Excel/WPS
 * - close() 严格检查中央目录是否写成功
 */
class ZipWriter {
public:
    struct FileEntry {
        std::string internal_path;
        std::string content;

        FileEntry() = default;
        FileEntry(std::string path, std::string data)
            : internal_path(std::move(path)), content(std::move(data)) {}
    };

    struct Stats {
        size_t entries_written = 0;
        size_t bytes_written = 0;
    };

    explicit ZipWriter(const core::Path& path);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * 创建ZIP文件进行写入（已存在的文件会被覆盖）
     * @return 是否成功
     */
    bool open();

    /**
     * 关闭ZIP文件并写入中央目录
     * @return 中央目录是否写成功
     */
    bool close();

    bool isOpen() const { return is_open_; }

    ZipError addFile(std::string_view internal_path, std::string_view content);
    ZipError addFile(std::string_view internal_path, const void* data, size_t size);

    /**
     * 批量添加文件
     */
    ZipError addFiles(const std::vector<FileEntry>& files);

    /**
     * 设置压缩级别（0-9，0 表示 STORE）
     */
    ZipError setCompressionLevel(int level);
    int getCompressionLevel() const { return compression_level_; }

    Stats getStats() const { return stats_; }

private:
    void* zip_handle_ = nullptr;
    core::Path filepath_;
    bool is_open_ = false;
    int compression_level_ = 6;
    std::unordered_set<std::string> written_paths_;
    Stats stats_;
    mutable std::mutex mutex_;

    bool initializeWriter();
    bool closeInternal();
    void initializeFileInfo(void* file_info, const std::string& path, size_t size) const;
    ZipError writeFileEntry(const std::string& internal_path, const void* data, size_t size);
};

}} // namespace splitsheet::archive
