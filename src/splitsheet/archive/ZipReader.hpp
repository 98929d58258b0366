#pragma once

#include "splitsheet/archive/ZipError.hpp"
#include "splitsheet/core/Path.hpp"
#include <cstdint>
#include <ctime>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace splitsheet {
namespace archive {

/**
 * @brief ZIP读取器（minizip-ng）
 *
 * 打开时建立条目缓存，之后的查询不再遍历归档；
 * 条目顺序保持归档中的原始顺序。
 */
class ZipReader {
public:
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint32_t crc32 = 0;
        int compression_method = 0;
        time_t modified_date = 0;
        bool is_directory = false;
    };

    explicit ZipReader(const core::Path& path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    ZipReader(ZipReader&& other) noexcept;
    ZipReader& operator=(ZipReader&& other) noexcept;

    /**
     * 打开ZIP文件进行读取
     * @return 是否成功
     */
    bool open();

    bool close();

    bool isOpen() const { return is_open_; }

    /**
     * 获取所有文件路径（不含目录条目），保持归档顺序
     */
    std::vector<std::string> listFiles() const;

    /**
     * 检查条目是否存在
     * @return ZipError::Ok / FileNotFound / NotOpen
     */
    ZipError fileExists(std::string_view internal_path) const;

    bool getEntryInfo(std::string_view internal_path, EntryInfo& info) const;

    /**
     * 提取条目到字符串
     */
    ZipError extractFile(std::string_view internal_path, std::string& content) const;

    /**
     * 提取条目到字节数组
     */
    ZipError extractFile(std::string_view internal_path, std::vector<uint8_t>& data) const;

    const core::Path& getPath() const { return filepath_; }

private:
    void* unzip_handle_ = nullptr;
    core::Path filepath_;
    bool is_open_ = false;
    mutable std::mutex mutex_;

    std::vector<EntryInfo> entries_;
    std::unordered_map<std::string, size_t> entry_index_;

    bool initializeReader();
    void cleanup();
    void buildEntryCache();
    ZipError extractFileInternal(std::string_view internal_path,
                                 std::vector<uint8_t>& data) const;
};

}} // namespace splitsheet::archive
