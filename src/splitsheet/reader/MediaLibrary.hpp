#pragma once

#include "splitsheet/core/Expected.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace splitsheet {
namespace archive {
class PackageArchive;
}

namespace reader {

/**
 * @brief 包内的一个可嵌入媒体文件
 */
struct MediaFile {
    std::shared_ptr<const std::vector<uint8_t>> bytes;
    std::string extension;
};

/**
 * @brief 媒体库：扫描包内图片并规范化容器格式
 *
 * - 候选部件：xl/media/、xl/embeddings/ 或路径中含 /media/，且不少于 8 字节
 * - 以文件名（去掉目录）为键
 * - PNG/JPEG/GIF/BMP 原样保留，扩展名取自文件名（缺省 png）
 * - WebP 解码后重新编码为 PNG，记入 converted 列表
 * - 其他格式或转换失败记入 unsupported 列表并排除
 */
class MediaLibrary {
public:
    MediaLibrary() = default;

    static MediaLibrary scan(const archive::PackageArchive& archive);

    /**
     * @brief 按文件名查找，不存在时返回 nullptr
     */
    const MediaFile* find(const std::string& file_name) const;

    size_t size() const { return files_.size(); }
    bool empty() const { return files_.empty(); }

    // 诊断信息："{name} (WebP->PNG)" / 文件名
    const std::vector<std::string>& converted() const { return converted_; }
    const std::vector<std::string>& unsupported() const { return unsupported_; }

    /**
     * @brief 部件路径是否位于媒体目录
     */
    static bool isMediaCandidate(std::string_view part_name);

    /**
     * @brief WebP -> PNG（libwebp 解码，stb_image_write 编码）
     */
    static core::Result<std::vector<uint8_t>> convertWebPToPng(const std::vector<uint8_t>& data);

    /**
     * @brief 加入一个媒体文件，按魔数决定保留、转换或拒绝
     * @return 是否被收录
     */
    bool add(const std::string& file_name, std::vector<uint8_t> data);

private:
    std::unordered_map<std::string, MediaFile> files_;
    std::vector<std::string> converted_;
    std::vector<std::string> unsupported_;
};

}} // namespace splitsheet::reader
