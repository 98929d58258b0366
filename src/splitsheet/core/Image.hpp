#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace splitsheet {
namespace core {

/**
 * @brief 图片容器格式（按魔数识别）
 */
enum class ImageFormat : uint8_t {
    PNG = 0,
    JPEG = 1,
    GIF = 2,
    BMP = 3,
    WEBP = 4,
    UNKNOWN = 255
};

/**
 * @brief 图片锚定信息（输出绘图使用）
 *
 * 起止单元格相同、通过偏移定位在单元格内部，随单元格移动和缩放。
 */
struct ImageAnchor {
    int from_row = 0;
    int from_col = 0;
    int to_row = 0;
    int to_col = 0;

    // 像素
    double offset_x = 0.0;
    double offset_y = 0.0;
    double width = 0.0;
    double height = 0.0;

    ImageAnchor() = default;
    ImageAnchor(int row, int col, double w, double h, double ox, double oy)
        : from_row(row), from_col(col), to_row(row), to_col(col),
          offset_x(ox), offset_y(oy), width(w), height(h) {}
};

/**
 * @brief 图片工具函数
 */
class ImageUtils {
public:
    /**
     * @brief 按魔数识别格式；少于 8 字节视为 UNKNOWN（WebP 至少需要 12 字节）
     */
    static ImageFormat detectFormat(const std::vector<uint8_t>& data);

    /**
     * @brief 读取像素尺寸（stb_image，不解码像素）
     * @return 是否成功
     */
    static bool readDimensions(const std::vector<uint8_t>& data, int& width, int& height);

    static std::string formatToString(ImageFormat format);
    static std::string getFileExtension(ImageFormat format);
    static std::string getMimeType(ImageFormat format);

    /**
     * @brief 扩展名对应的 MIME 类型（jpg/jpeg/png/gif/bmp），未知时 application/octet-stream
     */
    static std::string mimeTypeForExtension(const std::string& extension);

    /**
     * @brief 等比缩放进 box×box 的方框
     */
    static void fitInto(int width, int height, double box, double& out_width, double& out_height);
};

}} // namespace splitsheet::core
