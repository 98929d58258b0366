#pragma once

#include "splitsheet/core/Image.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace splitsheet {
namespace xml {

class XMLStreamWriter;

/**
 * @brief 绘图中的一张图片
 */
struct DrawingImage {
    core::ImageAnchor anchor;
    std::string name;        // cNvPr@name
    std::string media_file;  // xl/media 下的文件名，如 image1.png
};

/**
 * @brief 绘图XML生成器（xl/drawings/drawingN.xml 及其关系部件）
 *
 * 每张图片输出为 twoCellAnchor editAs="twoCell"：
 * from/to 为同一个单元格，偏移量决定图片在单元格内的位置和大小，随单元格移动和缩放。
 * 第 i 张图片（从 0 开始）的关系ID为 rId{i+1}。
 */
class DrawingXMLGenerator {
public:
    static constexpr int64_t EMU_PER_PIXEL = 9525;

    explicit DrawingXMLGenerator(const std::vector<DrawingImage>& images) : images_(images) {}

    std::string generateDrawingXML() const;
    std::string generateDrawingRelsXML() const;

    bool hasImages() const { return !images_.empty(); }

    static int64_t pixelsToEMU(double pixels);

private:
    const std::vector<DrawingImage>& images_;

    void generateImageXML(XMLStreamWriter& writer, const DrawingImage& image, int image_index) const;
    void generatePictureXML(XMLStreamWriter& writer, const DrawingImage& image, int image_index) const;
    static void writeMarker(XMLStreamWriter& writer, const char* element, int row, int col,
                            double offset_x, double offset_y);
};

}} // namespace splitsheet::xml
