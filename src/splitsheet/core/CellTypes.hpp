#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace splitsheet {
namespace core {

/**
 * @brief 单元格坐标（0开始）
 */
struct CellCoordinate {
    int row = 0;
    int col = 0;

    CellCoordinate() = default;
    CellCoordinate(int r, int c) : row(r), col(c) {}

    bool operator==(const CellCoordinate& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const CellCoordinate& other) const { return !(*this == other); }
    bool operator<(const CellCoordinate& other) const {
        return row != other.row ? row < other.row : col < other.col;
    }
};

struct CellCoordinateHash {
    size_t operator()(const CellCoordinate& coord) const noexcept {
        return (static_cast<size_t>(static_cast<uint32_t>(coord.row)) << 20) ^
               static_cast<size_t>(static_cast<uint32_t>(coord.col));
    }
};

/**
 * @brief 合并区域（闭区间），数据归属左上角单元格
 */
struct MergedRegion {
    int start_row = 0;
    int start_col = 0;
    int end_row = 0;
    int end_col = 0;

    MergedRegion() = default;
    MergedRegion(int sr, int sc, int er, int ec)
        : start_row(sr), start_col(sc), end_row(er), end_col(ec) {}

    bool contains(int row, int col) const {
        return row >= start_row && row <= end_row && col >= start_col && col <= end_col;
    }

    bool spansColumn(int col) const { return col >= start_col && col <= end_col; }
    int rowCount() const { return end_row - start_row + 1; }
    CellCoordinate start() const { return CellCoordinate(start_row, start_col); }

    bool operator==(const MergedRegion& other) const {
        return start_row == other.start_row && start_col == other.start_col &&
               end_row == other.end_row && end_col == other.end_col;
    }
};

/**
 * @brief 单元格展示样式（只保存非默认部分）
 *
 * number_format 为空表示 General；background_color 为 6 位 RGB 十六进制（如 "FFFF00"）。
 */
struct CellStyle {
    std::optional<std::string> number_format;
    std::optional<std::string> background_color;

    bool isDefault() const {
        return (!number_format || *number_format == "General") && !background_color;
    }

    bool operator==(const CellStyle& other) const {
        return number_format == other.number_format && background_color == other.background_color;
    }
};

/**
 * @brief 已解析出字节的嵌入图片
 *
 * 字节用 shared_ptr 共享，合并区域内多个单元格引用同一张图片时不复制数据。
 */
struct EmbeddedImage {
    std::string id;
    std::shared_ptr<const std::vector<uint8_t>> bytes;
    std::string extension;  // png / jpeg / gif / bmp ...

    EmbeddedImage() = default;
    EmbeddedImage(std::string image_id, std::vector<uint8_t> data, std::string ext)
        : id(std::move(image_id)),
          bytes(std::make_shared<const std::vector<uint8_t>>(std::move(data))),
          extension(std::move(ext)) {}

    size_t size() const { return bytes ? bytes->size() : 0; }
};

/**
 * @brief 公式文本（始终以 "=" 开头）
 */
struct Formula {
    std::string text;

    bool operator==(const Formula& other) const { return text == other.text; }
};

/**
 * @brief 输出单元格值：Empty | String | Number | Integer | Formula
 */
class CellValue {
public:
    enum class Type { Empty, String, Number, Integer, Formula };

    CellValue() = default;

    static CellValue empty() { return CellValue(); }
    static CellValue string(std::string text) { return CellValue(Storage(std::move(text))); }
    static CellValue number(double value) { return CellValue(Storage(value)); }
    static CellValue integer(int64_t value) { return CellValue(Storage(value)); }
    static CellValue formula(std::string text);

    /**
     * @brief 按原始文本推断类型：整数 -> Integer，浮点 -> Number，非空 -> String，空 -> Empty
     */
    static CellValue sniff(std::string_view raw);

    Type type() const { return static_cast<Type>(value_.index()); }
    bool isEmpty() const { return type() == Type::Empty; }

    const std::string& asString() const { return std::get<std::string>(value_); }
    double asNumber() const { return std::get<double>(value_); }
    int64_t asInteger() const { return std::get<int64_t>(value_); }
    const std::string& formulaText() const { return std::get<Formula>(value_).text; }

    /**
     * @brief 数值视图（Number 与 Integer），其他类型返回 nullopt
     */
    std::optional<double> numericValue() const;

    bool operator==(const CellValue& other) const { return value_ == other.value_; }
    bool operator!=(const CellValue& other) const { return !(*this == other); }

private:
    using Storage = std::variant<std::monostate, std::string, double, int64_t, Formula>;
    Storage value_;

    explicit CellValue(Storage value) : value_(std::move(value)) {}
};

/**
 * @brief 变换引擎的输出单元
 */
struct StyledCellValue {
    CellValue value;
    CellStyle style;
    bool is_weight_cell = false;
    std::optional<EmbeddedImage> image;
};

// 严格解析（不允许首尾空白、十六进制、非有限值）
std::optional<int64_t> parseInteger(std::string_view text);
std::optional<double> parseNumber(std::string_view text);

}} // namespace splitsheet::core

namespace std {
template<>
struct hash<splitsheet::core::CellCoordinate> {
    size_t operator()(const splitsheet::core::CellCoordinate& coord) const noexcept {
        return splitsheet::core::CellCoordinateHash()(coord);
    }
};
} // namespace std
