#pragma once

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace splitsheet {
namespace utils {

/**
 * @brief 通用工具类 - 单元格引用与路径字符串的辅助函数
 */
class CommonUtils {
public:
    // ========== 单元格引用 ==========

    /**
     * @brief 列号转换为字母表示（A, B, ..., Z, AA, AB, ...）
     * @param col 列号（0开始）
     */
    static std::string columnToLetter(int col) {
        std::string result;
        while (col >= 0) {
            result.insert(result.begin(), static_cast<char>('A' + (col % 26)));
            col = col / 26 - 1;
        }
        return result;
    }

    /**
     * @brief 生成单元格引用（如A1, B2等）
     */
    static std::string cellReference(int row, int col) {
        return columnToLetter(col) + std::to_string(row + 1);
    }

    /**
     * @brief 生成范围引用（如A1:B2）
     */
    static std::string rangeReference(int first_row, int first_col, int last_row, int last_col) {
        return cellReference(first_row, first_col) + ":" + cellReference(last_row, last_col);
    }

    /**
     * @brief 解析单元格引用（如A1 -> (0, 0)），忽略绝对引用符号 $
     * @return 行列坐标（0开始）
     * @throws std::invalid_argument 如果引用格式不正确
     */
    static std::pair<int, int> parseReference(std::string_view reference) {
        if (reference.empty()) {
            throw std::invalid_argument("Empty cell reference");
        }

        size_t i = 0;
        if (reference[i] == '$') ++i;

        // 列部分，26进制字母
        int col = 0;
        while (i < reference.size() && std::isalpha(static_cast<unsigned char>(reference[i]))) {
            char c = static_cast<char>(std::toupper(static_cast<unsigned char>(reference[i])));
            col = col * 26 + (c - 'A' + 1);
            if (col > kMaxColumns) {
                throw std::invalid_argument("Column out of range in reference: " + std::string(reference));
            }
            ++i;
        }
        if (col == 0) {
            throw std::invalid_argument("No column part in reference: " + std::string(reference));
        }

        if (i < reference.size() && reference[i] == '$') ++i;

        if (i >= reference.size() || !std::isdigit(static_cast<unsigned char>(reference[i]))) {
            throw std::invalid_argument("No row part in reference: " + std::string(reference));
        }
        long row = 0;
        while (i < reference.size() && std::isdigit(static_cast<unsigned char>(reference[i]))) {
            row = row * 10 + (reference[i] - '0');
            if (row > kMaxRows) {
                throw std::invalid_argument("Row out of range in reference: " + std::string(reference));
            }
            ++i;
        }
        if (row == 0) {
            throw std::invalid_argument("Invalid row number in reference: " + std::string(reference));
        }
        if (i < reference.size()) {
            throw std::invalid_argument("Invalid characters at end of reference: " + std::string(reference));
        }

        return {static_cast<int>(row - 1), col - 1};
    }

    struct RangeBounds {
        int first_row;
        int first_col;
        int last_row;
        int last_col;
    };

    /**
     * @brief 解析范围引用（"A1:B3"），单个单元格视为 1x1 范围
     * @throws std::invalid_argument 如果任一端点格式不正确
     */
    static RangeBounds parseRange(std::string_view range) {
        size_t colon = range.find(':');
        if (colon == std::string_view::npos) {
            auto [row, col] = parseReference(range);
            return {row, col, row, col};
        }
        auto [r1, c1] = parseReference(range.substr(0, colon));
        auto [r2, c2] = parseReference(range.substr(colon + 1));
        return {std::min(r1, r2), std::min(c1, c2), std::max(r1, r2), std::max(c1, c2)};
    }

    // ========== 路径字符串 ==========

    /**
     * @brief 取包内路径的最后一段（"../media/image1.png" -> "image1.png"）
     */
    static std::string baseName(std::string_view path) {
        size_t slash = path.find_last_of("/\\");
        return std::string(slash == std::string_view::npos ? path : path.substr(slash + 1));
    }

    /**
     * @brief 取文件扩展名（不含点，小写），无扩展名时返回空
     */
    static std::string extensionOf(std::string_view name) {
        std::string base = baseName(name);
        size_t dot = base.find_last_of('.');
        if (dot == std::string::npos || dot + 1 >= base.size()) {
            return {};
        }
        std::string ext = base.substr(dot + 1);
        for (auto& ch : ext) {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        return ext;
    }

    static bool startsWith(std::string_view text, std::string_view prefix) {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }

    /**
     * @brief 按 OPC 规则把关系目标解析为包内绝对路径
     * @param base_dir 关系源所在目录（如 "xl/worksheets"）
     * @param target 关系目标（相对或以 "/" 开头的绝对路径）
     */
    static std::string resolvePartPath(std::string_view base_dir, std::string_view target) {
        if (!target.empty() && target.front() == '/') {
            return std::string(target.substr(1));
        }

        std::string joined = base_dir.empty() ? std::string(target)
                                              : std::string(base_dir) + "/" + std::string(target);
        std::string result;
        size_t pos = 0;
        while (pos <= joined.size()) {
            size_t next = joined.find('/', pos);
            if (next == std::string::npos) next = joined.size();
            std::string_view segment(joined.data() + pos, next - pos);
            if (segment == "..") {
                size_t cut = result.find_last_of('/');
                result.erase(cut == std::string::npos ? 0 : cut);
            } else if (!segment.empty() && segment != ".") {
                if (!result.empty()) result += '/';
                result.append(segment);
            }
            pos = next + 1;
        }
        return result;
    }

    /**
     * @brief 部件所在目录（"xl/worksheets/sheet1.xml" -> "xl/worksheets"）
     */
    static std::string directoryOf(std::string_view part_name) {
        size_t slash = part_name.find_last_of('/');
        return slash == std::string_view::npos ? std::string() : std::string(part_name.substr(0, slash));
    }

    /**
     * @brief 部件对应的关系部件（"xl/drawings/drawing1.xml" -> "xl/drawings/_rels/drawing1.xml.rels"）
     */
    static std::string relationshipsPartFor(std::string_view part_name) {
        std::string dir = directoryOf(part_name);
        std::string rels = dir.empty() ? std::string("_rels/") : dir + "/_rels/";
        return rels + baseName(part_name) + ".rels";
    }

    static constexpr int kMaxRows = 1048576;
    static constexpr int kMaxColumns = 16384;
};

}} // namespace splitsheet::utils
