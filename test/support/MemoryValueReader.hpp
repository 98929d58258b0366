#pragma once

#include "splitsheet/core/CellTypes.hpp"
#include "splitsheet/core/RawValueReader.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <map>
#include <string>

namespace splitsheet {
namespace test {

/**
 * @brief 内存中的原始值表，按 (row, col) 保存文本
 */
class MemoryValueReader : public core::RawValueReader {
public:
    MemoryValueReader& set(int row, int col, std::string text) {
        cells_[{row, col}] = std::move(text);
        row_count_ = std::max(row_count_, row + 1);
        col_count_ = std::max(col_count_, col + 1);
        return *this;
    }

    MemoryValueReader& set(int row, int col, double number) {
        return set(row, col, fmt::format("{}", number));
    }

    MemoryValueReader& setBounds(int rows, int cols) {
        row_count_ = rows;
        col_count_ = cols;
        return *this;
    }

    std::string getString(int row, int col) const override {
        auto it = cells_.find({row, col});
        return it != cells_.end() ? it->second : std::string();
    }

    std::optional<double> getFloat(int row, int col) const override {
        auto it = cells_.find({row, col});
        if (it == cells_.end()) {
            return std::nullopt;
        }
        return core::parseNumber(it->second);
    }

    int rowCount() const override { return row_count_; }
    int colCount() const override { return col_count_; }

    bool isEmpty(int row, int col) const override {
        auto it = cells_.find({row, col});
        return it == cells_.end() || it->second.empty();
    }

private:
    std::map<std::pair<int, int>, std::string> cells_;
    int row_count_ = 0;
    int col_count_ = 0;
};

}} // namespace splitsheet::test
