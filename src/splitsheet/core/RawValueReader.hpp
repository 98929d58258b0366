#pragma once

#include <optional>
#include <string>

namespace splitsheet {
namespace core {

/**
 * @brief 原始单元格值读取接口
 *
 * 坐标为 0 开始的绝对坐标；越界或空单元格返回空串 / nullopt。
 */
class RawValueReader {
public:
    virtual ~RawValueReader() = default;

    virtual std::string getString(int row, int col) const = 0;
    virtual std::optional<double> getFloat(int row, int col) const = 0;
    virtual int rowCount() const = 0;
    virtual int colCount() const = 0;
    virtual bool isEmpty(int row, int col) const = 0;
};

}} // namespace splitsheet::core
