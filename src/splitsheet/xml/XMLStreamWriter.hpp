/**
 * @file XMLStreamWriter.hpp
 * @brief 内存缓冲的XML流写入器
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace splitsheet {
namespace xml {

/**
 * @brief XML流写入器
 *
 * 属性先暂存，到元素内容开始或元素结束时一次性写出；
 * 没有内容的元素自动自闭合。文本与属性值统一转义。
 */
class XMLStreamWriter {
public:
    XMLStreamWriter();
    ~XMLStreamWriter();

    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;

    void startDocument(const std::string& encoding = "UTF-8");

    /**
     * @brief 关闭所有未关闭的元素
     */
    void endDocument();

    void startElement(const std::string& name);
    void endElement();
    void writeEmptyElement(const std::string& name);

    void writeAttribute(const std::string& name, const std::string& value);
    void writeAttribute(const std::string& name, const char* value);
    void writeAttribute(const std::string& name, std::string_view value);
    void writeAttribute(const std::string& name, int value);
    void writeAttribute(const std::string& name, int64_t value);
    void writeAttribute(const std::string& name, double value);
    void writeAttribute(const std::string& name, bool value);

    void writeText(std::string_view text);
    void writeText(int value);
    void writeText(double value);

    // 原样写入（调用方保证合法）
    void writeRaw(std::string_view data);

    std::string toString() const;
    void clear();

    size_t getBytesWritten() const { return buffer_.size(); }
    size_t depth() const { return element_stack_.size(); }

private:
    struct PendingAttribute {
        std::string key;
        std::string value;

        PendingAttribute(std::string k, std::string v)
            : key(std::move(k)), value(std::move(v)) {}
    };

    std::string buffer_;
    std::vector<std::string> element_stack_;
    std::vector<PendingAttribute> pending_attributes_;
    bool in_element_ = false;

    void addPendingAttribute(const std::string& name, std::string value);
    void writeAttributesToBuffer();
    void ensureElementClosed();
    void appendEscaped(std::string_view text, bool attribute);
};

/**
 * @brief 数值转换为 XML 属性/文本使用的最短形式（100.0 -> "100"，0.5 -> "0.5"）
 */
std::string formatNumber(double value);

}} // namespace splitsheet::xml
