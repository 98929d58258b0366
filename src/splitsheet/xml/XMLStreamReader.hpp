#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include <expat.h>

namespace splitsheet {
namespace xml {

/**
 * @brief 基于 libexpat 的流式 XML 解析器
 *
 * - SAX 事件回调，不构建 DOM
 * - 元素文本在结束标签前一次性交付（可选去除首尾空白）
 * - 回调抛出的异常会停止解析，并以 CallbackError 返回
 */

enum class XMLParseError {
    Ok,
    InvalidInput,
    ParserCreateFailed,
    ParseFailed,
    MemoryError,
    CallbackError
};

constexpr bool operator!(XMLParseError error) noexcept {
    return error != XMLParseError::Ok;
}

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

constexpr bool isError(XMLParseError error) noexcept {
    return error != XMLParseError::Ok;
}

// 属性只在回调期间有效（直接引用 expat 缓冲区）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v)
        : name(n), value(v) {}
};

class XMLStreamReader {
public:
    using Attributes = std::vector<XMLAttribute>;
    using StartElementCallback = std::function<void(std::string_view name, const Attributes& attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;

    XMLStreamReader();
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    void setStartElementCallback(StartElementCallback callback);
    void setEndElementCallback(EndElementCallback callback);
    void setTextCallback(TextCallback callback);

    // 默认 true；共享字符串等需要保留空白的部件应关闭
    void setTrimWhitespace(bool trim);
    void setCollectText(bool collect);

    XMLParseError parseFromString(std::string_view xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);

    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    size_t getElementsParsed() const { return elements_parsed_; }

private:
    XML_Parser parser_ = nullptr;

    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;

    Attributes attributes_;
    std::string current_text_;
    bool collecting_text_ = false;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;

    bool trim_whitespace_ = true;
    bool collect_text_ = true;
    size_t elements_parsed_ = 0;

    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    void handleError(XMLParseError error, const std::string& message);
    void abortFromCallback(const char* stage, const std::exception& e);
    static std::string_view trimStringView(std::string_view str);
};

}} // namespace splitsheet::xml
