#pragma once

#include "splitsheet/xml/XMLStreamReader.hpp"
#include "splitsheet/core/Exception.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace splitsheet {
namespace reader {

/**
 * @brief 通用SAX解析器基类
 *
 * - 基于 XMLStreamReader 的事件回调，不构建 DOM
 * - 元素栈只保存本地名（去掉 "xdr:"、"a:" 等前缀），子类按本地名匹配
 * - 属性查找同样按本地名进行（"r:embed" 与 "embed" 等价）
 */
class BaseSAXParser {
protected:
    using Attributes = std::vector<xml::XMLAttribute>;

    struct ParseState {
        std::vector<std::string> element_stack;
        int current_depth = 0;
        bool has_error = false;
        std::string error_message;

        void reset() {
            element_stack.clear();
            current_depth = 0;
            has_error = false;
            error_message.clear();
        }

    };

    ParseState state_;
    bool trim_whitespace_ = true;

public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析XML内容的统一入口
     * @return 是否解析成功；失败原因见 getErrorMessage()
     */
    bool parseXML(std::string_view xml_content) {
        state_.reset();

        if (xml_content.empty()) {
            setError("Empty XML content");
            return false;
        }

        xml::XMLStreamReader reader;
        reader.setTrimWhitespace(trim_whitespace_);
        reader.setStartElementCallback([this](std::string_view name, const Attributes& attributes, int depth) {
            handleStartElement(name, attributes, depth);
        });
        reader.setEndElementCallback([this](std::string_view name, int depth) {
            handleEndElement(name, depth);
        });
        reader.setTextCallback([this](std::string_view text, int depth) {
            handleText(text, depth);
        });

        auto result = reader.parseFromString(xml_content);
        if (result != xml::XMLParseError::Ok) {
            if (!state_.has_error) {
                setError(reader.getLastErrorMessage());
            }
            return false;
        }
        return !state_.has_error;
    }

    /**
     * @brief 解析部件，失败时抛出 ParseException
     */
    void parseOrThrow(std::string_view xml_content, const std::string& part_name,
                      core::ErrorCode code = core::ErrorCode::XmlParseError) {
        if (!parseXML(xml_content)) {
            throw core::ParseException(state_.error_message, part_name, code, __FILE__, __LINE__);
        }
    }

    bool hasError() const { return state_.has_error; }
    const std::string& getErrorMessage() const { return state_.error_message; }

    static std::string_view localName(std::string_view qualified) {
        auto pos = qualified.find(':');
        return pos == std::string_view::npos ? qualified : qualified.substr(pos + 1);
    }

protected:
    virtual void handleStartElement(std::string_view name, const Attributes& attributes, int depth) {
        state_.element_stack.emplace_back(localName(name));
        state_.current_depth = depth;
        onStartElement(state_.element_stack.back(), attributes, depth);
    }

    virtual void handleEndElement(std::string_view name, int depth) {
        state_.current_depth = depth;
        onEndElement(localName(name), depth);
        if (!state_.element_stack.empty()) {
            state_.element_stack.pop_back();
        }
    }

    virtual void handleText(std::string_view text, int depth) {
        onText(text, depth);
    }

    virtual void onStartElement(std::string_view name, const Attributes& attributes, int depth) = 0;
    virtual void onEndElement(std::string_view name, int depth) = 0;
    virtual void onText(std::string_view /*text*/, int /*depth*/) {}

    // ==================== 属性工具 ====================

    static std::optional<std::string_view> findAttribute(const Attributes& attributes, std::string_view name) {
        for (const auto& attr : attributes) {
            if (attr.name == name || localName(attr.name) == name) {
                return attr.value;
            }
        }
        return std::nullopt;
    }

    void setError(const std::string& message) {
        state_.has_error = true;
        state_.error_message = message;
        READER_ERROR("Parser Error: {}", message);
    }

    const std::vector<std::string>& elementStack() const { return state_.element_stack; }
};

}} // namespace splitsheet::reader
