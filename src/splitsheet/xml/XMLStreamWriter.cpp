#include "splitsheet/xml/XMLStreamWriter.hpp"
#include "splitsheet/core/Exception.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"
#include <cmath>
#include <fmt/format.h>

namespace splitsheet {
namespace xml {

std::string formatNumber(double value) {
    if (!std::isfinite(value)) {
        return "0";
    }
    std::string str = fmt::format("{}", value);
    // 只处理小数部分的尾随零
    if (str.find('.') != std::string::npos && str.find('e') == std::string::npos) {
        auto pos = str.find_last_not_of('0');
        if (pos != std::string::npos && pos + 1 < str.size()) str.erase(pos + 1);
        if (!str.empty() && str.back() == '.') str.pop_back();
    }
    return str;
}

XMLStreamWriter::XMLStreamWriter() {
    buffer_.reserve(4096);
    pending_attributes_.reserve(16);
}

XMLStreamWriter::~XMLStreamWriter() {
    if (!element_stack_.empty()) {
        XML_WARN("XMLStreamWriter destroyed with {} unclosed elements", element_stack_.size());
    }
}

void XMLStreamWriter::startDocument(const std::string& encoding) {
    buffer_.append("<?xml version=\"1.0\" encoding=\"");
    buffer_.append(encoding);
    buffer_.append("\" standalone=\"yes\"?>\n");
}

void XMLStreamWriter::endDocument() {
    while (!element_stack_.empty()) {
        endElement();
    }
}

void XMLStreamWriter::startElement(const std::string& name) {
    if (name.empty()) {
        throw core::ParameterException("Element name cannot be empty", "name", __FILE__, __LINE__);
    }

    ensureElementClosed();

    buffer_.push_back('<');
    buffer_.append(name);

    element_stack_.push_back(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        throw core::OperationException("No element to close", "endElement",
                                       core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }

    std::string element_name = std::move(element_stack_.back());
    element_stack_.pop_back();

    if (in_element_) {
        writeAttributesToBuffer();
        buffer_.append(" />");
        in_element_ = false;
    } else {
        buffer_.append("</");
        buffer_.append(element_name);
        buffer_.push_back('>');
    }
}

void XMLStreamWriter::writeEmptyElement(const std::string& name) {
    if (name.empty()) {
        throw core::ParameterException("Element name cannot be empty", "name", __FILE__, __LINE__);
    }

    ensureElementClosed();

    buffer_.push_back('<');
    buffer_.append(name);
    writeAttributesToBuffer();
    buffer_.append(" />");
}

void XMLStreamWriter::addPendingAttribute(const std::string& name, std::string value) {
    if (!in_element_) {
        throw core::OperationException("Cannot write attribute outside of element", "writeAttribute",
                                       core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }
    if (name.empty()) {
        throw core::ParameterException("Attribute name cannot be empty", "name", __FILE__, __LINE__);
    }
    pending_attributes_.emplace_back(name, std::move(value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, const std::string& value) {
    addPendingAttribute(name, value);
}

void XMLStreamWriter::writeAttribute(const std::string& name, const char* value) {
    addPendingAttribute(name, value ? std::string(value) : std::string());
}

void XMLStreamWriter::writeAttribute(const std::string& name, std::string_view value) {
    addPendingAttribute(name, std::string(value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, int value) {
    addPendingAttribute(name, fmt::format("{}", value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, int64_t value) {
    addPendingAttribute(name, fmt::format("{}", value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, double value) {
    addPendingAttribute(name, formatNumber(value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, bool value) {
    addPendingAttribute(name, value ? std::string("1") : std::string("0"));
}

void XMLStreamWriter::writeText(std::string_view text) {
    if (text.empty()) {
        return;
    }
    ensureElementClosed();
    appendEscaped(text, false);
}

void XMLStreamWriter::writeText(int value) {
    ensureElementClosed();
    buffer_.append(fmt::format("{}", value));
}

void XMLStreamWriter::writeText(double value) {
    ensureElementClosed();
    buffer_.append(formatNumber(value));
}

void XMLStreamWriter::writeRaw(std::string_view data) {
    ensureElementClosed();
    buffer_.append(data.data(), data.size());
}

std::string XMLStreamWriter::toString() const {
    return buffer_;
}

void XMLStreamWriter::clear() {
    buffer_.clear();
    element_stack_.clear();
    pending_attributes_.clear();
    in_element_ = false;
}

void XMLStreamWriter::writeAttributesToBuffer() {
    for (const auto& attr : pending_attributes_) {
        buffer_.push_back(' ');
        buffer_.append(attr.key);
        buffer_.append("=\"");
        appendEscaped(attr.value, true);
        buffer_.push_back('"');
    }
    pending_attributes_.clear();
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_element_) {
        writeAttributesToBuffer();
        buffer_.push_back('>');
        in_element_ = false;
    }
}

void XMLStreamWriter::appendEscaped(std::string_view text, bool attribute) {
    for (char ch : text) {
        switch (ch) {
            case '&': buffer_.append("&amp;"); break;
            case '<': buffer_.append("&lt;"); break;
            case '>': buffer_.append("&gt;"); break;
            case '"':
                if (attribute) buffer_.append("&quot;"); else buffer_.push_back(ch);
                break;
            case '\n':
                if (attribute) buffer_.append("&#10;"); else buffer_.push_back(ch);
                break;
            default:
                buffer_.push_back(ch);
                break;
        }
    }
}

}} // namespace splitsheet::xml
