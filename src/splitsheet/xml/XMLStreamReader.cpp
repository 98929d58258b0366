#include "splitsheet/xml/XMLStreamReader.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"
#include <climits>
#include <cstring>
#include <exception>
#include <fmt/format.h>

namespace splitsheet {
namespace xml {

XMLStreamReader::XMLStreamReader() {
    attributes_.reserve(16);
    resetState();
}

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    parser_ = XML_ParserCreate("UTF-8");
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    attributes_.clear();
    current_text_.clear();
    collecting_text_ = false;
    elements_parsed_ = 0;
}

void XMLStreamReader::setStartElementCallback(StartElementCallback callback) {
    start_element_callback_ = std::move(callback);
}

void XMLStreamReader::setEndElementCallback(EndElementCallback callback) {
    end_element_callback_ = std::move(callback);
}

void XMLStreamReader::setTextCallback(TextCallback callback) {
    text_callback_ = std::move(callback);
}

void XMLStreamReader::setTrimWhitespace(bool trim) {
    trim_whitespace_ = trim;
}

void XMLStreamReader::setCollectText(bool collect) {
    collect_text_ = collect;
}

XMLParseError XMLStreamReader::parseFromString(std::string_view xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    resetState();

    if (!buffer || size == 0) {
        handleError(XMLParseError::InvalidInput, "Empty XML document");
        return last_error_;
    }
    if (size > static_cast<size_t>(INT_MAX)) {
        handleError(XMLParseError::InvalidInput, fmt::format("XML document too large: {} bytes", size));
        return last_error_;
    }

    if (!initializeParser()) {
        return last_error_;
    }

    void* expat_buffer = XML_GetBuffer(parser_, static_cast<int>(size));
    if (!expat_buffer) {
        handleError(XMLParseError::MemoryError, "Failed to get Expat buffer");
        return last_error_;
    }
    std::memcpy(expat_buffer, buffer, size);

    if (XML_ParseBuffer(parser_, static_cast<int>(size), 1) == XML_STATUS_ERROR) {
        // 回调中止时错误已经记录
        if (last_error_ == XMLParseError::Ok) {
            handleError(XMLParseError::ParseFailed,
                        fmt::format("Parse error at line {}, column {}: {}",
                                    XML_GetCurrentLineNumber(parser_),
                                    XML_GetCurrentColumnNumber(parser_),
                                    XML_ErrorString(XML_GetErrorCode(parser_))));
        }
        return last_error_;
    }

    XML_DEBUG("Parsed {} bytes, {} elements", size, elements_parsed_);
    return XMLParseError::Ok;
}

void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    auto* reader = static_cast<XMLStreamReader*>(userData);

    std::string_view element_name{name, std::strlen(name)};
    reader->elements_parsed_++;

    reader->attributes_.clear();
    if (attrs) {
        for (int i = 0; attrs[i]; i += 2) {
            if (attrs[i + 1]) {
                reader->attributes_.emplace_back(std::string_view{attrs[i], std::strlen(attrs[i])},
                                                 std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])});
            }
        }
    }

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(element_name, reader->attributes_, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortFromCallback("Start element", e);
            return;
        }
    }

    reader->current_depth_++;
    reader->current_text_.clear();
    reader->collecting_text_ = reader->collect_text_;
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    auto* reader = static_cast<XMLStreamReader*>(userData);

    reader->current_depth_--;
    std::string_view element_name{name, std::strlen(name)};

    if (reader->collecting_text_ && !reader->current_text_.empty() && reader->text_callback_) {
        std::string_view text_content = reader->trim_whitespace_
            ? trimStringView(reader->current_text_)
            : std::string_view{reader->current_text_};
        if (!text_content.empty()) {
            try {
                reader->text_callback_(text_content, reader->current_depth_);
            } catch (const std::exception& e) {
                reader->abortFromCallback("Text", e);
                return;
            }
        }
    }

    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(element_name, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortFromCallback("End element", e);
            return;
        }
    }

    reader->current_text_.clear();
    reader->collecting_text_ = false;
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    auto* reader = static_cast<XMLStreamReader*>(userData);
    if (reader->collecting_text_ && len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

std::string_view XMLStreamReader::trimStringView(std::string_view str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return std::string_view{};
    }
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;
    XML_ERROR("XML Parse Error: {}", message);
}

void XMLStreamReader::abortFromCallback(const char* stage, const std::exception& e) {
    handleError(XMLParseError::CallbackError, fmt::format("{} callback error: {}", stage, e.what()));
    XML_StopParser(parser_, XML_FALSE);
}

}} // namespace splitsheet::xml
