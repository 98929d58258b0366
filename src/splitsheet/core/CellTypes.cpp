#include "splitsheet/core/CellTypes.hpp"
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace splitsheet {
namespace core {

namespace {

bool hasOuterWhitespace(std::string_view text) {
    return std::isspace(static_cast<unsigned char>(text.front())) ||
           std::isspace(static_cast<unsigned char>(text.back()));
}

} // namespace

std::optional<int64_t> parseInteger(std::string_view text) {
    if (text.empty() || hasOuterWhitespace(text)) {
        return std::nullopt;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (*first == '+') {
        ++first;
        if (first == last || *first == '-') return std::nullopt;
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parseNumber(std::string_view text) {
    if (text.empty() || hasOuterWhitespace(text)) {
        return std::nullopt;
    }
    // strtod 接受十六进制和 inf/nan，这里都不算数值
    for (char ch : text) {
        if (!(std::isdigit(static_cast<unsigned char>(ch)) || ch == '.' || ch == '-' ||
              ch == '+' || ch == 'e' || ch == 'E')) {
            return std::nullopt;
        }
    }
    const std::string buffer(text);
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(buffer.c_str(), &end);
    if (end != buffer.c_str() + buffer.size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

CellValue CellValue::formula(std::string text) {
    if (text.empty() || text.front() != '=') {
        text.insert(text.begin(), '=');
    }
    return CellValue(Storage(Formula{std::move(text)}));
}

CellValue CellValue::sniff(std::string_view raw) {
    if (raw.empty()) {
        return CellValue();
    }
    if (auto integer_value = parseInteger(raw)) {
        return CellValue::integer(*integer_value);
    }
    if (auto number_value = parseNumber(raw)) {
        return CellValue::number(*number_value);
    }
    return CellValue::string(std::string(raw));
}

std::optional<double> CellValue::numericValue() const {
    switch (type()) {
        case Type::Number:  return asNumber();
        case Type::Integer: return static_cast<double>(asInteger());
        default:            return std::nullopt;
    }
}

}} // namespace splitsheet::core
