#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace splitsheet {
namespace core {

/**
 * @brief SplitSheet统一错误码
 *
 * 按区段分组；errorCategory() 把错误码归入对外的错误分类
 * （FILE_ERROR / PARSE_ERROR / VALIDATION_ERROR / IMAGE_ERROR / WRITE_ERROR / CONFIG_ERROR）。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 3,

    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileAccessDenied = 21,
    FileCorrupted = 22,
    FileWriteError = 23,
    FileReadError = 24,
    MissingPart = 25,

    // 表格内容错误 (40-59)
    InvalidWorksheet = 41,
    InvalidCellReference = 42,
    CorruptedStyles = 45,
    CorruptedSharedStrings = 46,
    ValidationFailed = 50,

    // ZIP/XML处理错误 (60-79)
    ZipError = 60,
    XmlParseError = 61,
    XmlInvalidFormat = 62,

    // 图片处理错误 (80-89)
    ImageTooSmall = 80,
    ImageDecodeFailed = 81,
    ImageEncodeFailed = 82,
    ImageUnsupported = 83,

    // 配置错误 (90-99)
    ConfigReadError = 90,
    ConfigParseError = 91,
    ConfigWriteError = 92,
    UnknownProcessType = 93
};

/**
 * @brief 对外暴露的错误分类
 */
enum class ErrorCategory : uint8_t {
    None,
    FileError,
    ParseError,
    ValidationError,
    ImageError,
    WriteError,
    ConfigError,
    InternalError
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转可读字符串
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 错误码所属分类
 */
ErrorCategory errorCategory(ErrorCode code) noexcept;

/**
 * @brief 分类名（"FILE_ERROR" 等）
 */
const char* toString(ErrorCategory category) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

}} // namespace splitsheet::core
