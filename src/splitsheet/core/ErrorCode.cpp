#include "splitsheet/core/ErrorCode.hpp"

namespace splitsheet {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                     return "Success";
        case ErrorCode::InvalidArgument:        return "Invalid argument";
        case ErrorCode::InternalError:          return "Internal error";

        case ErrorCode::FileNotFound:           return "File not found";
        case ErrorCode::FileAccessDenied:       return "File access denied";
        case ErrorCode::FileCorrupted:          return "File corrupted";
        case ErrorCode::FileWriteError:         return "File write error";
        case ErrorCode::FileReadError:          return "File read error";
        case ErrorCode::MissingPart:            return "Required package part missing";

        case ErrorCode::InvalidWorksheet:       return "Invalid worksheet";
        case ErrorCode::InvalidCellReference:   return "Invalid cell reference";
        case ErrorCode::CorruptedStyles:        return "Corrupted styles";
        case ErrorCode::CorruptedSharedStrings: return "Corrupted shared strings";
        case ErrorCode::ValidationFailed:       return "Validation failed";

        case ErrorCode::ZipError:               return "ZIP error";
        case ErrorCode::XmlParseError:          return "XML parse error";
        case ErrorCode::XmlInvalidFormat:       return "Invalid XML format";

        case ErrorCode::ImageTooSmall:          return "Image data too short";
        case ErrorCode::ImageDecodeFailed:      return "Image decode failed";
        case ErrorCode::ImageEncodeFailed:      return "Image encode failed";
        case ErrorCode::ImageUnsupported:       return "Unsupported image format";

        case ErrorCode::ConfigReadError:        return "Config read error";
        case ErrorCode::ConfigParseError:       return "Config parse error";
        case ErrorCode::ConfigWriteError:       return "Config write error";
        case ErrorCode::UnknownProcessType:     return "Unknown process type";
    }
    return "Unknown error";
}

ErrorCategory errorCategory(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return ErrorCategory::None;

        case ErrorCode::FileNotFound:
        case ErrorCode::FileAccessDenied:
        case ErrorCode::FileCorrupted:
        case ErrorCode::FileReadError:
        case ErrorCode::MissingPart:
        case ErrorCode::ZipError:
            return ErrorCategory::FileError;

        case ErrorCode::InvalidWorksheet:
        case ErrorCode::InvalidCellReference:
        case ErrorCode::CorruptedStyles:
        case ErrorCode::CorruptedSharedStrings:
        case ErrorCode::XmlParseError:
        case ErrorCode::XmlInvalidFormat:
            return ErrorCategory::ParseError;

        case ErrorCode::InvalidArgument:
        case ErrorCode::ValidationFailed:
            return ErrorCategory::ValidationError;

        case ErrorCode::ImageTooSmall:
        case ErrorCode::ImageDecodeFailed:
        case ErrorCode::ImageEncodeFailed:
        case ErrorCode::ImageUnsupported:
            return ErrorCategory::ImageError;

        case ErrorCode::FileWriteError:
            return ErrorCategory::WriteError;

        case ErrorCode::ConfigReadError:
        case ErrorCode::ConfigParseError:
        case ErrorCode::ConfigWriteError:
        case ErrorCode::UnknownProcessType:
            return ErrorCategory::ConfigError;

        case ErrorCode::InternalError:
            return ErrorCategory::InternalError;
    }
    return ErrorCategory::InternalError;
}

const char* toString(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:            return "OK";
        case ErrorCategory::FileError:       return "FILE_ERROR";
        case ErrorCategory::ParseError:      return "PARSE_ERROR";
        case ErrorCategory::ValidationError: return "VALIDATION_ERROR";
        case ErrorCategory::ImageError:      return "IMAGE_ERROR";
        case ErrorCategory::WriteError:      return "WRITE_ERROR";
        case ErrorCategory::ConfigError:     return "CONFIG_ERROR";
        case ErrorCategory::InternalError:   return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

}} // namespace splitsheet::core
