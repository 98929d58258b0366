/**
 * @file Exception.cpp
 * @brief SplitSheet异常类实现
 */

#include "Exception.hpp"
#include <sstream>
#include <fmt/format.h>

namespace splitsheet {
namespace core {

SplitSheetException::SplitSheetException(const std::string& message,
                                         ErrorCode code,
                                         const char* file,
                                         int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string SplitSheetException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << toString(getCategory()) << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void SplitSheetException::addContext(const std::string& context) {
    context_.push_back(context);
}

FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : SplitSheetException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

ParseException::ParseException(const std::string& message, const std::string& part_name,
                               ErrorCode code, const char* file, int line)
    : SplitSheetException(part_name.empty() ? message : fmt::format("{} (part: {})", message, part_name),
                          code, file, line)
    , part_name_(part_name) {
}

ValidationException::ValidationException(const std::string& message, const char* file, int line)
    : SplitSheetException(message, ErrorCode::ValidationFailed, file, line) {
}

WriteException::WriteException(const std::string& message, const std::string& filename,
                               const char* file, int line)
    : SplitSheetException(fmt::format("{} (file: {})", message, filename),
                          ErrorCode::FileWriteError, file, line)
    , filename_(filename) {
}

ConfigException::ConfigException(const std::string& message, ErrorCode code,
                                 const char* file, int line)
    : SplitSheetException(message, code, file, line) {
}

ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : SplitSheetException(fmt::format("{} (parameter: {})", message, parameter_name),
                          ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

OperationException::OperationException(const std::string& message,
                                       const std::string& operation,
                                       ErrorCode code, const char* file, int line)
    : SplitSheetException(fmt::format("{} (operation: {})", message, operation), code, file, line)
    , operation_(operation) {
}

} // namespace core
} // namespace splitsheet
