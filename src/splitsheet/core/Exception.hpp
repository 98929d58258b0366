/**
 * @file Exception.hpp
 * @brief SplitSheet异常类定义
 */

#ifndef SPLITSHEET_EXCEPTION_HPP
#define SPLITSHEET_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace splitsheet {
namespace core {

/**
 * @brief SplitSheet基础异常类
 */
class SplitSheetException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    SplitSheetException(const std::string& message,
                        ErrorCode code = ErrorCode::InternalError,
                        const char* file = nullptr,
                        int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    /**
     * @brief 对外错误分类（FILE_ERROR 等）
     */
    ErrorCategory getCategory() const noexcept { return errorCategory(error_code_); }

    /**
     * @brief 获取详细错误信息（分类、源码位置、上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件相关异常（打不开、缺少必需部件）
 */
class FileException : public SplitSheetException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 包内部件解析异常
 */
class ParseException : public SplitSheetException {
public:
    ParseException(const std::string& message,
                   const std::string& part_name = "",
                   ErrorCode code = ErrorCode::XmlParseError,
                   const char* file = nullptr, int line = 0);

    const std::string& getPartName() const { return part_name_; }

private:
    std::string part_name_;
};

/**
 * @brief 业务前置条件不满足
 */
class ValidationException : public SplitSheetException {
public:
    ValidationException(const std::string& message,
                        const char* file = nullptr, int line = 0);
};

/**
 * @brief 输出文件写入异常
 */
class WriteException : public SplitSheetException {
public:
    WriteException(const std::string& message, const std::string& filename,
                   const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 配置读写异常
 */
class ConfigException : public SplitSheetException {
public:
    ConfigException(const std::string& message,
                    ErrorCode code = ErrorCode::ConfigReadError,
                    const char* file = nullptr, int line = 0);
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public SplitSheetException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 操作顺序相关异常
 */
class OperationException : public SplitSheetException {
public:
    OperationException(const std::string& message,
                       const std::string& operation = "",
                       ErrorCode code = ErrorCode::InvalidArgument,
                       const char* file = nullptr, int line = 0);

    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

} // namespace core
} // namespace splitsheet

// 便捷宏定义
#define SPLITSHEET_THROW(ExceptionType, message) \
    throw ExceptionType(message, __FILE__, __LINE__)

#endif // SPLITSHEET_EXCEPTION_HPP
