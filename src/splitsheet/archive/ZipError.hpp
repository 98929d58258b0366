#pragma once

namespace splitsheet {
namespace archive {

// ZIP 原语的错误码
enum class ZipError {
    Ok,                   // 操作成功
    NotOpen,              // ZIP 文件未打开
    IoFail,               // I/O 操作失败
    BadFormat,            // ZIP 格式错误
    TooLarge,             // 条目超过单次读取上限
    FileNotFound,         // 条目不存在
    InvalidParameter,     // 无效参数
    CompressionFail,      // 压缩失败
    InternalError         // 内部错误
};

// 只有 ZipError::Ok 在布尔上下文中为真
constexpr bool operator!(ZipError error) noexcept {
    return error != ZipError::Ok;
}

constexpr bool isSuccess(ZipError error) noexcept {
    return error == ZipError::Ok;
}

constexpr bool isError(ZipError error) noexcept {
    return error != ZipError::Ok;
}

constexpr const char* toString(ZipError error) noexcept {
    switch (error) {
        case ZipError::Ok:               return "ok";
        case ZipError::NotOpen:          return "archive not open";
        case ZipError::IoFail:           return "I/O failure";
        case ZipError::BadFormat:        return "bad zip format";
        case ZipError::TooLarge:         return "entry too large";
        case ZipError::FileNotFound:     return "entry not found";
        case ZipError::InvalidParameter: return "invalid parameter";
        case ZipError::CompressionFail:  return "compression failure";
        case ZipError::InternalError:    return "internal error";
    }
    return "unknown";
}

}} // namespace splitsheet::archive
