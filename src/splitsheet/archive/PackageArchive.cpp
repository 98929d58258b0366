#include "splitsheet/archive/PackageArchive.hpp"
#include "splitsheet/core/Exception.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace splitsheet {
namespace archive {

PackageArchive::PackageArchive(const core::Path& path)
    : path_(path), reader_(path) {
    if (!path_.exists()) {
        throw core::FileException("无法打开 Excel 文件: 文件不存在", path_.string(),
                                  core::ErrorCode::FileNotFound, __FILE__, __LINE__);
    }
    if (!reader_.open()) {
        throw core::FileException("无法打开 Excel 文件: 不是有效的 ZIP 容器", path_.string(),
                                  core::ErrorCode::FileCorrupted, __FILE__, __LINE__);
    }
    ARCHIVE_INFO("Opened package {} ({} parts)", path_.string(), reader_.listFiles().size());
}

bool PackageArchive::hasPart(std::string_view name) const {
    return reader_.fileExists(name) == ZipError::Ok;
}

std::string PackageArchive::readText(std::string_view name) const {
    std::string content;
    ZipError result = reader_.extractFile(name, content);
    if (result != ZipError::Ok) {
        failRead(name, result);
    }
    return content;
}

std::vector<uint8_t> PackageArchive::readBytes(std::string_view name) const {
    std::vector<uint8_t> data;
    ZipError result = reader_.extractFile(name, data);
    if (result != ZipError::Ok) {
        failRead(name, result);
    }
    return data;
}

std::optional<std::string> PackageArchive::tryReadText(std::string_view name) const {
    if (!hasPart(name)) {
        return std::nullopt;
    }
    return readText(name);
}

std::optional<std::vector<uint8_t>> PackageArchive::tryReadBytes(std::string_view name) const {
    if (!hasPart(name)) {
        return std::nullopt;
    }
    return readBytes(name);
}

std::vector<std::string> PackageArchive::listParts() const {
    return reader_.listFiles();
}

void PackageArchive::failRead(std::string_view name, ZipError error) const {
    if (error == ZipError::FileNotFound) {
        throw core::FileException(fmt::format("缺少必需的部件 {}", name), path_.string(),
                                  core::ErrorCode::MissingPart, __FILE__, __LINE__);
    }
    throw core::FileException(fmt::format("读取部件 {} 失败: {}", name, toString(error)),
                              path_.string(), core::ErrorCode::FileReadError, __FILE__, __LINE__);
}

}} // namespace splitsheet::archive
