#include "splitsheet/core/Path.hpp"
#include "splitsheet/utils/Logger.hpp"

#include <filesystem>
#include <system_error>

namespace splitsheet {
namespace core {

namespace fs = std::filesystem;

Path Path::parent() const {
    return Path(fs::u8path(utf8_path_).parent_path().u8string());
}

std::string Path::stem() const {
    return fs::u8path(utf8_path_).stem().u8string();
}

std::string Path::extension() const {
    std::string ext = fs::u8path(utf8_path_).extension().u8string();
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    return ext;
}

Path Path::operator/(const std::string& child) const {
    if (utf8_path_.empty()) {
        return Path(child);
    }
    return Path((fs::u8path(utf8_path_) / fs::u8path(child)).u8string());
}

bool Path::exists() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return fs::exists(fs::u8path(utf8_path_), ec);
}

bool Path::isFile() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return fs::is_regular_file(fs::u8path(utf8_path_), ec);
}

uintmax_t Path::fileSize() const {
    if (utf8_path_.empty()) return 0;
    std::error_code ec;
    uintmax_t size = fs::file_size(fs::u8path(utf8_path_), ec);
    if (ec) {
        SPLITSHEET_LOG_DEBUG("Filesystem error getting file size '{}': {}", utf8_path_, ec.message());
        return 0;
    }
    return size;
}

bool Path::remove() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    bool removed = fs::remove(fs::u8path(utf8_path_), ec);
    if (ec) {
        SPLITSHEET_LOG_DEBUG("Filesystem error removing file '{}': {}", utf8_path_, ec.message());
        return false;
    }
    return removed;
}

bool Path::moveTo(const Path& target) const {
    if (utf8_path_.empty() || target.utf8_path_.empty()) return false;
    std::error_code ec;
    fs::rename(fs::u8path(utf8_path_), fs::u8path(target.utf8_path_), ec);
    if (ec) {
        SPLITSHEET_LOG_DEBUG("Filesystem error moving file '{}' to '{}': {}",
                             utf8_path_, target.utf8_path_, ec.message());
        return false;
    }
    return true;
}

bool Path::createDirectories() const {
    if (utf8_path_.empty()) return true;
    std::error_code ec;
    fs::create_directories(fs::u8path(utf8_path_), ec);
    if (ec) {
        SPLITSHEET_LOG_DEBUG("Filesystem error creating directory '{}': {}", utf8_path_, ec.message());
        return false;
    }
    return true;
}

}} // namespace splitsheet::core
