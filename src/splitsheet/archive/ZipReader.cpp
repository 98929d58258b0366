#include "splitsheet/archive/ZipReader.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <limits>

namespace splitsheet {
namespace archive {

namespace {
// 单个条目一次性读入内存的上限
constexpr uint64_t kMaxEntrySize = 512ull * 1024 * 1024;
}

ZipReader::ZipReader(const core::Path& path)
    : filepath_(path) {
}

ZipReader::~ZipReader() {
    cleanup();
}

ZipReader::ZipReader(ZipReader&& other) noexcept
    : unzip_handle_(other.unzip_handle_),
      filepath_(std::move(other.filepath_)),
      is_open_(other.is_open_),
      entries_(std::move(other.entries_)),
      entry_index_(std::move(other.entry_index_)) {
    other.unzip_handle_ = nullptr;
    other.is_open_ = false;
}

ZipReader& ZipReader::operator=(ZipReader&& other) noexcept {
    if (this != &other) {
        cleanup();
        unzip_handle_ = other.unzip_handle_;
        filepath_ = std::move(other.filepath_);
        is_open_ = other.is_open_;
        entries_ = std::move(other.entries_);
        entry_index_ = std::move(other.entry_index_);

        other.unzip_handle_ = nullptr;
        other.is_open_ = false;
    }
    return *this;
}

bool ZipReader::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();
    return initializeReader();
}

bool ZipReader::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();
    return true;
}

std::vector<std::string> ZipReader::listFiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> files;
    if (!is_open_) {
        return files;
    }
    files.reserve(entries_.size());
    for (const auto& entry : entries_) {
        if (!entry.is_directory) {
            files.push_back(entry.path);
        }
    }
    return files;
}

ZipError ZipReader::fileExists(std::string_view internal_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_ || !unzip_handle_) {
        return ZipError::NotOpen;
    }
    return entry_index_.count(std::string(internal_path)) ? ZipError::Ok : ZipError::FileNotFound;
}

bool ZipReader::getEntryInfo(std::string_view internal_path, EntryInfo& info) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_) {
        return false;
    }
    auto it = entry_index_.find(std::string(internal_path));
    if (it == entry_index_.end()) {
        return false;
    }
    info = entries_[it->second];
    return true;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) const {
    std::vector<uint8_t> data;
    ZipError result = extractFile(internal_path, data);
    if (result != ZipError::Ok) {
        return result;
    }
    content.assign(reinterpret_cast<const char*>(data.data()), data.size());
    return ZipError::Ok;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::vector<uint8_t>& data) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return extractFileInternal(internal_path, data);
}

ZipError ZipReader::extractFileInternal(std::string_view internal_path,
                                        std::vector<uint8_t>& data) const {
    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    auto it = entry_index_.find(std::string(internal_path));
    if (it == entry_index_.end()) {
        ARCHIVE_DEBUG("File {} not found in zip archive", internal_path);
        return ZipError::FileNotFound;
    }
    const EntryInfo& entry = entries_[it->second];
    if (entry.uncompressed_size > kMaxEntrySize) {
        ARCHIVE_ERROR("Entry {} too large: {} bytes", internal_path, entry.uncompressed_size);
        return ZipError::TooLarge;
    }

    if (mz_zip_reader_locate_entry(unzip_handle_, entry.path.c_str(), 0) != MZ_OK) {
        ARCHIVE_ERROR("Failed to locate entry: {}", internal_path);
        return ZipError::FileNotFound;
    }
    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry: {}", internal_path);
        return ZipError::IoFail;
    }

    std::vector<uint8_t> buf(static_cast<size_t>(entry.uncompressed_size));
    size_t total_read = 0;
    while (total_read < buf.size()) {
        const size_t remaining = buf.size() - total_read;
        const int32_t chunk = static_cast<int32_t>(
            std::min<size_t>(remaining, static_cast<size_t>(std::numeric_limits<int32_t>::max())));
        int32_t read = mz_zip_reader_entry_read(unzip_handle_, buf.data() + total_read, chunk);
        if (read <= 0) {
            break;
        }
        total_read += static_cast<size_t>(read);
    }
    mz_zip_reader_entry_close(unzip_handle_);

    if (total_read != buf.size()) {
        ARCHIVE_ERROR("Incomplete read for file {}, expected: {} bytes, read: {} bytes",
                      internal_path, buf.size(), total_read);
        return ZipError::IoFail;
    }

    data.swap(buf);
    ARCHIVE_DEBUG("Extracted file {} from zip, size: {} bytes", internal_path, data.size());
    return ZipError::Ok;
}

bool ZipReader::initializeReader() {
    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return false;
    }

    int32_t result = mz_zip_reader_open_file(unzip_handle_, filepath_.c_str());
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for reading: {}, error: {}", filepath_.string(), result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return false;
    }

    is_open_ = true;
    ARCHIVE_DEBUG("Zip archive opened for reading: {}", filepath_.string());

    buildEntryCache();
    return true;
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
    entries_.clear();
    entry_index_.clear();
}

void ZipReader::buildEntryCache() {
    entries_.clear();
    entry_index_.clear();

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) != MZ_OK || !file_info) {
            continue;
        }
        if (!file_info->filename || file_info->filename[0] == '\0') {
            continue;
        }
        EntryInfo info;
        info.path = file_info->filename;
        info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
        info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
        info.crc32 = file_info->crc;
        info.compression_method = file_info->compression_method;
        info.modified_date = file_info->modified_date;
        info.is_directory = (info.path.back() == '/');

        // 重名条目以最后一个为准
        auto existing = entry_index_.find(info.path);
        if (existing != entry_index_.end()) {
            entries_[existing->second] = info;
        } else {
            entry_index_.emplace(info.path, entries_.size());
            entries_.push_back(std::move(info));
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);

    ARCHIVE_DEBUG("Built entry cache with {} entries", entries_.size());
}

}} // namespace splitsheet::archive
