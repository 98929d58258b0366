#include "splitsheet/archive/ZipWriter.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <climits>
#include <ctime>

namespace splitsheet {
namespace archive {

ZipWriter::ZipWriter(const core::Path& path)
    : filepath_(path) {
}

ZipWriter::~ZipWriter() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closeInternal()) {
        ARCHIVE_WARN("Zip writer for {} destroyed without a clean close", filepath_.string());
    }
}

bool ZipWriter::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_open_ && !closeInternal()) {
        ARCHIVE_WARN("Previous archive {} was not finalized cleanly", filepath_.string());
    }
    return initializeWriter();
}

bool ZipWriter::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    return closeInternal();
}

bool ZipWriter::closeInternal() {
    if (!zip_handle_) {
        is_open_ = false;
        return true;
    }

    bool success = true;
    if (is_open_) {
        int32_t result = mz_zip_writer_close(zip_handle_);
        if (result != MZ_OK) {
            ARCHIVE_ERROR("Failed to finalize ZIP file: {}, error code: {}", filepath_.string(), result);
            success = false;
        } else {
            ARCHIVE_DEBUG("ZIP file finalized successfully: {}", filepath_.string());
        }
    }

    mz_zip_writer_delete(&zip_handle_);
    zip_handle_ = nullptr;
    is_open_ = false;
    written_paths_.clear();
    return success;
}

ZipError ZipWriter::addFile(std::string_view internal_path, std::string_view content) {
    return addFile(internal_path, content.data(), content.size());
}

ZipError ZipWriter::addFile(std::string_view internal_path, const void* data, size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_ || !zip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for writing");
        return ZipError::NotOpen;
    }
    return writeFileEntry(std::string(internal_path), data, size);
}

ZipError ZipWriter::addFiles(const std::vector<FileEntry>& files) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_ || !zip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for writing");
        return ZipError::NotOpen;
    }

    ARCHIVE_DEBUG("Starting batch write of {} files", files.size());
    for (const auto& file : files) {
        ZipError result = writeFileEntry(file.internal_path, file.content.data(), file.content.size());
        if (result != ZipError::Ok) {
            return result;
        }
    }
    return ZipError::Ok;
}

ZipError ZipWriter::setCompressionLevel(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < 0 || level > 9) {
        ARCHIVE_ERROR("Invalid compression level: {}. Valid range: 0 to 9", level);
        return ZipError::InvalidParameter;
    }
    compression_level_ = level;
    if (is_open_ && zip_handle_) {
        mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));
    }
    return ZipError::Ok;
}

bool ZipWriter::initializeWriter() {
    zip_handle_ = mz_zip_writer_create();
    if (!zip_handle_) {
        ARCHIVE_ERROR("Failed to create zip writer");
        return false;
    }

    mz_zip_writer_set_compress_method(zip_handle_, MZ_COMPRESS_METHOD_DEFLATE);
    mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));
    mz_zip_writer_set_overwrite_cb(zip_handle_, this, [](void*, void*, const char*) -> int32_t {
        return MZ_OK;
    });

    if (filepath_.exists() && !filepath_.remove()) {
        ARCHIVE_WARN("Could not remove existing zip file: {}", filepath_.string());
    }

    int32_t result = mz_zip_writer_open_file(zip_handle_, filepath_.c_str(), 0, 0);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for writing: {}, error: {}", filepath_.string(), result);
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
        return false;
    }

    // 禁用 Data Descriptor
    void* zip_handle = nullptr;
    if (mz_zip_writer_get_zip_handle(zip_handle_, &zip_handle) == MZ_OK && zip_handle) {
        mz_zip_set_data_descriptor(zip_handle, 0);
    }

    is_open_ = true;
    stats_ = Stats{};
    ARCHIVE_DEBUG("ZIP archive opened for writing: {}", filepath_.string());
    return true;
}

void ZipWriter::initializeFileInfo(void* file_info_ptr, const std::string& path, size_t size) const {
    mz_zip_file& file_info = *static_cast<mz_zip_file*>(file_info_ptr);
    file_info = {};
    file_info.filename = path.c_str();
    file_info.uncompressed_size = static_cast<int64_t>(size);
    file_info.compressed_size = 0;
    file_info.compression_method = compression_level_ == 0 ? MZ_COMPRESS_METHOD_STORE
                                                           : MZ_COMPRESS_METHOD_DEFLATE;

    const std::time_t now = std::time(nullptr);
    file_info.modified_date = now;
    file_info.creation_date = now;

    file_info.flag = 0;
    file_info.version_madeby = (MZ_HOST_SYSTEM_UNIX << 8) | 20;
}

ZipError ZipWriter::writeFileEntry(const std::string& internal_path, const void* data, size_t size) {
    if (written_paths_.find(internal_path) != written_paths_.end()) {
        ARCHIVE_WARN("File {} already exists in zip, skipping duplicate entry", internal_path);
        return ZipError::Ok;
    }

    if (size > INT32_MAX) {
        ARCHIVE_ERROR("File {} is too large ({} bytes)", internal_path, size);
        return ZipError::TooLarge;
    }

    mz_zip_file file_info;
    initializeFileInfo(&file_info, internal_path, size);

    int32_t result = mz_zip_writer_entry_open(zip_handle_, &file_info);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry for file {} in zip, error: {}", internal_path, result);
        return ZipError::IoFail;
    }

    if (size > 0) {
        int32_t bytes_written = mz_zip_writer_entry_write(zip_handle_, data, static_cast<int32_t>(size));
        if (bytes_written != static_cast<int32_t>(size)) {
            ARCHIVE_ERROR("Failed to write complete data for file {} to zip", internal_path);
            mz_zip_writer_entry_close(zip_handle_);
            return ZipError::IoFail;
        }
    }

    result = mz_zip_writer_entry_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to close entry for file {} in zip, error: {}", internal_path, result);
        return ZipError::IoFail;
    }

    written_paths_.insert(internal_path);
    stats_.entries_written++;
    stats_.bytes_written += size;

    ARCHIVE_DEBUG("Added file {} to zip, size: {} bytes", internal_path, size);
    return ZipError::Ok;
}

}} // namespace splitsheet::archive
