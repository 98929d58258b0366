#include "splitsheet/reader/MediaLibrary.hpp"
#include "splitsheet/archive/PackageArchive.hpp"
#include "splitsheet/core/Image.hpp"
#include "splitsheet/utils/CommonUtils.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"

#include <webp/decode.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace splitsheet {
namespace reader {

namespace {

constexpr size_t kMinMediaSize = 8;

void appendToVector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    const auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

} // namespace

bool MediaLibrary::isMediaCandidate(std::string_view part_name) {
    return utils::CommonUtils::startsWith(part_name, "xl/media/") ||
           utils::CommonUtils::startsWith(part_name, "xl/embeddings/") ||
           part_name.find("/media/") != std::string_view::npos;
}

MediaLibrary MediaLibrary::scan(const archive::PackageArchive& archive) {
    MediaLibrary library;

    for (const auto& part : archive.listParts()) {
        if (!isMediaCandidate(part)) {
            continue;
        }
        auto data = archive.tryReadBytes(part);
        if (!data || data->size() < kMinMediaSize) {
            READER_DEBUG("Skipping media part {} (missing or shorter than {} bytes)", part, kMinMediaSize);
            continue;
        }
        library.add(utils::CommonUtils::baseName(part), std::move(*data));
    }

    READER_DEBUG("Media library: {} usable files", library.files_.size());
    if (!library.converted_.empty()) {
        READER_INFO("Converted {} media files: {}", library.converted_.size(),
                    fmt::format("{}", fmt::join(library.converted_, ", ")));
    }
    if (!library.unsupported_.empty()) {
        READER_WARN("Skipped {} unsupported media files: {}", library.unsupported_.size(),
                    fmt::format("{}", fmt::join(library.unsupported_, ", ")));
    }
    return library;
}

bool MediaLibrary::add(const std::string& file_name, std::vector<uint8_t> data) {
    const core::ImageFormat format = core::ImageUtils::detectFormat(data);

    switch (format) {
        case core::ImageFormat::PNG:
        case core::ImageFormat::JPEG:
        case core::ImageFormat::GIF:
        case core::ImageFormat::BMP: {
            std::string ext = utils::CommonUtils::extensionOf(file_name);
            if (ext.empty()) {
                ext = "png";
            }
            files_[file_name] = MediaFile{std::make_shared<const std::vector<uint8_t>>(std::move(data)), ext};
            return true;
        }
        case core::ImageFormat::WEBP: {
            auto png = convertWebPToPng(data);
            if (png) {
                files_[file_name] = MediaFile{std::make_shared<const std::vector<uint8_t>>(std::move(png.value())), "png"};
                converted_.push_back(fmt::format("{} (WebP->PNG)", file_name));
                return true;
            }
            READER_DEBUG("WebP conversion failed for {}: {}", file_name, png.error().message);
            break;
        }
        default:
            break;
    }

    unsupported_.push_back(file_name);
    return false;
}

const MediaFile* MediaLibrary::find(const std::string& file_name) const {
    auto it = files_.find(file_name);
    return it != files_.end() ? &it->second : nullptr;
}

core::Result<std::vector<uint8_t>> MediaLibrary::convertWebPToPng(const std::vector<uint8_t>& data) {
    WebPDecoderConfig config;
    if (!WebPInitDecoderConfig(&config)) {
        return core::makeError(core::ErrorCode::ImageDecodeFailed, "WebP decoder version mismatch");
    }

    if (WebPGetFeatures(data.data(), data.size(), &config.input) != VP8_STATUS_OK) {
        return core::makeError(core::ErrorCode::ImageDecodeFailed, "Invalid WebP header");
    }

    config.output.colorspace = MODE_RGBA;
    if (WebPDecode(data.data(), data.size(), &config) != VP8_STATUS_OK) {
        WebPFreeDecBuffer(&config.output);
        return core::makeError(core::ErrorCode::ImageDecodeFailed, "WebP decode failed");
    }

    const int width = config.output.width;
    const int height = config.output.height;
    const int stride = config.output.u.RGBA.stride;

    std::vector<uint8_t> png;
    int ok = stbi_write_png_to_func(appendToVector, &png, width, height, 4,
                                    config.output.u.RGBA.rgba, stride);
    WebPFreeDecBuffer(&config.output);

    if (!ok || png.empty()) {
        return core::makeError(core::ErrorCode::ImageEncodeFailed,
                               fmt::format("PNG encode failed ({}x{})", width, height));
    }
    return png;
}

}} // namespace splitsheet::reader
