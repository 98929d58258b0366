#include "splitsheet/core/Image.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <algorithm>
#include <cctype>
#include <climits>

namespace splitsheet {
namespace core {

ImageFormat ImageUtils::detectFormat(const std::vector<uint8_t>& data) {
    if (data.size() < 8) {
        return ImageFormat::UNKNOWN;
    }

    const uint8_t* bytes = data.data();

    // PNG: 89 50 4E 47 0D 0A 1A 0A
    if (bytes[0] == 0x89 && bytes[1] == 0x50 && bytes[2] == 0x4E && bytes[3] == 0x47 &&
        bytes[4] == 0x0D && bytes[5] == 0x0A && bytes[6] == 0x1A && bytes[7] == 0x0A) {
        return ImageFormat::PNG;
    }

    // JPEG: FF D8 FF
    if (bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF) {
        return ImageFormat::JPEG;
    }

    // GIF87a / GIF89a
    if (bytes[0] == 'G' && bytes[1] == 'I' && bytes[2] == 'F' &&
        bytes[3] == '8' && (bytes[4] == '7' || bytes[4] == '9') && bytes[5] == 'a') {
        return ImageFormat::GIF;
    }

    // BMP: BM
    if (bytes[0] == 'B' && bytes[1] == 'M') {
        return ImageFormat::BMP;
    }

    // WebP: RIFF....WEBP
    if (data.size() >= 12 &&
        bytes[0] == 'R' && bytes[1] == 'I' && bytes[2] == 'F' && bytes[3] == 'F' &&
        bytes[8] == 'W' && bytes[9] == 'E' && bytes[10] == 'B' && bytes[11] == 'P') {
        return ImageFormat::WEBP;
    }

    return ImageFormat::UNKNOWN;
}

bool ImageUtils::readDimensions(const std::vector<uint8_t>& data, int& width, int& height) {
    if (data.empty() || data.size() > static_cast<size_t>(INT_MAX)) {
        return false;
    }

    int w = 0, h = 0, channels = 0;
    if (!stbi_info_from_memory(data.data(), static_cast<int>(data.size()), &w, &h, &channels)) {
        CORE_DEBUG("stb_image could not read image header: {}", stbi_failure_reason());
        return false;
    }
    if (w <= 0 || h <= 0) {
        CORE_DEBUG("Invalid image dimensions: {}x{}", w, h);
        return false;
    }

    width = w;
    height = h;
    return true;
}

std::string ImageUtils::formatToString(ImageFormat format) {
    switch (format) {
        case ImageFormat::PNG:  return "PNG";
        case ImageFormat::JPEG: return "JPEG";
        case ImageFormat::GIF:  return "GIF";
        case ImageFormat::BMP:  return "BMP";
        case ImageFormat::WEBP: return "WEBP";
        default:                return "UNKNOWN";
    }
}

std::string ImageUtils::getFileExtension(ImageFormat format) {
    switch (format) {
        case ImageFormat::PNG:  return "png";
        case ImageFormat::JPEG: return "jpeg";
        case ImageFormat::GIF:  return "gif";
        case ImageFormat::BMP:  return "bmp";
        case ImageFormat::WEBP: return "webp";
        default:                return "bin";
    }
}

std::string ImageUtils::getMimeType(ImageFormat format) {
    switch (format) {
        case ImageFormat::PNG:  return "image/png";
        case ImageFormat::JPEG: return "image/jpeg";
        case ImageFormat::GIF:  return "image/gif";
        case ImageFormat::BMP:  return "image/bmp";
        case ImageFormat::WEBP: return "image/webp";
        default:                return "application/octet-stream";
    }
}

std::string ImageUtils::mimeTypeForExtension(const std::string& extension) {
    std::string ext = extension;
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == "png") return getMimeType(ImageFormat::PNG);
    if (ext == "jpg" || ext == "jpeg") return getMimeType(ImageFormat::JPEG);
    if (ext == "gif") return getMimeType(ImageFormat::GIF);
    if (ext == "bmp") return getMimeType(ImageFormat::BMP);
    if (ext == "webp") return getMimeType(ImageFormat::WEBP);
    return getMimeType(ImageFormat::UNKNOWN);
}

void ImageUtils::fitInto(int width, int height, double box, double& out_width, double& out_height) {
    if (width <= 0 || height <= 0) {
        out_width = box;
        out_height = box;
        return;
    }
    const double scale = std::min(box / width, box / height);
    out_width = width * scale;
    out_height = height * scale;
}

}} // namespace splitsheet::core
