#include "splitsheet/core/FormatRepository.hpp"
#include <functional>

namespace splitsheet {
namespace core {

size_t FormatDescriptor::hash() const {
    std::hash<std::string> hasher;
    size_t seed = bordered ? 1u : 0u;
    auto combine = [&seed](size_t value) {
        seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    };
    combine(number_format ? hasher(*number_format) : 0x51u);
    combine(background_color ? hasher(*background_color) : 0x7fu);
    return seed;
}

FormatRepository::FormatRepository() {
    FormatDescriptor default_format;
    default_format.bordered = false;
    formats_.push_back(default_format);
    hash_to_id_.emplace(default_format.hash(), DEFAULT_FORMAT_ID);
}

int FormatRepository::addFormat(const FormatDescriptor& format) {
    ++total_requests_;

    const size_t key = format.hash();
    auto range = hash_to_id_.equal_range(key);
    for (auto it = range.first; it != range.second; ++it) {
        if (formats_[static_cast<size_t>(it->second)] == format) {
            return it->second;
        }
    }

    const int id = static_cast<int>(formats_.size());
    formats_.push_back(format);
    hash_to_id_.emplace(key, id);
    return id;
}

const FormatDescriptor& FormatRepository::getFormat(int id) const {
    if (!isValidFormatId(id)) {
        return formats_[DEFAULT_FORMAT_ID];
    }
    return formats_[static_cast<size_t>(id)];
}

}} // namespace splitsheet::core
