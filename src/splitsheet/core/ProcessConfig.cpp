#include "splitsheet/core/ProcessConfig.hpp"
#include "splitsheet/core/Exception.hpp"
#include <fmt/format.h>

namespace splitsheet {
namespace core {

const char* toString(ProcessType type) noexcept {
    switch (type) {
        case ProcessType::SeaRailWithImage: return "sea-rail-with-image";
        case ProcessType::SeaRailNoImage:   return "sea-rail-no-image";
        case ProcessType::AirFreight:       return "air-freight";
    }
    return "sea-rail-with-image";
}

std::optional<ProcessType> processTypeFromString(std::string_view text) {
    for (ProcessType type : allProcessTypes()) {
        if (text == toString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

const std::vector<ProcessType>& allProcessTypes() {
    static const std::vector<ProcessType> types = {
        ProcessType::SeaRailWithImage,
        ProcessType::SeaRailNoImage,
        ProcessType::AirFreight
    };
    return types;
}

ProcessConfig ProcessConfig::defaultFor(ProcessType type) {
    ProcessConfig config;
    config.process_type = type;
    switch (type) {
        case ProcessType::SeaRailWithImage:
            config.weight_column = 13;
            config.box_column = 11;
            config.copy_images = true;
            break;
        case ProcessType::SeaRailNoImage:
            config.weight_column = 13;
            config.box_column = 11;
            config.copy_images = false;
            break;
        case ProcessType::AirFreight:
            config.weight_column = 15;
            config.box_column = 13;
            config.copy_images = true;
            break;
    }
    return config;
}

void ProcessConfig::validate() const {
    if (weight_column < 1 || box_column < 1) {
        SPLITSHEET_THROW(ValidationException,
                         fmt::format("列号必须从 1 开始 (重量列 {}, 箱数列 {})", weight_column, box_column));
    }
    // 数量列在重量列左边
    if (weight_column < 2) {
        SPLITSHEET_THROW(ValidationException, "重量列不能是第一列（需要左侧的数量列）");
    }
    if (weight_column == box_column) {
        SPLITSHEET_THROW(ValidationException,
                         fmt::format("重量列和箱数列不能相同 ({})", weight_column));
    }
}

}} // namespace splitsheet::core
