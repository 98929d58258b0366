#include "splitsheet/reader/WorksheetMetadataParser.hpp"
#include "splitsheet/reader/StylesCatalog.hpp"
#include "splitsheet/reader/TagScopedVisitor.hpp"
#include "splitsheet/core/CellTypes.hpp"
#include "splitsheet/utils/CommonUtils.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <stdexcept>

namespace splitsheet {
namespace reader {

namespace {

std::optional<int> attributeInt(const TagScopedVisitor::Attributes& attributes, std::string_view name) {
    for (const auto& attr : attributes) {
        if (BaseSAXParser::localName(attr.name) == name) {
            auto value = core::parseInteger(attr.value);
            if (value && *value >= 0 && *value <= utils::CommonUtils::kMaxRows) {
                return static_cast<int>(*value);
            }
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<double> attributeDouble(const TagScopedVisitor::Attributes& attributes, std::string_view name) {
    for (const auto& attr : attributes) {
        if (BaseSAXParser::localName(attr.name) == name) {
            return core::parseNumber(attr.value);
        }
    }
    return std::nullopt;
}

} // namespace

core::WorksheetMetadata WorksheetMetadataParser::parse(std::string_view xml_content, const StylesCatalog& styles,
                                                       const std::string& part_name) {
    core::WorksheetMetadata metadata;

    // 当前单元格
    int cell_row = -1;
    int cell_col = -1;
    std::optional<int> cell_style;
    std::string cell_formula;

    TagScopedVisitor visitor;
    visitor
        .onAttribute("mergeCells/mergeCell", "ref", [&](std::string_view ref) {
            try {
                auto bounds = utils::CommonUtils::parseRange(ref);
                metadata.merged_regions.emplace_back(bounds.first_row, bounds.first_col,
                                                     bounds.last_row, bounds.last_col);
            } catch (const std::invalid_argument& e) {
                READER_WARN("Ignoring merge range '{}': {}", ref, e.what());
            }
        })
        .onElement("cols/col", [&](const TagScopedVisitor::Attributes& attributes) {
            auto min_col = attributeInt(attributes, "min");
            auto max_col = attributeInt(attributes, "max");
            auto width = attributeDouble(attributes, "width");
            if (!min_col || !max_col || !width || *min_col < 1) {
                return;
            }
            const int last = std::min(*max_col, utils::CommonUtils::kMaxColumns);
            for (int col = *min_col; col <= last; ++col) {
                metadata.column_widths[col - 1] = *width;
            }
        })
        .onAttribute("sheetFormatPr", "defaultColWidth", [&](std::string_view value) {
            if (auto width = core::parseNumber(value)) {
                metadata.default_column_width = *width;
            }
        })
        .onElement("sheetData/c", [&](const TagScopedVisitor::Attributes& attributes) {
            cell_row = -1;
            cell_col = -1;
            cell_style.reset();
            cell_formula.clear();
            for (const auto& attr : attributes) {
                auto name = BaseSAXParser::localName(attr.name);
                if (name == "r") {
                    try {
                        auto ref = utils::CommonUtils::parseReference(attr.value);
                        cell_row = ref.first;
                        cell_col = ref.second;
                    } catch (const std::invalid_argument&) {
                        READER_DEBUG("Invalid cell reference '{}'", attr.value);
                    }
                } else if (name == "s") {
                    auto index = core::parseInteger(attr.value);
                    if (index && *index >= 0) {
                        cell_style = static_cast<int>(*index);
                    }
                }
            }
        })
        .onText("sheetData/c/f", [&](std::string_view text) {
            cell_formula.assign(text);
        })
        .onLeave("sheetData/c", [&] {
            if (cell_row < 0 || cell_col < 0) {
                return;
            }
            const core::CellCoordinate coord(cell_row, cell_col);
            if (cell_style) {
                core::CellStyle style = styles.resolve(*cell_style);
                if (!style.isDefault()) {
                    metadata.cell_styles[coord] = std::move(style);
                }
            }
            if (!cell_formula.empty()) {
                metadata.cell_formulas[coord] = core::CellValue::formula(cell_formula).formulaText();
            }
        });

    visitor.visit(xml_content, part_name);

    READER_DEBUG("Worksheet metadata: {} merged regions, {} column widths, {} styled cells, {} formulas",
                 metadata.merged_regions.size(), metadata.column_widths.size(),
                 metadata.cell_styles.size(), metadata.cell_formulas.size());
    return metadata;
}

}} // namespace splitsheet::reader
