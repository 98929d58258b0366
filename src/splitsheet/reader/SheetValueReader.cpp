#include "splitsheet/reader/SheetValueReader.hpp"
#include "splitsheet/reader/SharedStringsParser.hpp"
#include "splitsheet/reader/TagScopedVisitor.hpp"
#include "splitsheet/reader/WorkbookLocator.hpp"
#include "splitsheet/archive/PackageArchive.hpp"
#include "splitsheet/utils/CommonUtils.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace splitsheet {
namespace reader {

SheetValueReader SheetValueReader::open(const archive::PackageArchive& archive) {
    WorkbookLocator locator(archive);
    const std::string sheet_part = locator.firstSheetPart();

    // 缺少工作表属于致命错误
    const std::string sheet_xml = archive.readText(sheet_part);

    SharedStringsParser shared_strings;
    bool has_shared_strings = false;
    if (auto sst_xml = archive.tryReadText("xl/sharedStrings.xml")) {
        shared_strings.parse(*sst_xml);
        has_shared_strings = true;
    }

    SheetValueReader reader;
    reader.load(sheet_xml, has_shared_strings ? &shared_strings : nullptr, sheet_part);
    return reader;
}

void SheetValueReader::load(std::string_view sheet_xml, const SharedStringsParser* shared_strings,
                            const std::string& part_name) {
    cells_.clear();
    row_count_ = 0;
    col_count_ = 0;
    sheet_part_ = part_name;

    int current_row = -1;
    int cell_row = -1;
    int cell_col = -1;
    std::string cell_type;
    std::string cell_value;
    std::string inline_text;
    bool has_value = false;
    bool in_phonetic = false;

    TagScopedVisitor visitor;
    visitor.preserveWhitespace()
        .onElement("sheetData/row", [&](const TagScopedVisitor::Attributes& attributes) {
            ++current_row;
            for (const auto& attr : attributes) {
                if (BaseSAXParser::localName(attr.name) == "r") {
                    auto index = core::parseInteger(attr.value);
                    if (index && *index >= 1) {
                        current_row = static_cast<int>(*index - 1);
                    }
                }
            }
            cell_col = -1;
        })
        .onElement("row/c", [&](const TagScopedVisitor::Attributes& attributes) {
            cell_row = current_row;
            ++cell_col;
            cell_type.clear();
            cell_value.clear();
            inline_text.clear();
            has_value = false;
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
                } else if (name == "t") {
                    cell_type.assign(attr.value);
                }
            }
        })
        .onText("row/c/v", [&](std::string_view text) {
            cell_value.assign(text);
            has_value = true;
        })
        .onElement("c/is/rPh", [&](const TagScopedVisitor::Attributes&) { in_phonetic = true; })
        .onLeave("c/is/rPh", [&] { in_phonetic = false; })
        .onText("c/is/t", [&](std::string_view text) {
            if (!in_phonetic) {
                inline_text.append(text);
            }
        })
        .onElement("c/is", [&](const TagScopedVisitor::Attributes&) { has_value = true; })
        .onLeave("row/c", [&] {
            if (!has_value || cell_row < 0 || cell_col < 0) {
                return;
            }

            RawCell cell;
            if (cell_type == "s") {
                auto index = core::parseInteger(cell_value);
                const std::string* text = (shared_strings && index && *index >= 0)
                    ? shared_strings->get(static_cast<size_t>(*index)) : nullptr;
                if (!text) {
                    READER_WARN("Shared string index '{}' out of range at {}",
                                cell_value, utils::CommonUtils::cellReference(cell_row, cell_col));
                    return;
                }
                cell.text = *text;
            } else if (cell_type == "inlineStr") {
                cell.text = inline_text;
            } else if (cell_type == "str") {
                cell.text = cell_value;
            } else if (cell_type == "b") {
                cell.text = (cell_value == "1" || cell_value == "true") ? "true" : "false";
            } else if (cell_type == "e") {
                return;
            } else {
                std::string_view trimmed = cell_value;
                while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.front()))) trimmed.remove_prefix(1);
                while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.back()))) trimmed.remove_suffix(1);
                if (auto number = core::parseNumber(trimmed)) {
                    cell.number = *number;
                    cell.text = fmt::format("{}", *number);
                } else {
                    cell.text = cell_value;
                }
            }
            store(cell_row, cell_col, std::move(cell));
        });

    visitor.visit(sheet_xml, part_name);

    READER_DEBUG("Loaded {} cells from {} ({} rows x {} cols)", cells_.size(), part_name, row_count_, col_count_);
}

void SheetValueReader::store(int row, int col, RawCell cell) {
    row_count_ = std::max(row_count_, row + 1);
    col_count_ = std::max(col_count_, col + 1);
    cells_[core::CellCoordinate(row, col)] = std::move(cell);
}

const SheetValueReader::RawCell* SheetValueReader::find(int row, int col) const {
    auto it = cells_.find(core::CellCoordinate(row, col));
    return it != cells_.end() ? &it->second : nullptr;
}

std::string SheetValueReader::getString(int row, int col) const {
    const RawCell* cell = find(row, col);
    return cell ? cell->text : std::string();
}

std::optional<double> SheetValueReader::getFloat(int row, int col) const {
    const RawCell* cell = find(row, col);
    if (!cell) {
        return std::nullopt;
    }
    if (cell->number) {
        return cell->number;
    }
    return core::parseNumber(cell->text);
}

bool SheetValueReader::isEmpty(int row, int col) const {
    const RawCell* cell = find(row, col);
    return !cell || cell->text.empty();
}

}} // namespace splitsheet::reader
