#include "splitsheet/reader/StylesCatalog.hpp"
#include "splitsheet/reader/TagScopedVisitor.hpp"
#include "splitsheet/core/Exception.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"
#include <cstdlib>

namespace splitsheet {
namespace reader {

namespace {

int toIndex(std::string_view text) {
    if (text.empty()) {
        return 0;
    }
    const std::string value(text);
    char* end = nullptr;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (end != value.c_str() + value.size() || parsed < 0) {
        return 0;
    }
    return static_cast<int>(parsed);
}

bool toFlag(std::string_view text) {
    return text == "1" || text == "true";
}

} // namespace

StylesCatalog::StylesCatalog() {
    number_formats_[0] = "General";
    number_formats_[1] = "0";
    number_formats_[2] = "0.00";
    number_formats_[49] = "@";
}

StylesCatalog StylesCatalog::parse(std::string_view xml_content) {
    StylesCatalog catalog;

    std::optional<std::string> current_fill;
    bool solid_fill = false;

    TagScopedVisitor visitor;
    visitor
        .onElement("numFmts/numFmt", [&](const TagScopedVisitor::Attributes& attributes) {
            int fmt_id = -1;
            std::string fmt_code;
            for (const auto& attr : attributes) {
                auto name = BaseSAXParser::localName(attr.name);
                if (name == "numFmtId") {
                    fmt_id = toIndex(attr.value);
                } else if (name == "formatCode") {
                    fmt_code.assign(attr.value);
                }
            }
            if (fmt_id >= 0) {
                catalog.number_formats_[fmt_id] = fmt_code;
            }
        })
        .onElement("fills/fill", [&](const TagScopedVisitor::Attributes&) {
            current_fill.reset();
            solid_fill = false;
        })
        .onAttribute("fills/fill/patternFill", "patternType", [&](std::string_view value) {
            solid_fill = value == "solid";
        })
        .onAttribute("fills/fill/fgColor", "rgb", [&](std::string_view value) {
            // ARGB：取后 6 位
            if (value.size() >= 6) {
                current_fill = std::string(value.substr(value.size() - 6));
            }
        })
        .onLeave("fills/fill", [&] {
            // 只解析纯色填充
            catalog.fills_.push_back(solid_fill ? current_fill : std::nullopt);
            current_fill.reset();
            solid_fill = false;
        })
        .onElement("cellXfs/xf", [&](const TagScopedVisitor::Attributes& attributes) {
            CellXf xf;
            for (const auto& attr : attributes) {
                auto name = BaseSAXParser::localName(attr.name);
                if (name == "numFmtId") {
                    xf.num_fmt_id = toIndex(attr.value);
                } else if (name == "fillId") {
                    xf.fill_id = toIndex(attr.value);
                } else if (name == "applyNumberFormat") {
                    xf.apply_number_format = toFlag(attr.value);
                } else if (name == "applyFill") {
                    xf.apply_fill = toFlag(attr.value);
                }
            }
            catalog.cell_xfs_.push_back(xf);
        });

    try {
        visitor.visit(xml_content, "xl/styles.xml");
    } catch (const core::ParseException& e) {
        throw core::ParseException(std::string("样式 XML 解析错误: ") + e.what(), "xl/styles.xml",
                                   core::ErrorCode::CorruptedStyles, __FILE__, __LINE__);
    }

    READER_DEBUG("Parsed styles: {} number formats, {} fills, {} cellXfs",
                 catalog.number_formats_.size(), catalog.fills_.size(), catalog.cell_xfs_.size());
    return catalog;
}

core::CellStyle StylesCatalog::resolve(int style_index) const {
    int num_fmt_id = 0;
    int fill_id = -1;
    if (style_index >= 0 && static_cast<size_t>(style_index) < cell_xfs_.size()) {
        const CellXf& xf = cell_xfs_[static_cast<size_t>(style_index)];
        num_fmt_id = xf.num_fmt_id;
        fill_id = xf.fill_id;
    }

    core::CellStyle style;
    style.number_format = formatCode(num_fmt_id);
    style.background_color = fillColor(fill_id);
    return style;
}

std::optional<std::string> StylesCatalog::formatCode(int num_fmt_id) const {
    auto it = number_formats_.find(num_fmt_id);
    if (it == number_formats_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> StylesCatalog::fillColor(int fill_id) const {
    if (fill_id < 0 || static_cast<size_t>(fill_id) >= fills_.size()) {
        return std::nullopt;
    }
    return fills_[static_cast<size_t>(fill_id)];
}

}} // namespace splitsheet::reader
