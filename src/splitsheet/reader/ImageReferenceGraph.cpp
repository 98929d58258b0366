#include "splitsheet/reader/ImageReferenceGraph.hpp"
#include "splitsheet/reader/MediaLibrary.hpp"
#include "splitsheet/reader/RelationshipsParser.hpp"
#include "splitsheet/reader/TagScopedVisitor.hpp"
#include "splitsheet/archive/PackageArchive.hpp"
#include "splitsheet/core/CellTypes.hpp"
#include "splitsheet/utils/CommonUtils.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace splitsheet {
namespace reader {

namespace {

constexpr size_t kMinImageSize = 8;

std::optional<int> parseIndex(std::string_view text) {
    auto value = core::parseInteger(text);
    if (!value || *value < 0 || *value > utils::CommonUtils::kMaxRows) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

} // namespace

ImageReferenceGraph::ImageReferenceGraph(const MediaLibrary& media)
    : media_(&media) {
}

ImageReferenceGraph ImageReferenceGraph::build(const archive::PackageArchive& archive, const MediaLibrary& media,
                                               const std::string& drawing_part) {
    ImageReferenceGraph graph(media);

    if (auto xml = archive.tryReadText(kCellImagesPart)) {
        graph.parseCellImages(*xml);
    }
    if (auto xml = archive.tryReadText(kCellImagesRelsPart)) {
        graph.parseCellImageRelationships(*xml);
    }
    if (auto xml = archive.tryReadText(drawing_part)) {
        graph.parseDrawing(*xml, drawing_part);
    }
    const std::string drawing_rels = utils::CommonUtils::relationshipsPartFor(drawing_part);
    if (auto xml = archive.tryReadText(drawing_rels)) {
        graph.parseDrawingRelationships(*xml, drawing_rels);
    }

    READER_DEBUG("Image graph: {} cell image ids, {} cell image rels, {} drawing ids, {} drawing rels, {} anchors",
                 graph.cell_image_ids_.size(), graph.cell_image_targets_.size(),
                 graph.drawing_image_ids_.size(), graph.drawing_targets_.size(),
                 graph.floating_anchors_.size());
    return graph;
}

void ImageReferenceGraph::parseCellImages(std::string_view xml_content) {
    std::optional<std::string> name;
    std::optional<std::string> embed;

    TagScopedVisitor visitor;
    visitor
        .onElement("cellImage", [&](const TagScopedVisitor::Attributes&) {
            name.reset();
            embed.reset();
        })
        .onAttribute("cellImage/cNvPr", "name", [&](std::string_view value) { name = std::string(value); })
        .onAttribute("cellImage/blip", "embed", [&](std::string_view value) { embed = std::string(value); })
        .onLeave("cellImage", [&] {
            if (name && embed) {
                cell_image_ids_[*name] = *embed;
            }
        });
    visitor.visit(xml_content, kCellImagesPart);
}

void ImageReferenceGraph::parseCellImageRelationships(std::string_view xml_content) {
    RelationshipsParser rels;
    rels.parse(xml_content, kCellImagesRelsPart);
    for (auto& [id, file] : rels.targetFileNames()) {
        cell_image_targets_[id] = file;
    }
}

void ImageReferenceGraph::parseDrawing(std::string_view xml_content, const std::string& part_name) {
    std::optional<int> row;
    std::optional<int> col;
    std::optional<std::string> name;
    std::optional<std::string> embed;

    auto reset = [&](const TagScopedVisitor::Attributes&) {
        row.reset();
        col.reset();
        name.reset();
        embed.reset();
    };
    auto commit = [&] {
        if (row && col && embed) {
            floating_anchors_.push_back(FloatingAnchor{*row, *col, *embed});
        }
        if (name && embed && utils::CommonUtils::startsWith(*name, "ID_")) {
            drawing_image_ids_[*name] = *embed;
        }
    };

    TagScopedVisitor visitor;
    for (const char* anchor : {"twoCellAnchor", "oneCellAnchor"}) {
        const std::string scope(anchor);
        visitor
            .onElement(scope, reset)
            .onText(scope + "/from/row", [&](std::string_view text) { row = parseIndex(text); })
            .onText(scope + "/from/col", [&](std::string_view text) { col = parseIndex(text); })
            .onAttribute(scope + "/pic/cNvPr", "name", [&](std::string_view value) { name = std::string(value); })
            .onAttribute(scope + "/pic/blip", "embed", [&](std::string_view value) { embed = std::string(value); })
            .onLeave(scope, commit);
    }
    visitor.visit(xml_content, part_name);
}

void ImageReferenceGraph::parseDrawingRelationships(std::string_view xml_content, const std::string& part_name) {
    RelationshipsParser rels;
    rels.parse(xml_content, part_name);
    for (auto& [id, file] : rels.targetFileNames()) {
        drawing_targets_[id] = file;
    }
}

std::optional<core::EmbeddedImage> ImageReferenceGraph::resolveFormulaImage(std::string_view formula) const {
    auto image_id = extractImageId(formula);
    if (!image_id) {
        return std::nullopt;
    }

    const auto& ids = idMap();
    auto rid = ids.find(*image_id);
    if (rid == ids.end()) {
        READER_DEBUG("Image id {} has no relationship", *image_id);
        return std::nullopt;
    }

    const auto& targets = targetMap();
    auto file = targets.find(rid->second);
    if (file == targets.end()) {
        READER_DEBUG("Relationship {} of image {} has no target", rid->second, *image_id);
        return std::nullopt;
    }

    return lookupMedia(*image_id, file->second);
}

std::optional<core::EmbeddedImage> ImageReferenceGraph::resolveFloatingImage(const FloatingAnchor& anchor) const {
    auto file = drawing_targets_.find(anchor.relationship_id);
    if (file == drawing_targets_.end()) {
        return std::nullopt;
    }
    return lookupMedia(fmt::format("floating_{}_{}_{}", anchor.row, anchor.col, anchor.relationship_id),
                       file->second);
}

std::optional<core::EmbeddedImage> ImageReferenceGraph::lookupMedia(const std::string& image_id,
                                                                    const std::string& file_name) const {
    const MediaFile* media = media_->find(file_name);
    if (!media || !media->bytes || media->bytes->size() < kMinImageSize) {
        READER_DEBUG("Media file {} for image {} is missing or too small", file_name, image_id);
        return std::nullopt;
    }

    core::EmbeddedImage image;
    image.id = image_id;
    image.bytes = media->bytes;
    image.extension = media->extension;
    return image;
}

size_t ImageReferenceGraph::linkInto(core::WorksheetMetadata& metadata) const {
    if (media_->empty()) {
        return 0;
    }

    size_t formula_linked = 0;
    for (const auto& [coord, formula] : metadata.cell_formulas) {
        if (!isImageFormula(formula)) {
            continue;
        }
        if (auto image = resolveFormulaImage(formula)) {
            metadata.cell_images[coord] = std::move(*image);
            ++formula_linked;
        }
    }

    size_t floating_linked = 0;
    for (const auto& anchor : floating_anchors_) {
        const core::CellCoordinate coord(anchor.row, anchor.col);
        if (metadata.cell_images.count(coord) > 0) {
            continue;
        }
        if (auto image = resolveFloatingImage(anchor)) {
            metadata.cell_images.emplace(coord, std::move(*image));
            ++floating_linked;
        }
    }

    READER_DEBUG("Linked {} formula images and {} floating images", formula_linked, floating_linked);
    return formula_linked + floating_linked;
}

bool ImageReferenceGraph::isImageFormula(std::string_view formula) {
    return formula.find("DISPIMG") != std::string_view::npos;
}

std::optional<std::string> ImageReferenceGraph::extractImageId(std::string_view formula) {
    constexpr std::string_view kPrefix = "DISPIMG(\"";
    auto start = formula.find(kPrefix);
    if (start == std::string_view::npos) {
        return std::nullopt;
    }
    auto rest = formula.substr(start + kPrefix.size());
    auto end = rest.find('"');
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(rest.substr(0, end));
}

}} // namespace splitsheet::reader
