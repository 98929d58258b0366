#include "splitsheet/core/SplitProcessor.hpp"
#include "splitsheet/core/Exception.hpp"
#include "splitsheet/core/ProgressLog.hpp"
#include "splitsheet/core/TransformEngine.hpp"
#include "splitsheet/core/WorkbookWriter.hpp"
#include "splitsheet/core/WorksheetMetadata.hpp"
#include "splitsheet/archive/PackageArchive.hpp"
#include "splitsheet/reader/ImageReferenceGraph.hpp"
#include "splitsheet/reader/MediaLibrary.hpp"
#include "splitsheet/reader/SheetValueReader.hpp"
#include "splitsheet/reader/StylesCatalog.hpp"
#include "splitsheet/reader/WorkbookLocator.hpp"
#include "splitsheet/reader/WorksheetMetadataParser.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <chrono>

namespace splitsheet {
namespace core {

namespace {

constexpr const char* kStylesPart = "xl/styles.xml";

/**
 * @brief 读取工作表的展示元数据，并挂上媒体诊断和图片
 */
WorksheetMetadata readMetadata(const archive::PackageArchive& archive, const std::string& sheet_part) {
    reader::StylesCatalog styles;
    if (auto styles_xml = archive.tryReadText(kStylesPart)) {
        styles = reader::StylesCatalog::parse(*styles_xml);
    }

    WorksheetMetadata metadata =
        reader::WorksheetMetadataParser::parse(archive.readText(sheet_part), styles, sheet_part);

    const reader::MediaLibrary media = reader::MediaLibrary::scan(archive);
    metadata.converted_media = media.converted();
    metadata.unsupported_media = media.unsupported();

    if (!media.empty()) {
        reader::WorkbookLocator locator(archive);
        const std::string drawing_part =
            locator.drawingPartFor(sheet_part).value_or(reader::ImageReferenceGraph::kDefaultDrawingPart);
        const auto graph = reader::ImageReferenceGraph::build(archive, media, drawing_part);
        graph.linkInto(metadata);
    }
    return metadata;
}

} // namespace

Path SplitProcessor::outputPathFor(const Path& input_path) {
    const std::string stem = input_path.stem();
    if (stem.empty()) {
        throw FileException("无法获取文件名", input_path.string(), ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }

    std::string extension = input_path.extension();
    if (extension.empty()) {
        extension = "xlsx";
    }
    return input_path.parent() / fmt::format("{}_拆分表.{}", stem, extension);
}

ProcessResult SplitProcessor::process(const std::string& input_path) const {
    const auto start_time = std::chrono::steady_clock::now();
    config_.validate();

    ProgressLog progress;
    progress.addf("开始处理文件: {}", input_path);
    progress.addf("处理类型: {}", toString(config_.process_type));

    // 1. 打开源文件（整个请求共用这一个句柄）
    const archive::PackageArchive archive{Path(input_path)};
    progress.add("成功打开 Excel 文件");

    // 2. 第一个工作表的原始值
    const reader::SheetValueReader values = reader::SheetValueReader::open(archive);
    progress.addf("读取工作表，共 {} 行 {} 列", values.rowCount(), values.colCount());

    // 3. 展示元数据
    const WorksheetMetadata metadata = readMetadata(archive, values.sheetPart());
    progress.addf("检测到 {} 个合并单元格区域", metadata.merged_regions.size());
    if (!metadata.cell_images.empty()) {
        progress.addf("检测到 {} 个图片", metadata.cell_images.size());
    }
    if (!metadata.converted_media.empty()) {
        progress.addf("自动转换了 {} 个图片格式: {}", metadata.converted_media.size(),
                      fmt::join(metadata.converted_media, ", "));
    }
    if (!metadata.unsupported_media.empty()) {
        progress.addf("跳过 {} 个无法处理的图片: {}", metadata.unsupported_media.size(),
                      fmt::join(metadata.unsupported_media, ", "));
    }

    // 4. 变换
    const TransformEngine engine(values, metadata, config_);
    const CellGrid grid = engine.transform(&progress);
    progress.addf("处理完成，共 {} 行数据", grid.size());

    // 5. 写出
    const Path output_path = outputPathFor(Path(input_path));
    progress.addf("输出文件路径: {}", output_path.string());

    WorkbookWriter writer(metadata, progress);
    writer.write(grid, output_path);
    progress.add("成功写入处理后的文件");

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    CORE_INFO("Processed {} in {}ms ({} rows, {} images failed)", input_path, elapsed.count(),
              grid.size(), writer.getFailedImageCount());

    ProcessResult result;
    result.success = true;
    result.output_path = output_path.string();
    result.message = "处理完成";
    result.logs = progress.release();
    return result;
}

}} // namespace splitsheet::core
