#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace splitsheet {
namespace core {

/**
 * @brief 输出单元格格式描述
 *
 * 输出表的单元格统一居中、垂直居中、自动换行、细边框（bordered），
 * 只有数字格式和背景色随单元格变化。0 号格式是工作簿默认格式（无边框）。
 */
struct FormatDescriptor {
    std::optional<std::string> number_format;     // 空或 "General" 表示常规
    std::optional<std::string> background_color;  // 6 位 RGB
    bool bordered = true;

    bool operator==(const FormatDescriptor& other) const {
        return number_format == other.number_format &&
               background_color == other.background_color &&
               bordered == other.bordered;
    }

    size_t hash() const;

    /**
     * @brief 是否需要写 numFmtId（General 不写）
     */
    bool hasNumberFormat() const {
        return number_format && !number_format->empty() && *number_format != "General";
    }
};

/**
 * @brief 格式仓储 - 格式去重存储
 *
 * addFormat 幂等：相同描述返回同一个 ID，ID 即 cellXfs 中的下标。
 */
class FormatRepository {
public:
    FormatRepository();

    FormatRepository(const FormatRepository&) = delete;
    FormatRepository& operator=(const FormatRepository&) = delete;
    FormatRepository(FormatRepository&&) = default;
    FormatRepository& operator=(FormatRepository&&) = default;

    /**
     * @brief 添加格式到仓储
     * @return 格式ID，如果已存在则返回现有ID
     */
    int addFormat(const FormatDescriptor& format);

    /**
     * @brief 根据ID获取格式，ID 无效时返回默认格式
     */
    const FormatDescriptor& getFormat(int id) const;

    int getDefaultFormatId() const { return DEFAULT_FORMAT_ID; }
    size_t getFormatCount() const { return formats_.size(); }

    bool isValidFormatId(int id) const {
        return id >= 0 && static_cast<size_t>(id) < formats_.size();
    }

    /**
     * @brief 去重统计
     */
    struct DeduplicationStats {
        size_t total_requests;
        size_t unique_formats;
    };
    DeduplicationStats getDeduplicationStats() const {
        return {total_requests_, formats_.size()};
    }

    const std::vector<FormatDescriptor>& formats() const { return formats_; }

private:
    static constexpr int DEFAULT_FORMAT_ID = 0;

    std::vector<FormatDescriptor> formats_;
    std::unordered_multimap<size_t, int> hash_to_id_;
    size_t total_requests_ = 0;
};

}} // namespace splitsheet::core
