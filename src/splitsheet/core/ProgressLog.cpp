#include "splitsheet/core/ProgressLog.hpp"
#include "splitsheet/utils/ModuleLoggers.hpp"

namespace splitsheet {
namespace core {

void ProgressLog::add(std::string line) {
    CORE_INFO("{}", line);
    lines_.push_back(std::move(line));
}

bool ProgressLog::contains(const std::string& fragment) const {
    for (const auto& line : lines_) {
        if (line.find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}} // namespace splitsheet::core
