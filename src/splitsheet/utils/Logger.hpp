#pragma once

#include <atomic>
#include <cstring>
#include <fstream>
#include <mutex>
#include <string>
#include <algorithm>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace splitsheet {

/**
 * @brief 全局日志器（单例）
 *
 * - 控制台彩色输出 + 滚动文件输出
 * - fmt 风格格式化，格式串错误时退化为原样输出
 * - shutdown() 之后可以重新 initialize()（测试夹具依赖这一点）
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    void initialize(const std::string& log_file_path = "logs/splitsheet.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    void setConsoleEnabled(bool enabled) { enable_console_.store(enabled); }
    bool isInitialized() const { return initialized_.load(); }

    bool shouldLog(Level level) const;

    /**
     * @brief 写入一条已格式化好的日志
     */
    void write(Level level, const std::string& message);

    template<typename... Args>
    void log(Level level, const std::string& fmt_str, Args&&... args) {
        if (!shouldLog(level)) return;
        if constexpr (sizeof...(Args) == 0) {
            write(level, fmt_str);
        } else {
            try {
                write(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
            } catch (const fmt::format_error&) {
                write(level, fmt_str);
            }
        }
    }

    template<typename... Args>
    void trace(const std::string& fmt_str, Args&&... args) { log(Level::TRACE, fmt_str, std::forward<Args>(args)...); }
    template<typename... Args>
    void debug(const std::string& fmt_str, Args&&... args) { log(Level::DEBUG, fmt_str, std::forward<Args>(args)...); }
    template<typename... Args>
    void info(const std::string& fmt_str, Args&&... args) { log(Level::INFO, fmt_str, std::forward<Args>(args)...); }
    template<typename... Args>
    void warn(const std::string& fmt_str, Args&&... args) { log(Level::WARN, fmt_str, std::forward<Args>(args)...); }
    template<typename... Args>
    void error(const std::string& fmt_str, Args&&... args) { log(Level::ERROR, fmt_str, std::forward<Args>(args)...); }
    template<typename... Args>
    void critical(const std::string& fmt_str, Args&&... args) { log(Level::CRITICAL, fmt_str, std::forward<Args>(args)...); }

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    void logCtx(Level level, const char* file, int line, const char* func,
                const std::string& fmt_str, Args&&... args) {
        if (!shouldLog(level)) return;
        const std::string fmt_with_ctx = fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str);
        log(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void logToConsole(Level level, const std::string& line);
    void logToFile(const std::string& line);
    std::string formatLine(Level level, const std::string& message) const;
    static const char* levelName(Level level);
    void rotateIfNeeded();
    std::string rotatedFilename(size_t index) const;

    // 提取文件名（去除路径）
    static const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#define SPLITSHEET_FUNC __func__

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define SPLITSHEET_LOG_TRACE(fmt, ...)    ::splitsheet::Logger::getInstance().logCtx(::splitsheet::Logger::Level::TRACE,    __FILE__, __LINE__, SPLITSHEET_FUNC, fmt, ##__VA_ARGS__)
#define SPLITSHEET_LOG_DEBUG(fmt, ...)    ::splitsheet::Logger::getInstance().logCtx(::splitsheet::Logger::Level::DEBUG,    __FILE__, __LINE__, SPLITSHEET_FUNC, fmt, ##__VA_ARGS__)
#define SPLITSHEET_LOG_INFO(fmt, ...)     ::splitsheet::Logger::getInstance().logCtx(::splitsheet::Logger::Level::INFO,     __FILE__, __LINE__, SPLITSHEET_FUNC, fmt, ##__VA_ARGS__)
#define SPLITSHEET_LOG_WARN(fmt, ...)     ::splitsheet::Logger::getInstance().logCtx(::splitsheet::Logger::Level::WARN,     __FILE__, __LINE__, SPLITSHEET_FUNC, fmt, ##__VA_ARGS__)
#define SPLITSHEET_LOG_ERROR(fmt, ...)    ::splitsheet::Logger::getInstance().logCtx(::splitsheet::Logger::Level::ERROR,    __FILE__, __LINE__, SPLITSHEET_FUNC, fmt, ##__VA_ARGS__)
#define SPLITSHEET_LOG_CRITICAL(fmt, ...) ::splitsheet::Logger::getInstance().logCtx(::splitsheet::Logger::Level::CRITICAL, __FILE__, __LINE__, SPLITSHEET_FUNC, fmt, ##__VA_ARGS__)

} // namespace splitsheet
