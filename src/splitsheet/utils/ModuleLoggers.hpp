#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    SPLITSHEET_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     SPLITSHEET_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     SPLITSHEET_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    SPLITSHEET_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)  SPLITSHEET_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)   SPLITSHEET_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)   SPLITSHEET_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)  SPLITSHEET_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)     SPLITSHEET_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_WARN(...)      SPLITSHEET_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)     SPLITSHEET_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...) SPLITSHEET_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)  SPLITSHEET_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)  SPLITSHEET_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...) SPLITSHEET_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)   SPLITSHEET_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_WARN(...)    SPLITSHEET_LOG_WARN("[WRN][util] " __VA_ARGS__)
#define UTILS_ERROR(...)   SPLITSHEET_LOG_ERROR("[ERR][util] " __VA_ARGS__)
