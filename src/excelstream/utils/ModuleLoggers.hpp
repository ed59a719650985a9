#pragma once
#include "Logger.hpp"
#include "LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_TRACE(...)    EXCELSTREAM_LOG_TRACE("[TRC][core] " __VA_ARGS__)
#define CORE_DEBUG(...)    EXCELSTREAM_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     EXCELSTREAM_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     EXCELSTREAM_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    EXCELSTREAM_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 流式写入模块 (stream)
#define STREAM_TRACE(...)    EXCELSTREAM_LOG_TRACE("[TRC][strm] " __VA_ARGS__)
#define STREAM_DEBUG(...)    EXCELSTREAM_LOG_DEBUG("[DBG][strm] " __VA_ARGS__)
#define STREAM_INFO(...)     EXCELSTREAM_LOG_INFO("[INF][strm] " __VA_ARGS__)
#define STREAM_WARN(...)     EXCELSTREAM_LOG_WARN("[WRN][strm] " __VA_ARGS__)
#define STREAM_ERROR(...)    EXCELSTREAM_LOG_ERROR("[ERR][strm] " __VA_ARGS__)

// XML模块 (xml)
#define XML_TRACE(...)    EXCELSTREAM_LOG_TRACE("[TRC][xml ] " __VA_ARGS__)
#define XML_DEBUG(...)    EXCELSTREAM_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_WARN(...)     EXCELSTREAM_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)    EXCELSTREAM_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)    EXCELSTREAM_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_WARN(...)     EXCELSTREAM_LOG_WARN("[WRN][util] " __VA_ARGS__)
#define UTILS_ERROR(...)    EXCELSTREAM_LOG_ERROR("[ERR][util] " __VA_ARGS__)

// 示例模块 (demo)
#define DEMO_INFO(...)     EXCELSTREAM_LOG_INFO("[INF][demo] " __VA_ARGS__)
#define DEMO_ERROR(...)    EXCELSTREAM_LOG_ERROR("[ERR][demo] " __VA_ARGS__)

// 条件日志宏：逐行/逐单元格的日志量很大，默认编译期关闭
#if ENABLE_ROW_TRACE_LOGS
    #define EXCELSTREAM_LOG_ROW_TRACE(...) STREAM_TRACE(__VA_ARGS__)
#else
    #define EXCELSTREAM_LOG_ROW_TRACE(...) do {} while(0)
#endif

#if ENABLE_SPILL_DEBUG_LOGS
    #define EXCELSTREAM_LOG_SPILL_DEBUG(...) STREAM_DEBUG(__VA_ARGS__)
#else
    #define EXCELSTREAM_LOG_SPILL_DEBUG(...) do {} while(0)
#endif
