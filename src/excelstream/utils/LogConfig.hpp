#pragma once

// 日志控制宏
// 设置为 0 禁用特定类型的日志，设置为 1 启用

#ifndef ENABLE_ROW_TRACE_LOGS
#define ENABLE_ROW_TRACE_LOGS 0      // 逐行写入日志
#endif

#ifndef ENABLE_SPILL_DEBUG_LOGS
#define ENABLE_SPILL_DEBUG_LOGS 1    // 溢出到临时文件的调试日志
#endif
