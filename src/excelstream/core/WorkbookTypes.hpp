#pragma once

#include "excelstream/core/Constants.hpp"
#include <string>
#include <cstddef>

namespace excelstream {
namespace core {

/**
 * @file WorkbookTypes.hpp
 * @brief 工作簿与流式会话的配置选项
 */

/**
 * @brief 流式写入会话选项
 */
struct StreamWriterOptions {
    size_t spill_threshold = Constants::kSpillThreshold;  // 行缓冲迁移到临时文件的阈值（字节）
    std::string temp_dir;                                 // 临时目录，为空时使用系统临时目录
    std::string temp_prefix = "excelstream-";             // 临时文件名前缀
    bool check_row_order = false;                         // 行号递减时拒绝写入
};

/**
 * @brief 工作簿选项配置结构体
 */
struct WorkbookOptions {
    StreamWriterOptions stream;   // newStreamWriter() 的默认会话选项
};

}} // namespace excelstream::core
