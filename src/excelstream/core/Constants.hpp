#pragma once

#include <cstddef>

namespace excelstream {
namespace core {

// 通用常量集中定义，便于统一调整与复用
struct Constants {
    // 读回溢出文件时的 I/O 块大小
    static constexpr size_t kIOBufferSize = 8192;

    // 行数据缓冲区超过该大小后迁移到临时文件 (16 MiB)
    static constexpr size_t kSpillThreshold = size_t(1) << 24;

    // 单元格文本最大长度（字符数）
    static constexpr size_t kMaxCellTextLength = 32767;

    // 工作表最大列数 (XFD) 与最大行数
    static constexpr int kMaxColumns = 16384;
    static constexpr int kMaxRows = 1048576;
};

} // namespace core
} // namespace excelstream
