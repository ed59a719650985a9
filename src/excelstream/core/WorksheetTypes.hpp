#pragma once

#include <cstdint>
#include <string>

namespace excelstream {
namespace core {

/**
 * @file WorksheetTypes.hpp
 * @brief 工作表文档模型中非流式部分使用的类型
 *
 * 行列索引均从 0 开始。
 */

// 列信息结构
struct ColumnInfo {
    double width = -1.0;
    int format_id = -1;
    bool hidden = false;
    bool collapsed = false;
    uint8_t outline_level = 0;

    bool operator==(const ColumnInfo& other) const {
        return width == other.width &&
               format_id == other.format_id &&
               hidden == other.hidden &&
               collapsed == other.collapsed &&
               outline_level == other.outline_level;
    }

    bool operator!=(const ColumnInfo& other) const { return !(*this == other); }
};

// 合并单元格范围
struct MergeRange {
    int first_row;
    int first_col;
    int last_row;
    int last_col;

    MergeRange(int fr, int fc, int lr, int lc)
        : first_row(fr), first_col(fc), last_row(lr), last_col(lc) {}
};

// 自动筛选范围
struct AutoFilterRange {
    int first_row;
    int first_col;
    int last_row;
    int last_col;

    AutoFilterRange(int fr = 0, int fc = 0, int lr = 0, int lc = 0)
        : first_row(fr), first_col(fc), last_row(lr), last_col(lc) {}
};

// 冻结窗格信息（冻结的行数与列数）
struct FreezePanes {
    int row = 0;
    int col = 0;

    FreezePanes(int r = 0, int c = 0) : row(r), col(c) {}

    bool isActive() const { return row > 0 || col > 0; }
};

/**
 * @brief 页面视图设置结构体
 */
struct SheetView {
    bool show_gridlines = true;       // 显示网格线
    bool show_row_col_headers = true; // 显示行列标题
    bool right_to_left = false;       // 从右到左
    bool tab_selected = false;        // 选项卡选中
    int zoom_scale = 100;             // 缩放比例
    FreezePanes freeze;
};

// 工作表属性 <sheetPr>
struct SheetProperties {
    std::string code_name;
    std::string tab_color;     // ARGB，例如 "FFFF0000"
    bool fit_to_page = false;

    bool isEmpty() const { return code_name.empty() && tab_color.empty() && !fit_to_page; }
};

// 默认行高列宽 <sheetFormatPr>
struct SheetFormat {
    double default_row_height = 15.0;
    double default_col_width = -1.0;   // 小于 0 时不输出
    int base_col_width = -1;           // 小于 0 时不输出
};

// 工作表保护 <sheetProtection>
struct SheetProtection {
    bool enabled = false;
    std::string password_hash;   // 4 位十六进制的旧式密码哈希
};

// 打印选项 <printOptions>
struct PrintOptions {
    bool grid_lines = false;
    bool headings = false;
    bool horizontal_centered = false;
    bool vertical_centered = false;

    bool isEmpty() const { return !grid_lines && !headings && !horizontal_centered && !vertical_centered; }
};

// 页边距（英寸）<pageMargins>
struct PageMargins {
    double left = 0.7;
    double right = 0.7;
    double top = 0.75;
    double bottom = 0.75;
    double header = 0.3;
    double footer = 0.3;
};

// 页面设置 <pageSetup>
struct PageSetup {
    int paper_size = 0;          // 0 表示不输出
    std::string orientation;     // "portrait" / "landscape"，为空不输出
    int scale = 100;
    int fit_to_width = -1;
    int fit_to_height = -1;
};

// 页眉页脚 <headerFooter>
struct HeaderFooter {
    std::string odd_header;
    std::string odd_footer;

    bool isEmpty() const { return odd_header.empty() && odd_footer.empty(); }
};

}} // namespace excelstream::core
