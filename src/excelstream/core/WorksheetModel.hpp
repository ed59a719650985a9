#pragma once

#include "excelstream/core/WorksheetTypes.hpp"
#include "excelstream/core/Expected.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace excelstream {
namespace core {

/**
 * @brief 工作表文档模型（非流式部分）
 *
 * 保存 <worksheet> 下除行数据以外的全部字段。流式会话收尾时，
 * 这些字段按声明顺序原样序列化，只有 sheetData 被流式 payload 整体替换。
 */
class WorksheetModel {
public:
    explicit WorksheetModel(std::string name);

    const std::string& getName() const { return name_; }

    // ========== sheetPr ==========

    SheetProperties& properties() { return properties_; }
    const SheetProperties& properties() const { return properties_; }

    // ========== dimension ==========

    const std::string& getDimension() const { return dimension_; }

    /**
     * @brief 设置已用区域，单个单元格时输出 "A1" 形式，否则 "A1:C10"
     */
    VoidResult setDimension(int first_row, int first_col, int last_row, int last_col);

    // ========== sheetViews ==========

    SheetView& sheetView() { return sheet_view_; }
    const SheetView& sheetView() const { return sheet_view_; }

    /**
     * @brief 冻结前 rows 行、前 cols 列；两者都为 0 时取消冻结
     */
    VoidResult freezePanes(int rows, int cols);

    // ========== sheetFormatPr ==========

    SheetFormat& sheetFormat() { return sheet_format_; }
    const SheetFormat& sheetFormat() const { return sheet_format_; }

    // ========== cols ==========

    VoidResult setColumnInfo(int col, const ColumnInfo& info);
    VoidResult setColumnWidth(int col, double width);
    const std::map<int, ColumnInfo>& getColumnInfo() const { return column_info_; }

    // ========== sheetData ==========

    /**
     * @brief 非流式写入的行数据（<row> 片段序列，不含 sheetData 标签）
     */
    const std::string& getSheetDataXML() const { return sheet_data_xml_; }
    void setSheetDataXML(std::string rows_xml) { sheet_data_xml_ = std::move(rows_xml); }

    // ========== sheetProtection ==========

    const SheetProtection& getProtection() const { return protection_; }

    /**
     * @param password_hash 4 位十六进制哈希，可为空
     */
    VoidResult protect(const std::string& password_hash = "");
    void unprotect() { protection_ = SheetProtection{}; }

    // ========== autoFilter ==========

    VoidResult setAutoFilter(int first_row, int first_col, int last_row, int last_col);
    void removeAutoFilter() { auto_filter_.reset(); }
    const std::optional<AutoFilterRange>& getAutoFilter() const { return auto_filter_; }

    // ========== mergeCells ==========

    VoidResult mergeCells(int first_row, int first_col, int last_row, int last_col);
    const std::vector<MergeRange>& getMergeRanges() const { return merge_ranges_; }

    // ========== 打印与页面 ==========

    PrintOptions& printOptions() { return print_options_; }
    const PrintOptions& printOptions() const { return print_options_; }

    PageMargins& pageMargins() { return page_margins_; }
    const PageMargins& pageMargins() const { return page_margins_; }

    void setPageSetup(const PageSetup& setup) { page_setup_ = setup; }
    const std::optional<PageSetup>& getPageSetup() const { return page_setup_; }

    HeaderFooter& headerFooter() { return header_footer_; }
    const HeaderFooter& headerFooter() const { return header_footer_; }

    // ========== 关系引用 ==========

    void setDrawingRelId(std::string rel_id) { drawing_rel_id_ = std::move(rel_id); }
    const std::string& getDrawingRelId() const { return drawing_rel_id_; }

    void addTablePart(std::string rel_id) { table_part_rel_ids_.push_back(std::move(rel_id)); }
    const std::vector<std::string>& getTableParts() const { return table_part_rel_ids_; }

private:
    std::string name_;

    SheetProperties properties_;
    std::string dimension_ = "A1";
    SheetView sheet_view_;
    SheetFormat sheet_format_;
    std::map<int, ColumnInfo> column_info_;
    std::string sheet_data_xml_;
    SheetProtection protection_;
    std::optional<AutoFilterRange> auto_filter_;
    std::vector<MergeRange> merge_ranges_;
    PrintOptions print_options_;
    PageMargins page_margins_;
    std::optional<PageSetup> page_setup_;
    HeaderFooter header_footer_;
    std::string drawing_rel_id_;
    std::vector<std::string> table_part_rel_ids_;
};

}} // namespace excelstream::core
