#pragma once

#include "excelstream/core/Expected.hpp"
#include "excelstream/xml/XMLStreamWriter.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace excelstream {

namespace core {
    class WorksheetModel;
}

namespace xml {

/**
 * @brief 工作表XML生成器
 *
 * 按 SpreadsheetML 规定的顺序逐字段序列化 WorksheetModel。
 * 字段表在编译期写死，sheetData 是唯一可被整体替换的字段；
 * 根元素本身不在字段表中，由外层的文档头与 <worksheet> 标签提供。
 */
class WorksheetXMLGenerator {
public:
    using FieldSerializer = core::VoidResult (WorksheetXMLGenerator::*)(XMLStreamWriter&) const;

    struct WorksheetField {
        const char* name;
        FieldSerializer serialize;
        bool replaceable;   // 收尾时由流式 payload 整体替换
    };

    static constexpr const char* kMainNamespace =
        "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
    static constexpr const char* kRelationshipsNamespace =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
    static constexpr const char* kMarkupCompatibilityNamespace =
        "http://schemas.openxmlformats.org/markup-compatibility/2006";
    static constexpr const char* kX14acNamespace =
        "http://schemas.microsoft.com/office/spreadsheetml/2009/9/ac";

    explicit WorksheetXMLGenerator(const core::WorksheetModel& model);

    /**
     * @brief 生成完整的工作表XML（sheetData 取自模型本身）
     */
    core::Result<std::string> generate() const;

    /**
     * @brief 用流式 payload 替换 sheetData 后重建工作表XML
     * @param sheet_data 完整的 <sheetData>...</sheetData> 片段，原样写入
     * @return 任一字段序列化失败时返回第一个错误
     */
    core::Result<std::string> reconstruct(std::string_view sheet_data) const;

    /**
     * @brief 按文档顺序排列的字段表
     */
    static const std::vector<WorksheetField>& fields();

private:
    core::Result<std::string> render(const std::string_view* sheet_data) const;

    core::VoidResult writeSheetProperties(XMLStreamWriter& writer) const;
    core::VoidResult writeDimension(XMLStreamWriter& writer) const;
    core::VoidResult writeSheetViews(XMLStreamWriter& writer) const;
    core::VoidResult writeSheetFormat(XMLStreamWriter& writer) const;
    core::VoidResult writeColumns(XMLStreamWriter& writer) const;
    core::VoidResult writeSheetData(XMLStreamWriter& writer) const;
    core::VoidResult writeSheetProtection(XMLStreamWriter& writer) const;
    core::VoidResult writeAutoFilter(XMLStreamWriter& writer) const;
    core::VoidResult writeMergeCells(XMLStreamWriter& writer) const;
    core::VoidResult writePrintOptions(XMLStreamWriter& writer) const;
    core::VoidResult writePageMargins(XMLStreamWriter& writer) const;
    core::VoidResult writePageSetup(XMLStreamWriter& writer) const;
    core::VoidResult writeHeaderFooter(XMLStreamWriter& writer) const;
    core::VoidResult writeDrawing(XMLStreamWriter& writer) const;
    core::VoidResult writeTableParts(XMLStreamWriter& writer) const;

    const core::WorksheetModel& model_;
};

}} // namespace excelstream::xml
