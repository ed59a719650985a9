#include "WorksheetXMLGenerator.hpp"
#include "excelstream/core/WorksheetModel.hpp"
#include "excelstream/core/ExceptionBridge.hpp"
#include "excelstream/utils/AddressParser.hpp"
#include "excelstream/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <iterator>

namespace excelstream {
namespace xml {

namespace {

core::Result<std::string> rangeReference(int first_row, int first_col, int last_row, int last_col) {
    auto first = utils::AddressParser::tryIndexToAddress(first_row, first_col);
    if (!first) {
        return core::makeError(core::ErrorCode::XmlSerializeError, first.error().message);
    }
    auto last = utils::AddressParser::tryIndexToAddress(last_row, last_col);
    if (!last) {
        return core::makeError(core::ErrorCode::XmlSerializeError, last.error().message);
    }
    return first.value() + ":" + last.value();
}

} // anonymous namespace

WorksheetXMLGenerator::WorksheetXMLGenerator(const core::WorksheetModel& model)
    : model_(model) {
}

const std::vector<WorksheetXMLGenerator::WorksheetField>& WorksheetXMLGenerator::fields() {
    // 顺序即 CT_Worksheet 的子元素顺序
    static const std::vector<WorksheetField> kFields = {
        {"sheetPr",         &WorksheetXMLGenerator::writeSheetProperties, false},
        {"dimension",       &WorksheetXMLGenerator::writeDimension,       false},
        {"sheetViews",      &WorksheetXMLGenerator::writeSheetViews,      false},
        {"sheetFormatPr",   &WorksheetXMLGenerator::writeSheetFormat,     false},
        {"cols",            &WorksheetXMLGenerator::writeColumns,         false},
        {"sheetData",       &WorksheetXMLGenerator::writeSheetData,       true},
        {"sheetProtection", &WorksheetXMLGenerator::writeSheetProtection, false},
        {"autoFilter",      &WorksheetXMLGenerator::writeAutoFilter,      false},
        {"mergeCells",      &WorksheetXMLGenerator::writeMergeCells,      false},
        {"printOptions",    &WorksheetXMLGenerator::writePrintOptions,    false},
        {"pageMargins",     &WorksheetXMLGenerator::writePageMargins,     false},
        {"pageSetup",       &WorksheetXMLGenerator::writePageSetup,       false},
        {"headerFooter",    &WorksheetXMLGenerator::writeHeaderFooter,    false},
        {"drawing",         &WorksheetXMLGenerator::writeDrawing,         false},
        {"tableParts",      &WorksheetXMLGenerator::writeTableParts,      false},
    };
    return kFields;
}

core::Result<std::string> WorksheetXMLGenerator::generate() const {
    return render(nullptr);
}

core::Result<std::string> WorksheetXMLGenerator::reconstruct(std::string_view sheet_data) const {
    return render(&sheet_data);
}

core::Result<std::string> WorksheetXMLGenerator::render(const std::string_view* sheet_data) const {
    XMLStreamWriter writer;

    auto result = core::ExceptionBridge::wrapVoidCall([&]() -> core::VoidResult {
        writer.startDocument();
        writer.startElement("worksheet");
        writer.writeAttribute("xmlns", kMainNamespace);
        writer.writeAttribute("xmlns:r", kRelationshipsNamespace);
        writer.writeAttribute("xmlns:mc", kMarkupCompatibilityNamespace);
        writer.writeAttribute("xmlns:x14ac", kX14acNamespace);
        writer.writeAttribute("mc:Ignorable", "x14ac");

        for (const auto& field : fields()) {
            if (field.replaceable && sheet_data) {
                writer.writeRaw(*sheet_data);
                continue;
            }
            auto written = (this->*field.serialize)(writer);
            if (!written) {
                XML_ERROR("Failed to serialize <{}> of worksheet '{}': {}",
                          field.name, model_.getName(), written.error().message);
                return core::makeError(written.error().code, written.error().message,
                                       fmt::format("field {}", field.name));
            }
        }

        writer.endElement(); // worksheet
        writer.endDocument();
        return {};
    });

    if (!result) {
        return std::move(result).error();
    }
    return writer.take();
}

core::VoidResult WorksheetXMLGenerator::writeSheetProperties(XMLStreamWriter& writer) const {
    const auto& props = model_.properties();
    if (props.isEmpty()) {
        return {};
    }

    writer.startElement("sheetPr");
    if (!props.code_name.empty()) {
        writer.writeAttribute("codeName", props.code_name);
    }
    if (!props.tab_color.empty()) {
        writer.startElement("tabColor");
        writer.writeAttribute("rgb", props.tab_color);
        writer.endElement(); // tabColor
    }
    if (props.fit_to_page) {
        writer.startElement("pageSetUpPr");
        writer.writeAttribute("fitToPage", true);
        writer.endElement(); // pageSetUpPr
    }
    writer.endElement(); // sheetPr
    return {};
}

core::VoidResult WorksheetXMLGenerator::writeDimension(XMLStreamWriter& writer) const {
    writer.startElement("dimension");
    writer.writeAttribute("ref", model_.getDimension());
    writer.endElement();
    return {};
}

core::VoidResult WorksheetXMLGenerator::writeSheetViews(XMLStreamWriter& writer) const {
    const auto& view = model_.sheetView();

    writer.startElement("sheetViews");
    writer.startElement("sheetView");

    if (view.tab_selected) {
        writer.writeAttribute("tabSelected", true);
    }
    if (!view.show_gridlines) {
        writer.writeAttribute("showGridLines", false);
    }
    if (!view.show_row_col_headers) {
        writer.writeAttribute("showRowColHeaders", false);
    }
    if (view.right_to_left) {
        writer.writeAttribute("rightToLeft", true);
    }
    if (view.zoom_scale != 100) {
        writer.writeAttribute("zoomScale", view.zoom_scale);
    }
    writer.writeAttribute("workbookViewId", 0);

    // 冻结窗格
    if (view.freeze.isActive()) {
        const auto& freeze = view.freeze;
        auto top_left = utils::AddressParser::tryIndexToAddress(freeze.row, freeze.col);
        if (!top_left) {
            return core::makeError(core::ErrorCode::XmlSerializeError, top_left.error().message);
        }

        writer.startElement("pane");
        if (freeze.col > 0) {
            writer.writeAttribute("xSplit", freeze.col);
        }
        if (freeze.row > 0) {
            writer.writeAttribute("ySplit", freeze.row);
        }
        // 冻结首行时 topLeftCell = A2；冻结首列时 = B1；同时冻结 = B2
        writer.writeAttribute("topLeftCell", top_left.value());
        if (freeze.row > 0 && freeze.col > 0) {
            writer.writeAttribute("activePane", "bottomRight");
        } else if (freeze.row > 0) {
            writer.writeAttribute("activePane", "bottomLeft");
        } else {
            writer.writeAttribute("activePane", "topRight");
        }
        writer.writeAttribute("state", "frozen");
        writer.endElement(); // pane
    }

    writer.endElement(); // sheetView
    writer.endElement(); // sheetViews
    return {};
}

core::VoidResult WorksheetXMLGenerator::writeSheetFormat(XMLStreamWriter& writer) const {
    const auto& format = model_.sheetFormat();

    writer.startElement("sheetFormatPr");
    if (format.base_col_width >= 0) {
        writer.writeAttribute("baseColWidth", format.base_col_width);
    }
    if (format.default_col_width >= 0) {
        writer.writeAttribute("defaultColWidth", format.default_col_width);
    }
    writer.writeAttribute("defaultRowHeight", format.default_row_height);
    writer.endElement(); // sheetFormatPr
    return {};
}

core::VoidResult WorksheetXMLGenerator::writeColumns(XMLStreamWriter& writer) const {
    const auto& col_info = model_.getColumnInfo();
    if (col_info.empty()) {
        return {};
    }

    writer.startElement("cols");

    // map 已按列号排序，合并属性相同的相邻列
    auto it = col_info.begin();
    while (it != col_info.end()) {
        const int min_col = it->first;
        const auto& info = it->second;
        int max_col = min_col;

        auto next = std::next(it);
        while (next != col_info.end() && next->first == max_col + 1 && next->second == info) {
            max_col = next->first;
            ++next;
        }

        writer.startElement("col");
        writer.writeAttribute("min", min_col + 1);
        writer.writeAttribute("max", max_col + 1);
        if (info.width >= 0) {
            writer.writeAttribute("width", info.width);
            writer.writeAttribute("customWidth", true);
        }
        if (info.format_id >= 0) {
            writer.writeAttribute("style", info.format_id);
        }
        if (info.hidden) {
            writer.writeAttribute("hidden", true);
        }
        if (info.outline_level > 0) {
            writer.writeAttribute("outlineLevel", static_cast<int>(info.outline_level));
        }
        if (info.collapsed) {
            writer.writeAttribute("collapsed", true);
        }
        writer.endElement(); // col

        it = next;
    }

    writer.endElement(); // cols
    return {};
}

core::VoidResult WorksheetXMLGenerator::writeSheetData(XMLStreamWriter& writer) const {
    writer.startElement("sheetData");
    const auto& rows = model_.getSheetDataXML();
    if (!rows.empty()) {
        writer.writeRaw(rows);
    }
    writer.endElement(); // sheetData
    return {};
}

core::VoidResult WorksheetXMLGenerator::writeSheetProtection(XMLStreamWriter& writer) const {
    const auto& protection = model_.getProtection();
    if (!protection.enabled) {
        return {};
    }

    writer.startElement("sheetProtection");
    if (!protection.password_hash.empty()) {
        writer.writeAttribute("password", protection.password_hash);
    }
    writer.writeAttribute("sheet", true);
    writer.writeAttribute("objects", true);
    writer.writeAttribute("scenarios", true);
    writer.endElement(); // sheetProtection
    return {};
}

core::VoidResult WorksheetXMLGenerator::writeAutoFilter(XMLStreamWriter& writer) const {
    const auto& filter = model_.getAutoFilter();
    if (!filter) {
        return {};
    }

    auto ref = rangeReference(filter->first_row, filter->first_col, filter->last_row, filter->last_col);
    if (!ref) {
        return std::move(ref).error();
    }
    writer.startElement("autoFilter");
    writer.writeAttribute("ref", ref.value());
    writer.endElement(); // autoFilter
    return {};
}

core::VoidResult WorksheetXMLGenerator::writeMergeCells(XMLStreamWriter& writer) const {
    const auto& merge_ranges = model_.getMergeRanges();
    if (merge_ranges.empty()) {
        return {};
    }

    writer.startElement("mergeCells");
    writer.writeAttribute("count", static_cast<int>(merge_ranges.size()));

    for (const auto& range : merge_ranges) {
        auto ref = rangeReference(range.first_row, range.first_col, range.last_row, range.last_col);
        if (!ref) {
            return std::move(ref).error();
        }
        writer.startElement("mergeCell");
        writer.writeAttribute("ref", ref.value());
        writer.endElement(); // mergeCell
    }

    writer.endElement(); // mergeCells
    return {};
}

core::VoidResult WorksheetXMLGenerator::writePrintOptions(XMLStreamWriter& writer) const {
    const auto& options = model_.printOptions();
    if (options.isEmpty()) {
        return {};
    }

    writer.startElement("printOptions");
    if (options.horizontal_centered) {
        writer.writeAttribute("horizontalCentered", true);
    }
    if (options.vertical_centered) {
        writer.writeAttribute("verticalCentered", true);
    }
    if (options.headings) {
        writer.writeAttribute("headings", true);
    }
    if (options.grid_lines) {
        writer.writeAttribute("gridLines", true);
    }
    writer.endElement(); // printOptions
    return {};
}

core::VoidResult WorksheetXMLGenerator::writePageMargins(XMLStreamWriter& writer) const {
    const auto& margins = model_.pageMargins();

    writer.startElement("pageMargins");
    writer.writeAttribute("left", margins.left);
    writer.writeAttribute("right", margins.right);
    writer.writeAttribute("top", margins.top);
    writer.writeAttribute("bottom", margins.bottom);
    writer.writeAttribute("header", margins.header);
    writer.writeAttribute("footer", margins.footer);
    writer.endElement(); // pageMargins
    return {};
}

core::VoidResult WorksheetXMLGenerator::writePageSetup(XMLStreamWriter& writer) const {
    const auto& setup = model_.getPageSetup();
    if (!setup) {
        return {};
    }

    writer.startElement("pageSetup");
    if (setup->paper_size > 0) {
        writer.writeAttribute("paperSize", setup->paper_size);
    }
    if (setup->scale != 100) {
        writer.writeAttribute("scale", setup->scale);
    }
    if (setup->fit_to_width >= 0) {
        writer.writeAttribute("fitToWidth", setup->fit_to_width);
    }
    if (setup->fit_to_height >= 0) {
        writer.writeAttribute("fitToHeight", setup->fit_to_height);
    }
    if (!setup->orientation.empty()) {
        writer.writeAttribute("orientation", setup->orientation);
    }
    writer.endElement(); // pageSetup
    return {};
}

core::VoidResult WorksheetXMLGenerator::writeHeaderFooter(XMLStreamWriter& writer) const {
    const auto& header_footer = model_.headerFooter();
    if (header_footer.isEmpty()) {
        return {};
    }

    writer.startElement("headerFooter");
    if (!header_footer.odd_header.empty()) {
        writer.startElement("oddHeader");
        writer.writeText(header_footer.odd_header);
        writer.endElement();
    }
    if (!header_footer.odd_footer.empty()) {
        writer.startElement("oddFooter");
        writer.writeText(header_footer.odd_footer);
        writer.endElement();
    }
    writer.endElement(); // headerFooter
    return {};
}

core::VoidResult WorksheetXMLGenerator::writeDrawing(XMLStreamWriter& writer) const {
    const auto& rel_id = model_.getDrawingRelId();
    if (rel_id.empty()) {
        return {};
    }

    writer.startElement("drawing");
    writer.writeAttribute("r:id", rel_id);
    writer.endElement(); // drawing
    return {};
}

core::VoidResult WorksheetXMLGenerator::writeTableParts(XMLStreamWriter& writer) const {
    const auto& parts = model_.getTableParts();
    if (parts.empty()) {
        return {};
    }

    writer.startElement("tableParts");
    writer.writeAttribute("count", static_cast<int>(parts.size()));
    for (const auto& rel_id : parts) {
        writer.startElement("tablePart");
        writer.writeAttribute("r:id", rel_id);
        writer.endElement(); // tablePart
    }
    writer.endElement(); // tableParts
    return {};
}

}} // namespace excelstream::xml
