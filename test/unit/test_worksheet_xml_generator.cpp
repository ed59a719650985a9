#include <gtest/gtest.h>
#include "excelstream/xml/WorksheetXMLGenerator.hpp"
#include "excelstream/core/WorksheetModel.hpp"
#include <string>
#include <vector>

using namespace excelstream;
using excelstream::core::WorksheetModel;
using excelstream::xml::WorksheetXMLGenerator;

namespace {

const char* kRootOpen =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<worksheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\""
    " xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\""
    " xmlns:mc=\"http://schemas.openxmlformats.org/markup-compatibility/2006\""
    " xmlns:x14ac=\"http://schemas.microsoft.com/office/spreadsheetml/2009/9/ac\""
    " mc:Ignorable=\"x14ac\">";

size_t countOccurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

} // anonymous namespace

class WorksheetXMLGeneratorTest : public ::testing::Test {
protected:
    std::string generate() {
        WorksheetXMLGenerator generator(model);
        auto result = generator.generate();
        EXPECT_TRUE(result);
        return result ? result.value() : std::string();
    }

    WorksheetModel model{"Sheet1"};
};

// 测试1: 字段表顺序固定，只有 sheetData 可替换
TEST_F(WorksheetXMLGeneratorTest, FieldTableOrder) {
    const std::vector<std::string> expected = {
        "sheetPr", "dimension", "sheetViews", "sheetFormatPr", "cols", "sheetData",
        "sheetProtection", "autoFilter", "mergeCells", "printOptions", "pageMargins",
        "pageSetup", "headerFooter", "drawing", "tableParts"
    };

    const auto& fields = WorksheetXMLGenerator::fields();
    ASSERT_EQ(fields.size(), expected.size());
    for (size_t i = 0; i < fields.size(); ++i) {
        EXPECT_EQ(fields[i].name, expected[i]);
        EXPECT_EQ(fields[i].replaceable, expected[i] == "sheetData") << fields[i].name;
    }
}

// 测试2: 默认模型的完整文档
TEST_F(WorksheetXMLGeneratorTest, DefaultDocument) {
    std::string expected = std::string(kRootOpen) +
        "<dimension ref=\"A1\"/>"
        "<sheetViews><sheetView workbookViewId=\"0\"/></sheetViews>"
        "<sheetFormatPr defaultRowHeight=\"15\"/>"
        "<sheetData/>"
        "<pageMargins left=\"0.7\" right=\"0.7\" top=\"0.75\" bottom=\"0.75\" header=\"0.3\" footer=\"0.3\"/>"
        "</worksheet>";

    EXPECT_EQ(generate(), expected);
}

// 测试3: 模型自带的行数据写在 sheetData 中
TEST_F(WorksheetXMLGeneratorTest, ModelSheetData) {
    model.setSheetDataXML("<row r=\"1\"/>");
    EXPECT_NE(generate().find("<sheetData><row r=\"1\"/></sheetData>"), std::string::npos);
}

// 测试4: reconstruct 原样写入 payload 且只写一次
TEST_F(WorksheetXMLGeneratorTest, ReconstructSplicesPayloadVerbatim) {
    model.setSheetDataXML("<row r=\"99\"/>");
    ASSERT_TRUE(model.mergeCells(0, 0, 1, 1));

    const std::string payload =
        "<sheetData><row r=\"1\"><c r=\"A1\" t=\"str\"><v>a&amp;b</v></c></row></sheetData>";

    WorksheetXMLGenerator generator(model);
    auto result = generator.reconstruct(payload);
    ASSERT_TRUE(result);
    const std::string& document = result.value();

    EXPECT_EQ(countOccurrences(document, payload), 1u);
    EXPECT_EQ(countOccurrences(document, "<sheetData"), 1u);
    EXPECT_EQ(document.find("<row r=\"99\"/>"), std::string::npos);

    size_t format_pos = document.find("<sheetFormatPr");
    size_t data_pos = document.find(payload);
    size_t merge_pos = document.find("<mergeCells");
    size_t margins_pos = document.find("<pageMargins");
    EXPECT_LT(format_pos, data_pos);
    EXPECT_LT(data_pos, merge_pos);
    EXPECT_LT(merge_pos, margins_pos);
    EXPECT_NE(document.find("<mergeCells count=\"1\"><mergeCell ref=\"A1:B2\"/></mergeCells>"),
              std::string::npos);
}

// 测试5: 属性相同的相邻列合并为一个 <col>
TEST_F(WorksheetXMLGeneratorTest, AdjacentColumnsMerged) {
    ASSERT_TRUE(model.setColumnWidth(0, 20));
    ASSERT_TRUE(model.setColumnWidth(1, 20));
    ASSERT_TRUE(model.setColumnWidth(2, 12.5));
    ASSERT_TRUE(model.setColumnWidth(4, 12.5));

    EXPECT_NE(generate().find(
        "<cols>"
        "<col min=\"1\" max=\"2\" width=\"20\" customWidth=\"1\"/>"
        "<col min=\"3\" max=\"3\" width=\"12.5\" customWidth=\"1\"/>"
        "<col min=\"5\" max=\"5\" width=\"12.5\" customWidth=\"1\"/>"
        "</cols>"), std::string::npos);
}

// 测试6: 冻结首行
TEST_F(WorksheetXMLGeneratorTest, FrozenTopRow) {
    ASSERT_TRUE(model.freezePanes(1, 0));
    EXPECT_NE(generate().find(
        "<sheetView workbookViewId=\"0\">"
        "<pane ySplit=\"1\" topLeftCell=\"A2\" activePane=\"bottomLeft\" state=\"frozen\"/>"
        "</sheetView>"), std::string::npos);
}

// 测试7: 冻结行和列
TEST_F(WorksheetXMLGeneratorTest, FrozenRowsAndColumns) {
    ASSERT_TRUE(model.freezePanes(2, 1));
    EXPECT_NE(generate().find(
        "<pane xSplit=\"1\" ySplit=\"2\" topLeftCell=\"B3\" activePane=\"bottomRight\" state=\"frozen\"/>"),
        std::string::npos);
}

// 测试8: 页眉页脚文本转义
TEST_F(WorksheetXMLGeneratorTest, HeaderFooterEscaped) {
    model.headerFooter().odd_header = "&CR&D <draft>";
    EXPECT_NE(generate().find(
        "<headerFooter><oddHeader>&amp;CR&amp;D &lt;draft&gt;</oddHeader></headerFooter>"),
        std::string::npos);
}

// 测试9: 所有字段同时存在时按规定顺序输出
TEST_F(WorksheetXMLGeneratorTest, FullModelElementOrder) {
    model.properties().tab_color = "FFFF0000";
    ASSERT_TRUE(model.setDimension(0, 0, 9, 2));
    model.sheetView().tab_selected = true;
    ASSERT_TRUE(model.setColumnWidth(0, 30));
    ASSERT_TRUE(model.protect("cc1a"));
    ASSERT_TRUE(model.setAutoFilter(0, 0, 9, 2));
    ASSERT_TRUE(model.mergeCells(0, 3, 0, 4));
    model.printOptions().grid_lines = true;
    core::PageSetup setup;
    setup.orientation = "landscape";
    model.setPageSetup(setup);
    model.headerFooter().odd_footer = "Page &P";
    model.setDrawingRelId("rId1");
    model.addTablePart("rId2");

    std::string document = generate();

    const std::vector<std::string> order = {
        "<sheetPr><tabColor rgb=\"FFFF0000\"/></sheetPr>",
        "<dimension ref=\"A1:C10\"/>",
        "<sheetView tabSelected=\"1\" workbookViewId=\"0\"/>",
        "<sheetFormatPr",
        "<col min=\"1\" max=\"1\" width=\"30\" customWidth=\"1\"/>",
        "<sheetData/>",
        "<sheetProtection password=\"CC1A\" sheet=\"1\" objects=\"1\" scenarios=\"1\"/>",
        "<autoFilter ref=\"A1:C10\"/>",
        "<mergeCell ref=\"D1:E1\"/>",
        "<printOptions gridLines=\"1\"/>",
        "<pageMargins",
        "<pageSetup orientation=\"landscape\"/>",
        "<headerFooter><oddFooter>Page &amp;P</oddFooter></headerFooter>",
        "<drawing r:id=\"rId1\"/>",
        "<tableParts count=\"1\"><tablePart r:id=\"rId2\"/></tableParts>",
        "</worksheet>"
    };

    size_t previous = 0;
    for (const auto& fragment : order) {
        size_t pos = document.find(fragment);
        ASSERT_NE(pos, std::string::npos) << fragment;
        EXPECT_GE(pos, previous) << fragment;
        previous = pos;
    }
}

// 测试10: 模型校验
TEST_F(WorksheetXMLGeneratorTest, ModelValidation) {
    EXPECT_EQ(model.mergeCells(0, 0, 0, 0).error().code, core::ErrorCode::InvalidArgument);
    ASSERT_TRUE(model.mergeCells(0, 0, 2, 2));
    EXPECT_EQ(model.mergeCells(1, 1, 3, 3).error().code, core::ErrorCode::InvalidArgument);
    EXPECT_EQ(model.setAutoFilter(5, 0, 1, 0).error().code, core::ErrorCode::InvalidArgument);
    EXPECT_EQ(model.setDimension(0, 0, 0, 16384).error().code, core::ErrorCode::InvalidCellReference);
    EXPECT_EQ(model.setColumnWidth(0, 300).error().code, core::ErrorCode::InvalidArgument);
    EXPECT_EQ(model.protect("xyz").error().code, core::ErrorCode::InvalidArgument);
    EXPECT_EQ(model.freezePanes(-1, 0).error().code, core::ErrorCode::InvalidArgument);

    ASSERT_TRUE(model.setDimension(4, 1, 4, 1));
    EXPECT_EQ(model.getDimension(), "B5");
}

// 测试11: 字段序列化失败时返回错误并带上字段名
TEST_F(WorksheetXMLGeneratorTest, FieldErrorCarriesFieldName) {
    // 冻结位置越过最后一行，无法生成 topLeftCell
    model.sheetView().freeze = core::FreezePanes(1048576, 0);

    WorksheetXMLGenerator generator(model);
    auto generated = generator.generate();
    ASSERT_FALSE(generated);
    EXPECT_EQ(generated.error().code, core::ErrorCode::XmlSerializeError);
    EXPECT_NE(generated.error().context.find("sheetViews"), std::string::npos);

    // 拼接流式数据时同样失败
    auto reconstructed = generator.reconstruct("<sheetData/>");
    ASSERT_FALSE(reconstructed);
    EXPECT_EQ(reconstructed.error().code, core::ErrorCode::XmlSerializeError);
}
