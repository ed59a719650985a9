#include <gtest/gtest.h>
#include "excelstream/core/Workbook.hpp"
#include "excelstream/core/StreamWriter.hpp"
#include <string>

using namespace excelstream;
using namespace excelstream::core;

class WorkbookTest : public ::testing::Test {
protected:
    void SetUp() override {
        workbook = Workbook::create();
        ASSERT_TRUE(workbook);
    }

    std::unique_ptr<Workbook> workbook;
};

// 测试1: 工作表 id 按添加顺序从 1 开始
TEST_F(WorkbookTest, AddSheetAssignsSequentialIds) {
    auto first = workbook->addSheet("Sheet1");
    auto second = workbook->addSheet("Data");
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value(), 1);
    EXPECT_EQ(second.value(), 2);

    EXPECT_EQ(workbook->getSheetCount(), 2u);
    EXPECT_EQ(workbook->getSheetNames(), (std::vector<std::string>{"Sheet1", "Data"}));
}

// 测试2: 非法名称与重名
TEST_F(WorkbookTest, RejectsInvalidSheetNames) {
    ASSERT_TRUE(workbook->addSheet("Report"));

    for (const char* name : {"", "a/b", "a\\b", "a?b", "a*b", "a[b", "a]b", "a:b", "'quoted", "quoted'"}) {
        auto result = workbook->addSheet(name);
        ASSERT_FALSE(result) << name;
        EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument) << name;
    }
    EXPECT_FALSE(workbook->addSheet(std::string(32, 'x')));
    EXPECT_TRUE(workbook->addSheet(std::string(31, 'x')));

    auto duplicate = workbook->addSheet("REPORT");
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, ErrorCode::InvalidArgument);
}

// 测试3: 按名称查找不区分大小写
TEST_F(WorkbookTest, SheetLookupIgnoresCase) {
    ASSERT_TRUE(workbook->addSheet("Sheet1"));
    ASSERT_TRUE(workbook->addSheet("Summary"));

    EXPECT_EQ(workbook->getSheetIndex("summary"), 2);
    EXPECT_EQ(workbook->getSheetIndex("SHEET1"), 1);
    EXPECT_EQ(workbook->getSheetIndex("Missing"), 0);

    auto model = workbook->getWorksheetModel("SUMMARY");
    ASSERT_TRUE(model);
    EXPECT_EQ(model.value()->getName(), "Summary");
}

// 测试4: 不存在的工作表
TEST_F(WorkbookTest, MissingWorksheetModel) {
    ASSERT_TRUE(workbook->addSheet("Sheet1"));

    EXPECT_EQ(workbook->getWorksheetModel(0).error().code, ErrorCode::InvalidWorksheet);
    EXPECT_EQ(workbook->getWorksheetModel(2).error().code, ErrorCode::InvalidWorksheet);
    EXPECT_EQ(workbook->getWorksheetModel("Other").error().code, ErrorCode::InvalidWorksheet);
}

// 测试5: 部件注册表
TEST_F(WorkbookTest, PartRegistry) {
    EXPECT_EQ(Workbook::sheetPartPath(3), "xl/worksheets/sheet3.xml");

    EXPECT_FALSE(workbook->hasPart("xl/workbook.xml"));
    EXPECT_EQ(workbook->getPart("xl/workbook.xml"), nullptr);

    workbook->setPart("xl/workbook.xml", "<workbook/>");
    ASSERT_NE(workbook->getPart("xl/workbook.xml"), nullptr);
    EXPECT_EQ(*workbook->getPart("xl/workbook.xml"), "<workbook/>");

    workbook->setPart("xl/workbook.xml", "<workbook></workbook>");
    EXPECT_EQ(*workbook->getPart("xl/workbook.xml"), "<workbook></workbook>");
    EXPECT_EQ(workbook->getParts().size(), 1u);
}

// 测试6: 渲染缓存与失效
TEST_F(WorkbookTest, RenderCacheAndEviction) {
    ASSERT_TRUE(workbook->addSheet("Sheet1"));
    const std::string path = Workbook::sheetPartPath(1);

    EXPECT_FALSE(workbook->isSheetCached(path));
    auto rendered = workbook->renderSheet(1);
    ASSERT_TRUE(rendered);
    EXPECT_NE(rendered.value()->find("<sheetData/>"), std::string::npos);
    EXPECT_TRUE(workbook->isSheetCached(path));
    EXPECT_TRUE(workbook->isSheetChecked(path));

    // 缓存命中时返回同一份内容
    auto again = workbook->renderSheet(1);
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value(), rendered.value());

    workbook->evictSheetCache(path);
    EXPECT_FALSE(workbook->isSheetCached(path));
    EXPECT_FALSE(workbook->isSheetChecked(path));

    EXPECT_EQ(workbook->renderSheet(5).error().code, ErrorCode::InvalidWorksheet);
}

// 测试7: writeSheetParts 只补齐尚未登记的工作表
TEST_F(WorkbookTest, WriteSheetPartsKeepsExistingParts) {
    ASSERT_TRUE(workbook->addSheet("Sheet1"));
    ASSERT_TRUE(workbook->addSheet("Sheet2"));
    workbook->setPart(Workbook::sheetPartPath(1), "streamed");

    ASSERT_TRUE(workbook->writeSheetParts());
    EXPECT_EQ(*workbook->getPart(Workbook::sheetPartPath(1)), "streamed");
    ASSERT_TRUE(workbook->hasPart(Workbook::sheetPartPath(2)));
    EXPECT_EQ(workbook->getPart(Workbook::sheetPartPath(2))->find("<?xml"), 0u);
}

// 测试8: 打开中的会话阻止序列化该工作表
TEST_F(WorkbookTest, WriteSheetPartsRejectsLockedSheet) {
    ASSERT_TRUE(workbook->addSheet("Sheet1"));
    auto writer = workbook->newStreamWriter("Sheet1");
    ASSERT_TRUE(writer);

    auto result = workbook->writeSheetParts();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::SheetLocked);

    ASSERT_TRUE(writer.value()->flush());
    EXPECT_TRUE(workbook->writeSheetParts());
}

// 测试9: 创建会话的错误
TEST_F(WorkbookTest, NewStreamWriterErrors) {
    ASSERT_TRUE(workbook->addSheet("Sheet1"));

    auto missing = workbook->newStreamWriter("Nope");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::InvalidWorksheet);

    auto first = workbook->newStreamWriter("sheet1");
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value()->getSheetName(), "Sheet1");
    EXPECT_EQ(first.value()->getSheetId(), 1);
    EXPECT_TRUE(workbook->isSheetLocked(1));

    auto second = workbook->newStreamWriter("Sheet1");
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, ErrorCode::SheetLocked);
}

// 测试10: flush 或析构后释放租约
TEST_F(WorkbookTest, LeaseReleasedAfterFlushOrDestruction) {
    ASSERT_TRUE(workbook->addSheet("Sheet1"));

    {
        auto writer = workbook->newStreamWriter("Sheet1");
        ASSERT_TRUE(writer);
        ASSERT_TRUE(writer.value()->flush());
        EXPECT_FALSE(workbook->isSheetLocked(1));

        auto next = workbook->newStreamWriter("Sheet1");
        ASSERT_TRUE(next);
        EXPECT_TRUE(workbook->isSheetLocked(1));
    }
    EXPECT_FALSE(workbook->isSheetLocked(1));
    EXPECT_TRUE(workbook->newStreamWriter("Sheet1"));
}

// 测试11: 会话默认使用工作簿选项
TEST_F(WorkbookTest, SessionInheritsWorkbookOptions) {
    WorkbookOptions options;
    options.stream.spill_threshold = 1024;
    options.stream.check_row_order = true;
    auto custom = Workbook::create(options);
    ASSERT_TRUE(custom->addSheet("Sheet1"));

    auto writer = custom->newStreamWriter("Sheet1");
    ASSERT_TRUE(writer);
    EXPECT_EQ(writer.value()->getOptions().spill_threshold, 1024u);
    EXPECT_TRUE(writer.value()->getOptions().check_row_order);

    StreamWriterOptions override_options;
    override_options.spill_threshold = 64;
    ASSERT_TRUE(writer.value()->flush());
    auto overridden = custom->newStreamWriter("Sheet1", override_options);
    ASSERT_TRUE(overridden);
    EXPECT_EQ(overridden.value()->getOptions().spill_threshold, 64u);
    EXPECT_FALSE(overridden.value()->getOptions().check_row_order);
}
