#include <gtest/gtest.h>
#include "excelstream/core/SpillBuffer.hpp"
#include "excelstream/core/Exception.hpp"
#include <filesystem>
#include <string>

using namespace excelstream;
using excelstream::core::SpillBuffer;

namespace fs = std::filesystem;

class SpillBufferTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir_ = fs::temp_directory_path() / (std::string("excelstream_spill_") + info->name());
        fs::remove_all(temp_dir_);
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    size_t countFiles() const {
        size_t count = 0;
        for (const auto& entry : fs::directory_iterator(temp_dir_)) {
            (void)entry;
            ++count;
        }
        return count;
    }

    fs::path temp_dir_;
};

// 测试1: 未达阈值时不创建临时文件
TEST_F(SpillBufferTest, StaysInMemoryBelowThreshold) {
    SpillBuffer buffer(64, temp_dir_.string());
    buffer.append("<row r=\"1\"/>");
    buffer.maybeSpill();

    EXPECT_FALSE(buffer.hasSpillFile());
    EXPECT_EQ(buffer.spilledBytes(), 0u);
    EXPECT_EQ(buffer.size(), 12u);
    EXPECT_EQ(countFiles(), 0u);

    auto payload = buffer.takePayload();
    ASSERT_TRUE(payload);
    EXPECT_EQ(payload.value(), "<row r=\"1\"/>");
}

// 测试2: 达到阈值后迁移，后续迁移复用同一文件
TEST_F(SpillBufferTest, SpillsAtThresholdAndReusesFile) {
    SpillBuffer buffer(16, temp_dir_.string());

    buffer.append("0123456789");
    buffer.maybeSpill();
    EXPECT_FALSE(buffer.hasSpillFile());

    buffer.append("abcdef");
    buffer.maybeSpill();
    ASSERT_TRUE(buffer.hasSpillFile());
    EXPECT_EQ(buffer.size(), 0u);
    EXPECT_EQ(buffer.spilledBytes(), 16u);

    std::string first_path = buffer.spillPath();
    EXPECT_TRUE(fs::exists(first_path));

    buffer.append("ghijklmnopqrstuvwxyz");
    buffer.maybeSpill();
    EXPECT_EQ(buffer.spillPath(), first_path);
    EXPECT_EQ(buffer.spilledBytes(), 36u);
    EXPECT_EQ(countFiles(), 1u);
}

// 测试3: payload = 文件内容 + 内存缓冲，取出后删除文件
TEST_F(SpillBufferTest, PayloadConcatenatesFileAndMemory) {
    SpillBuffer buffer(16, temp_dir_.string());
    std::string expected;

    for (int i = 0; i < 20; ++i) {
        std::string row = "<row r=\"" + std::to_string(i + 1) + "\"/>";
        expected += row;
        buffer.append(row);
        buffer.maybeSpill();
    }
    buffer.append("tail");
    expected += "tail";

    ASSERT_TRUE(buffer.hasSpillFile());
    std::string path = buffer.spillPath();

    auto payload = buffer.takePayload();
    ASSERT_TRUE(payload) << payload.error().fullMessage();
    EXPECT_EQ(payload.value(), expected);

    EXPECT_FALSE(buffer.hasSpillFile());
    EXPECT_FALSE(fs::exists(path));
    EXPECT_EQ(buffer.size(), 0u);
    EXPECT_EQ(buffer.spilledBytes(), 0u);
}

// 测试4: 临时文件名使用指定前缀
TEST_F(SpillBufferTest, UsesConfiguredPrefix) {
    SpillBuffer buffer(4, temp_dir_.string(), "custom-prefix-");
    buffer.append("12345");
    buffer.maybeSpill();

    ASSERT_TRUE(buffer.hasSpillFile());
    fs::path path(buffer.spillPath());
    EXPECT_EQ(path.parent_path(), temp_dir_);
    EXPECT_EQ(path.filename().string().rfind("custom-prefix-", 0), 0u);
}

// 测试5: 析构时删除未取出的临时文件
TEST_F(SpillBufferTest, DestructorRemovesSpillFile) {
    std::string path;
    {
        SpillBuffer buffer(4, temp_dir_.string());
        buffer.append("12345");
        buffer.maybeSpill();
        path = buffer.spillPath();
        EXPECT_TRUE(fs::exists(path));
    }
    EXPECT_FALSE(fs::exists(path));
}

// 测试6: 临时目录不可用时降级为纯内存，数据完整
TEST_F(SpillBufferTest, DegradesWhenTempDirUnavailable) {
    auto& manager = core::ErrorManager::getInstance();
    size_t warnings_before = manager.getStatistics().total_warnings;

    SpillBuffer buffer(8, (temp_dir_ / "missing" / "nested").string());
    buffer.append("first-row|");
    buffer.maybeSpill();

    EXPECT_TRUE(buffer.isDegraded());
    EXPECT_FALSE(buffer.hasSpillFile());
    EXPECT_EQ(manager.getStatistics().total_warnings, warnings_before + 1);

    // 降级后不再尝试创建文件
    buffer.append("second-row|");
    buffer.maybeSpill();
    EXPECT_EQ(manager.getStatistics().total_warnings, warnings_before + 1);

    auto payload = buffer.takePayload();
    ASSERT_TRUE(payload);
    EXPECT_EQ(payload.value(), "first-row|second-row|");
}
