#include <gtest/gtest.h>
#include "excelstream/core/Exception.hpp"
#include "excelstream/core/ExceptionBridge.hpp"
#include "excelstream/core/SpillBuffer.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace excelstream;
using namespace excelstream::core;

namespace fs = std::filesystem;

namespace {

// 记录收到的警告
class RecordingWarningHandler : public WarningHandler {
public:
    explicit RecordingWarningHandler(std::vector<std::pair<std::string, std::string>>* sink)
        : sink_(sink) {}

    void handleWarning(const std::string& message, const std::string& context) override {
        sink_->emplace_back(message, context);
    }

private:
    std::vector<std::pair<std::string, std::string>>* sink_;
};

} // anonymous namespace

class ErrorHandlingTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorManager::getInstance().resetStatistics();
    }

    void TearDown() override {
        ErrorManager::getInstance().setWarningHandler(nullptr);
    }

    // throwError 抛出的异常是否为指定类型
    template<typename ExceptionType>
    static bool throwsAs(const Error& error) {
        try {
            throwError(error);
        } catch (const ExceptionType&) {
            return true;
        } catch (const ExcelStreamException&) {
            return false;
        }
        return false;
    }
};

// 测试1: 错误码映射到对应的异常类型
TEST_F(ErrorHandlingTest, ThrowErrorMapsCodesToExceptionTypes) {
    EXPECT_TRUE(throwsAs<FileException>(Error(ErrorCode::FileReadError, "read failed", "/tmp/x")));
    EXPECT_TRUE(throwsAs<FileException>(Error(ErrorCode::FileCreateError, "create failed")));
    EXPECT_TRUE(throwsAs<ParameterException>(Error(ErrorCode::InvalidArgument, "bad")));
    EXPECT_TRUE(throwsAs<WorksheetException>(Error(ErrorCode::SheetLocked, "locked")));
    EXPECT_TRUE(throwsAs<CellException>(Error(ErrorCode::TimeOutOfRange, "too early")));
    EXPECT_TRUE(throwsAs<OperationException>(Error(ErrorCode::StreamFinalized, "flushed")));
    EXPECT_TRUE(throwsAs<ExcelStreamException>(Error(ErrorCode::InvalidWorkbook, "gone")));

    try {
        throwError(Error(ErrorCode::FileReadError, "read failed", "/tmp/x"));
        FAIL() << "throwError returned";
    } catch (const FileException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::FileReadError);
        EXPECT_EQ(e.getFilename(), "/tmp/x");
    }
}

// 测试2: 详细信息包含错误码名称、位置与上下文
TEST_F(ErrorHandlingTest, DetailedMessage) {
    ExcelStreamException e("spill failed", ErrorCode::FileWriteError, "SpillBuffer.cpp", 42);
    e.addContext("sheet Sheet1");

    const std::string detailed = e.getDetailedMessage();
    EXPECT_NE(detailed.find(toString(ErrorCode::FileWriteError)), std::string::npos);
    EXPECT_NE(detailed.find("spill failed"), std::string::npos);
    EXPECT_NE(detailed.find("SpillBuffer.cpp:42"), std::string::npos);
    EXPECT_NE(detailed.find("sheet Sheet1"), std::string::npos);
    ASSERT_EQ(e.getContext().size(), 1u);
}

// 测试3: Result 与异常之间的转换
TEST_F(ErrorHandlingTest, BridgeConvertsBetweenChannels) {
    auto failed = ExceptionBridge::wrapVoidCall([]() -> VoidResult {
        throw WorksheetException("no such sheet", "Data");
    });
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::InvalidWorksheet);

    VoidResult locked = makeError(ErrorCode::SheetLocked, "busy");
    EXPECT_THROW(EXCELSTREAM_UNWRAP(locked), WorksheetException);

    Result<int> ok = 7;
    EXPECT_EQ(ok.valueOrThrow(), 7);
}

// 测试4: 溢出存储不可用的警告送达自定义处理器
TEST_F(ErrorHandlingTest, SpillDegradeReachesWarningHandler) {
    std::vector<std::pair<std::string, std::string>> warnings;
    ErrorManager::getInstance().setWarningHandler(std::make_unique<RecordingWarningHandler>(&warnings));

    const fs::path missing = fs::temp_directory_path() / "excelstream_missing_dir" / "nested";
    fs::remove_all(missing.parent_path());

    SpillBuffer buffer(4, missing.string());
    buffer.append("row-data");
    buffer.maybeSpill();

    ASSERT_TRUE(buffer.isDegraded());
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].second, "SpillBuffer");
    EXPECT_NE(warnings[0].first.find("Spill storage unavailable"), std::string::npos);
    EXPECT_EQ(ErrorManager::getInstance().getStatistics().total_warnings, 1u);
}

// 测试5: 传入空处理器时恢复默认处理器
TEST_F(ErrorHandlingTest, NullHandlerRestoresDefault) {
    auto& manager = ErrorManager::getInstance();
    manager.setWarningHandler(nullptr);
    ASSERT_NE(manager.getWarningHandler(), nullptr);
    EXPECT_NE(dynamic_cast<DefaultWarningHandler*>(manager.getWarningHandler()), nullptr);

    EXPECT_NO_THROW(EXCELSTREAM_HANDLE_WARNING("plain warning", ""));
    EXPECT_EQ(manager.getStatistics().total_warnings, 1u);

    manager.resetStatistics();
    EXPECT_EQ(manager.getStatistics().total_warnings, 0u);
}
