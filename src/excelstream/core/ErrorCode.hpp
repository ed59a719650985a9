#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace excelstream {
namespace core {

/**
 * @brief ExcelStream统一错误码
 *
 * 热路径（编码、写行、收尾）只返回错误码，不抛异常；
 * 需要异常的调用方通过 Expected::valueOrThrow() 或 ExceptionBridge 转换。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    OutOfMemory = 2,
    InternalError = 3,

    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileCreateError = 21,
    FileWriteError = 23,
    FileReadError = 24,
    FileDeleteError = 25,

    // Excel格式错误 (40-59)
    InvalidWorkbook = 40,
    InvalidWorksheet = 41,
    InvalidCellReference = 42,
    TimeOutOfRange = 44,

    // XML处理错误 (60-79)
    XmlSerializeError = 60,

    // 流式会话状态 (80-89)
    StreamFinalized = 80,
    SheetLocked = 81
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 把 Error 转成对应的异常类型并抛出（实现在 Exception.cpp）
 */
[[noreturn]] void throwError(const Error& error);

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

}} // namespace excelstream::core
