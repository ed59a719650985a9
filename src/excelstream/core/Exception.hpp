/**
 * @file Exception.hpp
 * @brief ExcelStream异常类定义与告警通道
 */

#ifndef EXCELSTREAM_EXCEPTION_HPP
#define EXCELSTREAM_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <memory>
#include <vector>
#include <mutex>
#include "ErrorCode.hpp"

namespace excelstream {
namespace core {

/**
 * @brief ExcelStream基础异常类
 */
class ExcelStreamException : public std::runtime_error {
public:
    /**
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    ExcelStreamException(const std::string& message,
                         ErrorCode code = ErrorCode::InternalError,
                         const char* file = nullptr,
                         int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    /**
     * @brief 获取详细错误信息（错误码、源码位置、上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件相关异常（临时文件创建、读写、删除）
 */
class FileException : public ExcelStreamException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public ExcelStreamException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 操作相关异常（状态不允许的调用）
 */
class OperationException : public ExcelStreamException {
public:
    OperationException(const std::string& message,
                       const std::string& operation = "",
                       ErrorCode code = ErrorCode::InvalidArgument,
                       const char* file = nullptr, int line = 0);

    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

/**
 * @brief 工作表相关异常
 */
class WorksheetException : public ExcelStreamException {
public:
    WorksheetException(const std::string& message,
                       const std::string& worksheet_name = "",
                       ErrorCode code = ErrorCode::InvalidWorksheet,
                       const char* file = nullptr, int line = 0);

    const std::string& getWorksheetName() const { return worksheet_name_; }

private:
    std::string worksheet_name_;
};

/**
 * @brief 单元格相关异常
 */
class CellException : public ExcelStreamException {
public:
    CellException(const std::string& message,
                  int row = -1, int col = -1,
                  ErrorCode code = ErrorCode::InvalidCellReference,
                  const char* file = nullptr, int line = 0);

    int getRow() const { return row_; }
    int getCol() const { return col_; }
    std::string getCellReference() const;

private:
    int row_;
    int col_;
};

/**
 * @brief 警告处理器接口（不中断调用方的降级事件，例如溢出文件不可用）
 */
class WarningHandler {
public:
    virtual ~WarningHandler() = default;

    virtual void handleWarning(const std::string& message,
                               const std::string& context = "") = 0;
};

/**
 * @brief 默认警告处理器：写入日志
 */
class DefaultWarningHandler : public WarningHandler {
public:
    explicit DefaultWarningHandler(bool log_warnings = true);

    void handleWarning(const std::string& message,
                       const std::string& context = "") override;

    void setLogWarnings(bool log_warnings) { log_warnings_ = log_warnings; }

private:
    bool log_warnings_;
};

/**
 * @brief 错误管理器（进程级告警通道）
 *
 * 错误本身通过 Result 或异常返回给调用方，这里只汇集降级警告。
 */
class ErrorManager {
public:
    static ErrorManager& getInstance();

    /// 传入 nullptr 时恢复默认处理器
    void setWarningHandler(std::unique_ptr<WarningHandler> handler);
    WarningHandler* getWarningHandler() const { return warning_handler_.get(); }

    void handleWarning(const std::string& message, const std::string& context = "");

    struct Statistics {
        size_t total_warnings = 0;
    };

    Statistics getStatistics() const;
    void resetStatistics();

private:
    ErrorManager();
    ~ErrorManager() = default;

    std::unique_ptr<WarningHandler> warning_handler_;
    mutable std::mutex mutex_;
    Statistics stats_;

    ErrorManager(const ErrorManager&) = delete;
    ErrorManager& operator=(const ErrorManager&) = delete;
};

} // namespace core
} // namespace excelstream

// 便捷宏定义
#define EXCELSTREAM_HANDLE_WARNING(message, context) \
    excelstream::core::ErrorManager::getInstance().handleWarning(message, context)

#endif // EXCELSTREAM_EXCEPTION_HPP
