/**
 * @file Exception.cpp
 * @brief ExcelStream异常类实现
 */

#include "Exception.hpp"
#include "excelstream/utils/AddressParser.hpp"
#include "excelstream/utils/Logger.hpp"
#include <sstream>
#include <fmt/format.h>

namespace excelstream {
namespace core {

ExcelStreamException::ExcelStreamException(const std::string& message,
                                           ErrorCode code,
                                           const char* file,
                                           int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string ExcelStreamException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << toString(error_code_) << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void ExcelStreamException::addContext(const std::string& context) {
    context_.push_back(context);
}

FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : ExcelStreamException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : ExcelStreamException(parameter_name.empty() ? message
                               : fmt::format("{} (parameter: {})", message, parameter_name),
                           ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

OperationException::OperationException(const std::string& message,
                                       const std::string& operation,
                                       ErrorCode code, const char* file, int line)
    : ExcelStreamException(operation.empty() ? message
                               : fmt::format("{} (operation: {})", message, operation),
                           code, file, line)
    , operation_(operation) {
}

WorksheetException::WorksheetException(const std::string& message,
                                       const std::string& worksheet_name,
                                       ErrorCode code, const char* file, int line)
    : ExcelStreamException(worksheet_name.empty() ? message
                               : fmt::format("{} (worksheet: {})", message, worksheet_name),
                           code, file, line)
    , worksheet_name_(worksheet_name) {
}

CellException::CellException(const std::string& message,
                             int row, int col, ErrorCode code,
                             const char* file, int line)
    : ExcelStreamException(message, code, file, line)
    , row_(row)
    , col_(col) {
}

std::string CellException::getCellReference() const {
    auto ref = utils::AddressParser::tryIndexToAddress(row_, col_);
    return ref ? ref.value() : std::string("Unknown");
}

void throwError(const Error& error) {
    const std::string message = error.fullMessage();
    switch (error.code) {
        case ErrorCode::FileNotFound:
        case ErrorCode::FileCreateError:
        case ErrorCode::FileWriteError:
        case ErrorCode::FileReadError:
        case ErrorCode::FileDeleteError:
            throw FileException(error.message, error.context, error.code);
        case ErrorCode::InvalidArgument:
            throw ParameterException(message);
        case ErrorCode::InvalidWorksheet:
        case ErrorCode::SheetLocked:
            throw WorksheetException(message, "", error.code);
        case ErrorCode::InvalidCellReference:
        case ErrorCode::TimeOutOfRange:
            throw CellException(message, -1, -1, error.code);
        case ErrorCode::StreamFinalized:
            throw OperationException(message, "", error.code);
        default:
            throw ExcelStreamException(message, error.code);
    }
}

DefaultWarningHandler::DefaultWarningHandler(bool log_warnings)
    : log_warnings_(log_warnings) {
}

void DefaultWarningHandler::handleWarning(const std::string& message,
                                          const std::string& context) {
    if (!log_warnings_) {
        return;
    }
    if (context.empty()) {
        EXCELSTREAM_LOG_WARN("{}", message);
    } else {
        EXCELSTREAM_LOG_WARN("[ctx:{}] {}", context, message);
    }
}

ErrorManager::ErrorManager()
    : warning_handler_(std::make_unique<DefaultWarningHandler>()) {
}

ErrorManager& ErrorManager::getInstance() {
    static ErrorManager instance;
    return instance;
}

void ErrorManager::setWarningHandler(std::unique_ptr<WarningHandler> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handler) {
        warning_handler_ = std::move(handler);
    } else {
        warning_handler_ = std::make_unique<DefaultWarningHandler>();
    }
}

void ErrorManager::handleWarning(const std::string& message, const std::string& context) {
    std::lock_guard<std::mutex> lock(mutex_);

    stats_.total_warnings++;
    warning_handler_->handleWarning(message, context);
}

ErrorManager::Statistics ErrorManager::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void ErrorManager::resetStatistics() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = {};
}

} // namespace core
} // namespace excelstream
