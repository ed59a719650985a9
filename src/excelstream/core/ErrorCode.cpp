#include "excelstream/core/ErrorCode.hpp"

namespace excelstream {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::OutOfMemory:
            return "Out of memory";
        case ErrorCode::InternalError:
            return "Internal error";

        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileCreateError:
            return "File create error";
        case ErrorCode::FileWriteError:
            return "File write error";
        case ErrorCode::FileReadError:
            return "File read error";
        case ErrorCode::FileDeleteError:
            return "File delete error";

        case ErrorCode::InvalidWorkbook:
            return "Invalid workbook";
        case ErrorCode::InvalidWorksheet:
            return "Invalid worksheet";
        case ErrorCode::InvalidCellReference:
            return "Invalid cell reference";
        case ErrorCode::TimeOutOfRange:
            return "Time value out of range";

        case ErrorCode::XmlSerializeError:
            return "XML serialize error";

        case ErrorCode::StreamFinalized:
            return "Stream already finalized";
        case ErrorCode::SheetLocked:
            return "Worksheet is locked by another stream";
    }
    return "Unknown error";
}

}} // namespace excelstream::core
