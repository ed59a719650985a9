#include "CellValue.hpp"

namespace excelstream {
namespace core {

const char* CellValue::typeName(CellValueType type) noexcept {
    switch (type) {
        case CellValueType::Null:      return "null";
        case CellValueType::Integer:   return "integer";
        case CellValueType::Unsigned:  return "unsigned";
        case CellValueType::Float32:   return "float";
        case CellValueType::Float64:   return "double";
        case CellValueType::String:    return "string";
        case CellValueType::Bytes:     return "bytes";
        case CellValueType::Duration:  return "duration";
        case CellValueType::Timestamp: return "timestamp";
        case CellValueType::Boolean:   return "boolean";
    }
    return "unknown";
}

} // namespace core
} // namespace excelstream
