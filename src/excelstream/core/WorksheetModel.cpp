#include "WorksheetModel.hpp"
#include "excelstream/core/Constants.hpp"
#include "excelstream/utils/AddressParser.hpp"
#include <fmt/format.h>
#include <cctype>

namespace excelstream {
namespace core {

namespace {

VoidResult validateRange(int first_row, int first_col, int last_row, int last_col) {
    if (first_row < 0 || first_col < 0 ||
        last_row >= Constants::kMaxRows || last_col >= Constants::kMaxColumns) {
        return makeError(ErrorCode::InvalidCellReference,
                         fmt::format("range ({},{})-({},{}) is outside the worksheet",
                                     first_row, first_col, last_row, last_col));
    }
    if (first_row > last_row || first_col > last_col) {
        return makeError(ErrorCode::InvalidArgument,
                         fmt::format("range ({},{})-({},{}) is reversed",
                                     first_row, first_col, last_row, last_col));
    }
    return {};
}

bool isFourHex(const std::string& s) {
    if (s.size() != 4) return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // anonymous namespace

WorksheetModel::WorksheetModel(std::string name)
    : name_(std::move(name)) {
}

VoidResult WorksheetModel::setDimension(int first_row, int first_col, int last_row, int last_col) {
    auto valid = validateRange(first_row, first_col, last_row, last_col);
    if (!valid) {
        return valid;
    }

    std::string ref = utils::AddressParser::indexToAddress(first_row, first_col);
    if (first_row != last_row || first_col != last_col) {
        ref += ':';
        ref += utils::AddressParser::indexToAddress(last_row, last_col);
    }
    dimension_ = std::move(ref);
    return {};
}

VoidResult WorksheetModel::freezePanes(int rows, int cols) {
    if (rows < 0 || cols < 0 || rows >= Constants::kMaxRows || cols >= Constants::kMaxColumns) {
        return makeError(ErrorCode::InvalidArgument,
                         fmt::format("invalid freeze position {} rows, {} cols", rows, cols));
    }
    sheet_view_.freeze = FreezePanes(rows, cols);
    return {};
}

VoidResult WorksheetModel::setColumnInfo(int col, const ColumnInfo& info) {
    if (col < 0 || col >= Constants::kMaxColumns) {
        return makeError(ErrorCode::InvalidArgument, fmt::format("column index {} out of range", col));
    }
    column_info_[col] = info;
    return {};
}

VoidResult WorksheetModel::setColumnWidth(int col, double width) {
    if (width < 0 || width > 255) {
        return makeError(ErrorCode::InvalidArgument, fmt::format("column width {} out of range", width));
    }
    ColumnInfo info;
    auto it = column_info_.find(col);
    if (it != column_info_.end()) {
        info = it->second;
    }
    info.width = width;
    return setColumnInfo(col, info);
}

VoidResult WorksheetModel::protect(const std::string& password_hash) {
    if (!password_hash.empty() && !isFourHex(password_hash)) {
        return makeError(ErrorCode::InvalidArgument,
                         "password hash must be four hexadecimal digits");
    }
    protection_.enabled = true;
    protection_.password_hash = password_hash;
    for (auto& ch : protection_.password_hash) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return {};
}

VoidResult WorksheetModel::setAutoFilter(int first_row, int first_col, int last_row, int last_col) {
    auto valid = validateRange(first_row, first_col, last_row, last_col);
    if (!valid) {
        return valid;
    }
    auto_filter_ = AutoFilterRange(first_row, first_col, last_row, last_col);
    return {};
}

VoidResult WorksheetModel::mergeCells(int first_row, int first_col, int last_row, int last_col) {
    auto valid = validateRange(first_row, first_col, last_row, last_col);
    if (!valid) {
        return valid;
    }
    if (first_row == last_row && first_col == last_col) {
        return makeError(ErrorCode::InvalidArgument, "a merge range needs at least two cells");
    }
    for (const auto& range : merge_ranges_) {
        bool disjoint = last_row < range.first_row || first_row > range.last_row ||
                        last_col < range.first_col || first_col > range.last_col;
        if (!disjoint) {
            return makeError(ErrorCode::InvalidArgument, "merge range overlaps an existing merged range");
        }
    }
    merge_ranges_.emplace_back(first_row, first_col, last_row, last_col);
    return {};
}

}} // namespace excelstream::core
