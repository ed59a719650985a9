#include "StreamWriter.hpp"
#include "excelstream/core/Constants.hpp"
#include "excelstream/core/ExceptionBridge.hpp"
#include "excelstream/utils/AddressParser.hpp"
#include "excelstream/utils/ModuleLoggers.hpp"
#include "excelstream/xml/CellEncoder.hpp"
#include "excelstream/xml/WorksheetXMLGenerator.hpp"
#include <fmt/format.h>

namespace excelstream {
namespace core {

namespace {

constexpr const char* kSheetDataOpen = "<sheetData>";
constexpr const char* kSheetDataClose = "</sheetData>";

} // anonymous namespace

StreamWriter::StreamWriter(Workbook* workbook, std::string sheet_name, int sheet_id,
                           const StreamWriterOptions& options)
    : workbook_(workbook)
    , sheet_name_(std::move(sheet_name))
    , sheet_id_(sheet_id)
    , options_(options)
    , buffer_(options.spill_threshold, options.temp_dir, options.temp_prefix) {
    buffer_.append(kSheetDataOpen);
    STREAM_DEBUG("Stream writer opened for sheet '{}' (sheet{}), spill threshold {} bytes",
                 sheet_name_, sheet_id_, options_.spill_threshold);
}

StreamWriter::~StreamWriter() {
    if (state_ == State::Open) {
        STREAM_WARN("Stream writer for sheet '{}' destroyed without flush, {} rows discarded",
                    sheet_name_, row_count_);
    }
    releaseLease();
}

VoidResult StreamWriter::setRow(const std::string& axis, const std::vector<CellValue>& values,
                                const std::vector<int>& styles) {
    if (state_ == State::Finalized) {
        return makeError(ErrorCode::StreamFinalized,
                         fmt::format("stream writer for sheet {} is already flushed", sheet_name_));
    }

    auto position = utils::AddressParser::tryParseAddress(axis);
    if (!position) {
        return std::move(position).error();
    }
    return writeRow(position.value().first, position.value().second, values, styles);
}

VoidResult StreamWriter::setRow(const std::string& axis, std::initializer_list<CellValue> values,
                                const std::vector<int>& styles) {
    return setRow(axis, std::vector<CellValue>(values), styles);
}

VoidResult StreamWriter::setRow(int row, int col, const std::vector<CellValue>& values,
                                const std::vector<int>& styles) {
    if (state_ == State::Finalized) {
        return makeError(ErrorCode::StreamFinalized,
                         fmt::format("stream writer for sheet {} is already flushed", sheet_name_));
    }
    if (row < 0 || row >= Constants::kMaxRows || col < 0 || col >= Constants::kMaxColumns) {
        return makeError(ErrorCode::InvalidCellReference,
                         fmt::format("cell ({}, {}) is outside the worksheet", row, col));
    }
    return writeRow(row, col, values, styles);
}

VoidResult StreamWriter::writeRow(int row, int col, const std::vector<CellValue>& values,
                                  const std::vector<int>& styles) {
    auto attached = checkAttached();
    if (!attached) {
        return attached;
    }
    if (!styles.empty() && styles.size() != values.size()) {
        return makeError(ErrorCode::InvalidArgument, "incorrect number of styles for this row",
                         fmt::format("{} styles for {} values", styles.size(), values.size()));
    }
    if (options_.check_row_order && row < last_row_) {
        return makeError(ErrorCode::InvalidArgument,
                         fmt::format("row {} submitted after row {}", row + 1, last_row_ + 1));
    }
    if (values.size() > static_cast<size_t>(Constants::kMaxColumns - col)) {
        return makeError(ErrorCode::InvalidCellReference,
                         fmt::format("row {} with {} values starting at column {} exceeds column limit",
                                     row + 1, values.size(), col + 1));
    }

    auto built = ExceptionBridge::wrapVoidCall([&]() -> VoidResult {
        row_writer_.clear();
        row_writer_.startElement("row");
        row_writer_.writeAttribute("r", row + 1);

        for (size_t i = 0; i < values.size(); ++i) {
            auto coordinate = utils::AddressParser::tryIndexToAddress(row, col + static_cast<int>(i));
            if (!coordinate) {
                return std::move(coordinate).error();
            }
            const int style = styles.empty() ? 0 : styles[i];
            auto cell = xml::CellEncoder::writeCell(row_writer_, coordinate.value(), style, values[i]);
            if (!cell) {
                return cell;
            }
        }

        row_writer_.endElement(); // row
        return {};
    });

    if (!built) {
        row_writer_.clear();
        EXCELSTREAM_LOG_ROW_TRACE("Row {} of sheet '{}' rejected: {}",
                                  row + 1, sheet_name_, built.error().fullMessage());
        return built;
    }

    buffer_.append(row_writer_.toString());
    row_writer_.clear();
    last_row_ = row;
    ++row_count_;
    EXCELSTREAM_LOG_ROW_TRACE("Row {} of sheet '{}' appended, buffer {} bytes",
                              row + 1, sheet_name_, buffer_.size());

    buffer_.maybeSpill();
    return {};
}

VoidResult StreamWriter::flush() {
    if (state_ == State::Finalized) {
        return makeError(ErrorCode::StreamFinalized,
                         fmt::format("stream writer for sheet {} is already flushed", sheet_name_));
    }

    // 结束标签已写出，之后无论成败都不能再追加行
    state_ = State::Finalized;
    auto result = finalize();
    releaseLease();

    if (!result) {
        STREAM_ERROR("Failed to finalize sheet '{}': {}", sheet_name_, result.error().fullMessage());
    } else {
        STREAM_DEBUG("Sheet '{}' finalized: {} rows{}", sheet_name_, row_count_,
                     buffer_.isDegraded() ? " (spill storage was unavailable)" : "");
    }
    return result;
}

VoidResult StreamWriter::finalize() {
    buffer_.append(kSheetDataClose);

    auto attached = checkAttached();
    if (!attached) {
        // 工作簿已不存在，溢出文件随缓冲区一并释放
        auto discarded = buffer_.takePayload();
        if (!discarded) {
            STREAM_WARN("Discarding spill data of sheet '{}' failed: {}",
                        sheet_name_, discarded.error().fullMessage());
        }
        return attached;
    }

    auto model = workbook_->getWorksheetModel(sheet_id_);
    if (!model) {
        return std::move(model).error();
    }

    const std::string part_path = Workbook::sheetPartPath(sheet_id_);
    workbook_->evictSheetCache(part_path);

    auto payload = buffer_.takePayload();
    if (!payload) {
        return std::move(payload).error();
    }

    auto document = xml::WorksheetXMLGenerator(*model.value()).reconstruct(payload.value());
    if (!document) {
        return std::move(document).error();
    }

    workbook_->setPart(part_path, std::move(document).value());
    return {};
}

void StreamWriter::releaseLease() {
    if (lease_held_ && workbook_ != nullptr) {
        workbook_->releaseSheetLease(sheet_id_);
    }
    lease_held_ = false;
}

void StreamWriter::detachWorkbook() noexcept {
    workbook_ = nullptr;
    lease_held_ = false;
}

VoidResult StreamWriter::checkAttached() const {
    if (workbook_ == nullptr) {
        return makeError(ErrorCode::InvalidWorkbook,
                         fmt::format("workbook of sheet {} was destroyed before the stream writer", sheet_name_));
    }
    return {};
}

}} // namespace excelstream::core
