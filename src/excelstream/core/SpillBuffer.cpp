#include "SpillBuffer.hpp"
#include "excelstream/core/Exception.hpp"
#include "excelstream/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace excelstream {
namespace core {

SpillBuffer::SpillBuffer(size_t threshold, std::string temp_dir, std::string temp_prefix)
    : threshold_(threshold)
    , temp_dir_(std::move(temp_dir))
    , temp_prefix_(std::move(temp_prefix)) {
}

void SpillBuffer::maybeSpill() {
    if (buffer_.size() < threshold_ || degraded_) {
        return;
    }

    if (!spill_file_) {
        auto created = utils::TempFileWrapper::create(temp_dir_, temp_prefix_);
        if (!created) {
            degrade(created.error());
            return;
        }
        spill_file_.emplace(std::move(created).value());
        EXCELSTREAM_LOG_SPILL_DEBUG("Spill file created: {}", spill_file_->getPath());
    }

    auto written = spill_file_->append(buffer_);
    if (!written) {
        // 部分写入的内容无法确定，文件不再使用，全部数据保留在内存
        degrade(written.error());
        return;
    }

    spilled_bytes_ += buffer_.size();
    EXCELSTREAM_LOG_SPILL_DEBUG("Spilled {} bytes to {} (total {})",
                                buffer_.size(), spill_file_->getPath(), spilled_bytes_);
    buffer_.clear();
}

void SpillBuffer::degrade(const Error& error) {
    degraded_ = true;

    std::string message = fmt::format(
        "Spill storage unavailable, keeping {} bytes of row data in memory: {}",
        buffer_.size(), error.fullMessage());
    STREAM_WARN("{}", message);
    EXCELSTREAM_HANDLE_WARNING(message, "SpillBuffer");

    if (spill_file_ && spilled_bytes_ == 0) {
        // 文件中尚无完整数据，直接丢弃
        spill_file_.reset();
    }
}

Result<std::string> SpillBuffer::takePayload() {
    std::string payload;

    if (spill_file_) {
        auto content = spill_file_->readBack();
        auto removed = spill_file_->remove();
        spill_file_.reset();

        if (!content) {
            STREAM_ERROR("Failed to read back spill file: {}", content.error().fullMessage());
            return std::move(content).error();
        }
        if (!removed) {
            STREAM_ERROR("Failed to delete spill file: {}", removed.error().fullMessage());
            return std::move(removed).error();
        }
        payload = std::move(content).value();
        if (payload.size() < spilled_bytes_) {
            return makeError(ErrorCode::FileReadError,
                             fmt::format("Spill file truncated: expected {} bytes, read {}",
                                         spilled_bytes_, payload.size()));
        }
        // 降级前失败的那次追加可能留下不完整的尾部
        payload.resize(spilled_bytes_);
    }

    payload.append(buffer_);
    buffer_.clear();
    buffer_.shrink_to_fit();
    spilled_bytes_ = 0;
    return payload;
}

}} // namespace excelstream::core
