#pragma once

#include "excelstream/core/Constants.hpp"
#include "excelstream/core/Expected.hpp"
#include "excelstream/utils/FileWrapper.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace excelstream {
namespace core {

/**
 * @brief 行数据缓冲区，超过阈值后迁移到临时文件
 *
 * 内存缓冲与临时文件共同保存完整的行数据：
 * 任意时刻 payload == 文件内容 ++ 内存缓冲，不丢失也不重复。
 *
 * 临时文件在第一次达到阈值时才创建，之后整个会话复用同一个文件。
 * 创建或写入失败时不向调用方报错，而是保留内存缓冲并进入降级状态。
 */
class SpillBuffer {
public:
    /**
     * @param threshold 迁移阈值（字节）
     * @param temp_dir 临时文件目录，为空时使用系统临时目录
     * @param temp_prefix 临时文件名前缀
     */
    explicit SpillBuffer(size_t threshold = Constants::kSpillThreshold,
                         std::string temp_dir = {},
                         std::string temp_prefix = "excelstream-");

    SpillBuffer(const SpillBuffer&) = delete;
    SpillBuffer& operator=(const SpillBuffer&) = delete;

    SpillBuffer(SpillBuffer&&) noexcept = default;
    SpillBuffer& operator=(SpillBuffer&&) noexcept = default;

    void append(std::string_view data) { buffer_.append(data); }

    /**
     * @brief 在完整的行之间调用：缓冲区达到阈值时迁移到临时文件
     *
     * 从不失败；迁移失败时记录警告并保留内存数据。
     */
    void maybeSpill();

    /**
     * @brief 取出完整的 payload（文件内容 ++ 内存缓冲）并删除临时文件
     *
     * 读取失败时返回错误，临时文件仍会被删除。
     */
    Result<std::string> takePayload();

    size_t size() const noexcept { return buffer_.size(); }
    size_t threshold() const noexcept { return threshold_; }
    size_t spilledBytes() const noexcept { return spilled_bytes_; }

    bool hasSpillFile() const noexcept { return spill_file_.has_value(); }
    std::string spillPath() const { return spill_file_ ? spill_file_->getPath() : std::string(); }

    /**
     * @brief 是否因临时文件不可用而退回纯内存模式
     */
    bool isDegraded() const noexcept { return degraded_; }

private:
    void degrade(const Error& error);

    std::string buffer_;
    size_t threshold_;
    std::string temp_dir_;
    std::string temp_prefix_;

    std::optional<utils::TempFileWrapper> spill_file_;
    size_t spilled_bytes_ = 0;
    bool degraded_ = false;
};

}} // namespace excelstream::core
