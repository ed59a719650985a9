#pragma once

#include "excelstream/core/CellValue.hpp"
#include "excelstream/core/Expected.hpp"
#include "excelstream/core/SpillBuffer.hpp"
#include "excelstream/core/Workbook.hpp"
#include "excelstream/core/WorkbookTypes.hpp"
#include "excelstream/xml/XMLStreamWriter.hpp"
#include <initializer_list>
#include <string>
#include <vector>

namespace excelstream {
namespace core {

/**
 * @brief 工作表流式写入会话
 *
 * 行数据直接编码为 <row> 片段追加到 SpillBuffer，不构建单元格对象图。
 * flush() 把 payload 拼接进工作表文档模型的 sheetData 位置，
 * 结果写入工作簿部件注册表 xl/worksheets/sheet{id}.xml。
 *
 * 状态 Open -> Finalized；结束后 setRow() / flush() 返回 StreamFinalized。
 * 会话持有工作表的独占租约，flush() 或析构时释放。
 *
 * @example
 * auto writer = workbook->newStreamWriter("Sheet1");
 * if (writer) {
 *     writer.value()->setRow("A1", {"Name", "Score"});
 *     writer.value()->setRow("A2", {"Alice", 95.5});
 *     writer.value()->flush();
 * }
 */
class StreamWriter {
public:
    enum class State {
        Open,
        Finalized
    };

    ~StreamWriter();

    StreamWriter(const StreamWriter&) = delete;
    StreamWriter& operator=(const StreamWriter&) = delete;

    /**
     * @brief 写入一行
     * @param axis 起始单元格，例如 "B3"
     * @param values 单元格值，依次写入 axis 所在行的连续列
     * @param styles 样式索引，为空时全部为 0；非空时长度必须与 values 相同
     *
     * 失败时缓冲区保持调用前的状态。
     */
    VoidResult setRow(const std::string& axis, const std::vector<CellValue>& values,
                      const std::vector<int>& styles = {});

    VoidResult setRow(const std::string& axis, std::initializer_list<CellValue> values,
                      const std::vector<int>& styles = {});

    /**
     * @brief 以 0 基行列索引指定起始单元格
     */
    VoidResult setRow(int row, int col, const std::vector<CellValue>& values,
                      const std::vector<int>& styles = {});

    /**
     * @brief 结束会话并把重建的工作表写入部件注册表
     *
     * 无论成功与否，调用后会话都进入 Finalized 状态，临时文件被删除。
     */
    VoidResult flush();

    State getState() const noexcept { return state_; }
    bool isFinalized() const noexcept { return state_ == State::Finalized; }

    const std::string& getSheetName() const { return sheet_name_; }
    int getSheetId() const noexcept { return sheet_id_; }
    const StreamWriterOptions& getOptions() const { return options_; }

    size_t getRowCount() const noexcept { return row_count_; }
    size_t getBufferedBytes() const noexcept { return buffer_.size(); }
    size_t getSpilledBytes() const noexcept { return buffer_.spilledBytes(); }
    bool hasSpillFile() const noexcept { return buffer_.hasSpillFile(); }
    std::string getSpillPath() const { return buffer_.spillPath(); }
    bool isDegraded() const noexcept { return buffer_.isDegraded(); }

private:
    friend class Workbook;

    StreamWriter(Workbook* workbook, std::string sheet_name, int sheet_id,
                 const StreamWriterOptions& options);

    /// 工作簿析构时调用，之后会话不再访问工作簿
    void detachWorkbook() noexcept;
    VoidResult checkAttached() const;

    VoidResult writeRow(int row, int col, const std::vector<CellValue>& values,
                        const std::vector<int>& styles);
    VoidResult finalize();
    void releaseLease();

    Workbook* workbook_;
    std::string sheet_name_;
    int sheet_id_;
    StreamWriterOptions options_;

    SpillBuffer buffer_;
    xml::XMLStreamWriter row_writer_;
    State state_ = State::Open;
    bool lease_held_ = true;

    int last_row_ = -1;
    size_t row_count_ = 0;
};

}} // namespace excelstream::core
