#pragma once

#include "excelstream/core/WorkbookTypes.hpp"
#include "excelstream/core/WorksheetModel.hpp"
#include "excelstream/core/Expected.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace excelstream {
namespace core {

class StreamWriter;

/**
 * @brief 工作簿：工作表登记、文档部件注册表与流式会话入口
 *
 * 工作表 id 从 1 开始，等于其在工作簿中的位置，对应部件
 * xl/worksheets/sheet{id}.xml。
 *
 * 由 newStreamWriter() 创建的会话引用本工作簿。工作簿先于会话销毁时，
 * 会话被解除关联，之后的 setRow()/flush() 返回 InvalidWorkbook。
 */
class Workbook {
public:
    static std::unique_ptr<Workbook> create(const WorkbookOptions& options = WorkbookOptions());

    explicit Workbook(const WorkbookOptions& options = WorkbookOptions());
    ~Workbook();

    Workbook(const Workbook&) = delete;
    Workbook& operator=(const Workbook&) = delete;

    // ========== 工作表管理 ==========

    /**
     * @brief 添加工作表
     * @return 新工作表的 id；名称为空、过长、含非法字符或重名时返回 InvalidArgument
     */
    Result<int> addSheet(const std::string& name);

    /**
     * @brief 按名称查找工作表 id（不区分大小写）
     * @return 工作表 id，不存在时返回 0
     */
    int getSheetIndex(const std::string& name) const;

    size_t getSheetCount() const { return worksheets_.size(); }
    std::vector<std::string> getSheetNames() const;

    /**
     * @brief 获取工作表文档模型
     * @return 不存在时返回 InvalidWorksheet
     */
    Result<WorksheetModel*> getWorksheetModel(int sheet_id);
    Result<WorksheetModel*> getWorksheetModel(const std::string& name);

    // ========== 部件注册表 ==========

    static std::string sheetPartPath(int sheet_id);

    void setPart(const std::string& path, std::string bytes);
    const std::string* getPart(const std::string& path) const;
    bool hasPart(const std::string& path) const;
    const std::map<std::string, std::string>& getParts() const { return parts_; }

    /**
     * @brief 把尚未登记的工作表按其文档模型序列化进注册表
     *
     * 已由流式会话写入的部件保持不变。
     */
    VoidResult writeSheetParts();

    // ========== 已渲染工作表缓存 ==========

    /**
     * @brief 渲染工作表（带缓存）
     */
    Result<const std::string*> renderSheet(int sheet_id);

    bool isSheetCached(const std::string& path) const;
    bool isSheetChecked(const std::string& path) const;

    /**
     * @brief 丢弃某个工作表部件的缓存副本与校验标记
     */
    void evictSheetCache(const std::string& path);

    // ========== 流式写入 ==========

    /**
     * @brief 为工作表创建流式写入会话
     * @return 工作表不存在时返回 InvalidWorksheet，已有会话未结束时返回 SheetLocked
     */
    Result<std::unique_ptr<StreamWriter>> newStreamWriter(const std::string& sheet);
    Result<std::unique_ptr<StreamWriter>> newStreamWriter(const std::string& sheet,
                                                          const StreamWriterOptions& options);

    bool isSheetLocked(int sheet_id) const { return open_writers_.count(sheet_id) > 0; }

    const WorkbookOptions& getOptions() const { return options_; }
    WorkbookOptions& getOptions() { return options_; }

private:
    friend class StreamWriter;

    void releaseSheetLease(int sheet_id);

    static VoidResult validateSheetName(const std::string& name);

    WorkbookOptions options_;
    std::vector<std::unique_ptr<WorksheetModel>> worksheets_;

    std::map<std::string, std::string> parts_;          // 部件路径 -> 序列化内容
    std::map<std::string, std::string> rendered_cache_; // 部件路径 -> 已渲染的工作表
    std::set<std::string> checked_;                     // 已校验过的部件路径
    std::map<int, StreamWriter*> open_writers_;        // 工作表 id -> 持有租约的会话
};

}} // namespace excelstream::core
