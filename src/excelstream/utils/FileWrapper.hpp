/**
 * @file FileWrapper.hpp
 * @brief RAII文件句柄包装器，溢出临时文件的生命周期管理
 */

#pragma once

#include <memory>
#include <cstdio>
#include <string>
#include <string_view>
#include "excelstream/core/Expected.hpp"

namespace excelstream {
namespace utils {

/**
 * @brief RAII文件句柄包装器
 *
 * 析构时自动关闭文件句柄；所有可能失败的操作返回 Result。
 */
class FileWrapper {
public:
    FileWrapper() = default;

    /**
     * @brief 从已有FILE*构造，接管所有权
     */
    explicit FileWrapper(FILE* file) {
        reset(file);
    }

    /**
     * @brief 打开文件
     * @return 打开失败时返回 FileNotFound（读）或 FileCreateError（写）
     */
    static core::Result<FileWrapper> open(const std::string& filename, const char* mode);

    FileWrapper(FileWrapper&& other) noexcept = default;
    FileWrapper& operator=(FileWrapper&& other) noexcept = default;

    FileWrapper(const FileWrapper&) = delete;
    FileWrapper& operator=(const FileWrapper&) = delete;

    FILE* get() const noexcept {
        return file_.get();
    }

    explicit operator bool() const noexcept {
        return file_ != nullptr;
    }

    /**
     * @brief 写入全部数据
     */
    core::VoidResult write(std::string_view data);

    /**
     * @brief 读取剩余全部内容
     */
    core::Result<std::string> readAll();

    /**
     * @brief 显式关闭，报告 fclose 的失败（析构时的关闭不报告）
     */
    core::VoidResult close();

    void reset(FILE* file = nullptr) {
        file_.reset(file);
        if (file) {
            file_.get_deleter() = &fclose;
        }
    }

private:
    std::unique_ptr<FILE, int(*)(FILE*)> file_{nullptr, &fclose};
};

/**
 * @brief 临时文件包装器
 *
 * 在析构时自动关闭并删除临时文件，保证所有退出路径上都不会遗留文件。
 */
class TempFileWrapper {
public:
    /**
     * @brief 在指定目录中独占创建临时文件（以写方式打开）
     * @param directory 目录，为空时使用系统临时目录
     * @param prefix 文件名前缀
     * @return 创建失败时返回 FileCreateError
     */
    static core::Result<TempFileWrapper> create(const std::string& directory,
                                                const std::string& prefix);

    ~TempFileWrapper();

    TempFileWrapper(const TempFileWrapper&) = delete;
    TempFileWrapper& operator=(const TempFileWrapper&) = delete;

    TempFileWrapper(TempFileWrapper&& other) noexcept;
    TempFileWrapper& operator=(TempFileWrapper&& other) noexcept;

    /**
     * @brief 追加写入
     */
    core::VoidResult append(std::string_view data);

    /**
     * @brief 关闭写句柄，重新以读方式打开并读出全部内容，然后关闭
     */
    core::Result<std::string> readBack();

    /**
     * @brief 删除文件；之后析构不再重复删除
     */
    core::VoidResult remove();

    FileWrapper& getFile() { return file_; }
    const FileWrapper& getFile() const { return file_; }

    const std::string& getPath() const { return temp_path_; }

private:
    TempFileWrapper(std::string path, FileWrapper file);

    void removeQuietly() noexcept;

    std::string temp_path_;
    FileWrapper file_;
    bool should_delete_ = true;
};

} // namespace utils
} // namespace excelstream
