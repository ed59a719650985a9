#pragma once

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>
#include <fmt/chrono.h>

#ifdef ERROR
#undef ERROR
#endif

namespace excelstream {

/**
 * @brief 全局日志器
 *
 * 控制台 + 滚动文件双通道输出，消息使用 fmt 格式化。
 * 未调用 initialize() 时首条日志会以默认参数自动初始化。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    /**
     * @brief 初始化日志器
     * @param log_file_path 日志文件路径，为空时只输出到控制台
     * @param level 最低输出等级
     * @param enable_console 是否输出到控制台
     * @param max_file_size 单个日志文件的最大字节数，超过后滚动
     * @param max_files 保留的滚动文件数
     * @param write_mode 覆盖或追加
     */
    void initialize(const std::string& log_file_path = "logs/excelstream.log",
                   Level level = Level::INFO,
                   bool enable_console = true,
                   size_t max_file_size = 10 * 1024 * 1024,
                   size_t max_files = 5,
                   WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    bool isEnabled(Level level) const { return should_log(level); }

    void log(Level level, const std::string& message);

    template<typename... Args>
    inline void logf(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        try {
            log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
        } catch (const fmt::format_error&) {
            // 格式串与参数不匹配时退化为输出原始格式串
            log(level, fmt_str);
        }
    }

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx = fmt::format("[{}:{}:{}] {}", baseFilename(file), line, extractFunctionName(func), fmt_str);
        logf(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 提取文件名（去除路径）
    static inline const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    // 提取函数名（去除命名空间和参数）
    static inline std::string extractFunctionName(const char* func_sig) {
        if (!func_sig) return "";
        std::string sig(func_sig);
        size_t lastColon = sig.rfind("::");
        if (lastColon != std::string::npos) {
            sig = sig.substr(lastColon + 2);
        }
        size_t paren = sig.find('(');
        if (paren != std::string::npos) {
            sig = sig.substr(0, paren);
        }
        return sig;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define EXCELSTREAM_FUNC __FUNCTION__
#else
#  define EXCELSTREAM_FUNC __func__
#endif

// 统一日志宏（带源码位置信息）
#define EXCELSTREAM_LOG_AT(level, fmt, ...) \
    excelstream::Logger::getInstance().logCtx(level, __FILE__, __LINE__, EXCELSTREAM_FUNC, fmt, ##__VA_ARGS__)

#define EXCELSTREAM_LOG_TRACE(fmt, ...)    EXCELSTREAM_LOG_AT(excelstream::Logger::Level::TRACE, fmt, ##__VA_ARGS__)
#define EXCELSTREAM_LOG_DEBUG(fmt, ...)    EXCELSTREAM_LOG_AT(excelstream::Logger::Level::DEBUG, fmt, ##__VA_ARGS__)
#define EXCELSTREAM_LOG_INFO(fmt, ...)     EXCELSTREAM_LOG_AT(excelstream::Logger::Level::INFO, fmt, ##__VA_ARGS__)
#define EXCELSTREAM_LOG_WARN(fmt, ...)     EXCELSTREAM_LOG_AT(excelstream::Logger::Level::WARN, fmt, ##__VA_ARGS__)
#define EXCELSTREAM_LOG_ERROR(fmt, ...)    EXCELSTREAM_LOG_AT(excelstream::Logger::Level::ERROR, fmt, ##__VA_ARGS__)
#define EXCELSTREAM_LOG_CRITICAL(fmt, ...) EXCELSTREAM_LOG_AT(excelstream::Logger::Level::CRITICAL, fmt, ##__VA_ARGS__)

} // namespace excelstream
