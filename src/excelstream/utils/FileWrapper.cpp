#include "FileWrapper.hpp"
#include "excelstream/core/Constants.hpp"
#include "excelstream/utils/Logger.hpp"
#include <random>
#include <chrono>
#include <filesystem>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

namespace excelstream {
namespace utils {

namespace {

std::string lastErrnoMessage() {
    return std::strerror(errno);
}

} // anonymous namespace

core::Result<FileWrapper> FileWrapper::open(const std::string& filename, const char* mode) {
    errno = 0;
    FILE* raw_file = std::fopen(filename.c_str(), mode);
    if (!raw_file) {
        const int saved_errno = errno;
        const bool for_read = mode && mode[0] == 'r';
        core::Error error(for_read ? core::ErrorCode::FileNotFound : core::ErrorCode::FileCreateError,
                          fmt::format("Failed to open file: {}", lastErrnoMessage()),
                          filename);
        // 调用方需要根据 errno 区分 EEXIST
        errno = saved_errno;
        return error;
    }
    return FileWrapper(raw_file);
}

core::VoidResult FileWrapper::write(std::string_view data) {
    if (!file_) {
        return core::makeError(core::ErrorCode::FileWriteError, "File is not open");
    }
    if (data.empty()) {
        return {};
    }
    size_t written = std::fwrite(data.data(), 1, data.size(), file_.get());
    if (written != data.size()) {
        return core::makeError(core::ErrorCode::FileWriteError,
                               fmt::format("Short write: {} of {} bytes", written, data.size()));
    }
    return {};
}

core::Result<std::string> FileWrapper::readAll() {
    if (!file_) {
        return core::makeError(core::ErrorCode::FileReadError, "File is not open");
    }
    std::string content;
    char chunk[core::Constants::kIOBufferSize];
    size_t n = 0;
    while ((n = std::fread(chunk, 1, sizeof(chunk), file_.get())) > 0) {
        content.append(chunk, n);
    }
    if (std::ferror(file_.get())) {
        return core::makeError(core::ErrorCode::FileReadError,
                               fmt::format("Read failed after {} bytes", content.size()));
    }
    return content;
}

core::VoidResult FileWrapper::close() {
    if (!file_) {
        return {};
    }
    FILE* raw = file_.release();
    if (std::fclose(raw) != 0) {
        return core::makeError(core::ErrorCode::FileWriteError,
                               fmt::format("Failed to close file: {}", lastErrnoMessage()));
    }
    return {};
}

TempFileWrapper::TempFileWrapper(std::string path, FileWrapper file)
    : temp_path_(std::move(path))
    , file_(std::move(file))
    , should_delete_(true) {
}

core::Result<TempFileWrapper> TempFileWrapper::create(const std::string& directory,
                                                      const std::string& prefix) {
    std::error_code ec;
    std::filesystem::path temp_dir = directory.empty()
        ? std::filesystem::temp_directory_path(ec)
        : std::filesystem::path(directory);
    if (ec) {
        return core::makeError(core::ErrorCode::FileCreateError,
                               fmt::format("No temporary directory available: {}", ec.message()));
    }

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(100000, 999999);

    // 名称冲突时换一个随机后缀重试，"x" 模式保证独占创建
    constexpr int kMaxAttempts = 16;
    core::Error last_error(core::ErrorCode::FileCreateError);
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        auto now = std::chrono::system_clock::now();
        auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
        std::string filename = fmt::format("{}{}_{}", prefix, timestamp, dis(gen));
        std::string path = (temp_dir / filename).string();

        auto file = FileWrapper::open(path, "wbx");
        if (file) {
            EXCELSTREAM_LOG_DEBUG("Created temporary file: {}", path);
            return TempFileWrapper(std::move(path), std::move(file).value());
        }
        last_error = std::move(file).error();
        if (errno != EEXIST) {
            break;
        }
    }
    return last_error;
}

TempFileWrapper::~TempFileWrapper() {
    removeQuietly();
}

TempFileWrapper::TempFileWrapper(TempFileWrapper&& other) noexcept
    : temp_path_(std::move(other.temp_path_))
    , file_(std::move(other.file_))
    , should_delete_(other.should_delete_) {
    other.should_delete_ = false; // 转移所有权
}

TempFileWrapper& TempFileWrapper::operator=(TempFileWrapper&& other) noexcept {
    if (this != &other) {
        removeQuietly();

        temp_path_ = std::move(other.temp_path_);
        file_ = std::move(other.file_);
        should_delete_ = other.should_delete_;
        other.should_delete_ = false;
    }
    return *this;
}

core::VoidResult TempFileWrapper::append(std::string_view data) {
    auto result = file_.write(data);
    if (!result) {
        return core::makeError(result.error().code, result.error().message, temp_path_);
    }
    return {};
}

core::Result<std::string> TempFileWrapper::readBack() {
    auto closed = file_.close();
    if (!closed) {
        return core::makeError(closed.error().code, closed.error().message, temp_path_);
    }

    auto reader = FileWrapper::open(temp_path_, "rb");
    if (!reader) {
        return core::makeError(core::ErrorCode::FileReadError, reader.error().message, temp_path_);
    }
    auto content = reader.value().readAll();
    if (!content) {
        return core::makeError(content.error().code, content.error().message, temp_path_);
    }
    auto reader_closed = reader.value().close();
    if (!reader_closed) {
        return core::makeError(core::ErrorCode::FileReadError, reader_closed.error().message, temp_path_);
    }
    return content;
}

core::VoidResult TempFileWrapper::remove() {
    file_.reset();
    if (!should_delete_ || temp_path_.empty()) {
        return {};
    }
    should_delete_ = false;

    std::error_code ec;
    if (!std::filesystem::remove(temp_path_, ec) && ec) {
        return core::makeError(core::ErrorCode::FileDeleteError,
                               fmt::format("Failed to delete temporary file: {}", ec.message()),
                               temp_path_);
    }
    EXCELSTREAM_LOG_DEBUG("Deleted temporary file: {}", temp_path_);
    return {};
}

void TempFileWrapper::removeQuietly() noexcept {
    file_.reset();
    if (should_delete_ && !temp_path_.empty()) {
        std::error_code ec;
        std::filesystem::remove(temp_path_, ec);
        if (ec) {
            EXCELSTREAM_LOG_WARN("Failed to delete temporary file {}: {}", temp_path_, ec.message());
        }
        should_delete_ = false;
    }
}

} // namespace utils
} // namespace excelstream
