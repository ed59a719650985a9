#pragma once

#include "excelstream/core/Expected.hpp"
#include <chrono>
#include <cstdint>
#include <fmt/format.h>

namespace excelstream {
namespace utils {

/**
 * @brief 时间工具类 - 把 chrono 时间量换算成 Excel 序列号
 *
 * 所有换算都按 UTC 进行，不依赖本地时区。
 */
class TimeUtils {
public:
    using Microseconds = std::chrono::microseconds;
    using Timestamp = std::chrono::time_point<std::chrono::system_clock, Microseconds>;

    static constexpr int64_t kMicrosPerDay = int64_t(86400) * 1000000;

    // 1970-01-01 在 1899-12-30 基准下的序列号
    static constexpr int64_t kUnixEpochSerial = 25569;

    // 1900-03-01 的序列号，此前的日期不受 Excel 虚构的 1900-02-29 影响
    static constexpr int64_t kFirstSerialAfterLeapBug = 61;

    // 可表示范围 [1900-01-01, 10000-01-01)，单位秒
    static constexpr int64_t kMinUnixSeconds = -2208988800LL;
    static constexpr int64_t kMaxUnixSeconds = 253402300800LL;

    /**
     * @brief 将时间点转换为Excel序列号（1900日期系统）
     *
     * 1900-03-01 及之后按距 1899-12-30 的天数计算，
     * 之前按距 1899-12-31 的天数计算，1900-01-01 对应序列号 1。
     * 时间部分作为小数部分。
     *
     * @return 序列号；超出 1900-01-01 ~ 9999-12-31 时返回 TimeOutOfRange
     */
    static core::Result<double> toExcelSerialNumber(const Timestamp& time) {
        const int64_t us = time.time_since_epoch().count();
        if (us < kMinUnixSeconds * 1000000 || us >= kMaxUnixSeconds * 1000000) {
            return core::makeError(core::ErrorCode::TimeOutOfRange,
                                   fmt::format("time {}us since epoch is outside the Excel date range "
                                               "1900-01-01 .. 9999-12-31", us));
        }

        // 向下取整的天数与当天内的微秒数
        int64_t days = us / kMicrosPerDay;
        int64_t rem = us % kMicrosPerDay;
        if (rem < 0) {
            rem += kMicrosPerDay;
            --days;
        }

        int64_t serial_day = kUnixEpochSerial + days;
        if (serial_day < kFirstSerialAfterLeapBug) {
            --serial_day;
        }
        return static_cast<double>(serial_day) + static_cast<double>(rem) / static_cast<double>(kMicrosPerDay);
    }

    /**
     * @brief 将时长转换为天数（秒数 / 86400）
     */
    template<typename Rep, typename Period>
    static double durationToExcelDays(const std::chrono::duration<Rep, Period>& duration) {
        return std::chrono::duration_cast<std::chrono::duration<double>>(duration).count() / 86400.0;
    }
};

}} // namespace excelstream::utils
