#include <gtest/gtest.h>
#include "excelstream/utils/TimeUtils.hpp"
#include <chrono>
#include <cstdint>

using namespace excelstream;
using excelstream::utils::TimeUtils;

namespace {

// 公历日期到 1970-01-01 的天数
int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

TimeUtils::Timestamp utcTime(int y, unsigned m, unsigned d, int hh = 0, int mm = 0, int ss = 0) {
    const int64_t seconds = daysFromCivil(y, m, d) * 86400 + hh * 3600 + mm * 60 + ss;
    return TimeUtils::Timestamp(std::chrono::microseconds(seconds * 1000000));
}

double serial(const TimeUtils::Timestamp& t) {
    auto result = TimeUtils::toExcelSerialNumber(t);
    EXPECT_TRUE(result) << (result ? "" : result.error().message);
    return result ? result.value() : -1.0;
}

} // anonymous namespace

// 测试1: 常见日期
TEST(TimeUtilsTest, KnownSerialNumbers) {
    EXPECT_DOUBLE_EQ(serial(utcTime(1970, 1, 1)), 25569.0);
    EXPECT_DOUBLE_EQ(serial(utcTime(2000, 1, 1)), 36526.0);
    EXPECT_DOUBLE_EQ(serial(utcTime(2023, 6, 15)), 45092.0);
}

// 测试2: 时间部分作为小数
TEST(TimeUtilsTest, TimeOfDayIsFraction) {
    EXPECT_DOUBLE_EQ(serial(utcTime(2023, 6, 15, 12, 0, 0)), 45092.5);
    EXPECT_DOUBLE_EQ(serial(utcTime(2000, 1, 1, 6, 0, 0)), 36526.25);
}

// 测试3: 1900-03-01 前后（Excel 虚构的 1900-02-29）
TEST(TimeUtilsTest, LeapYearBugBoundary) {
    EXPECT_DOUBLE_EQ(serial(utcTime(1900, 1, 1)), 1.0);
    EXPECT_DOUBLE_EQ(serial(utcTime(1900, 2, 28)), 59.0);
    EXPECT_DOUBLE_EQ(serial(utcTime(1900, 3, 1)), 61.0);
}

// 测试4: 可表示范围
TEST(TimeUtilsTest, RangeLimits) {
    EXPECT_DOUBLE_EQ(serial(utcTime(9999, 12, 31)), 2958465.0);

    auto before = TimeUtils::toExcelSerialNumber(utcTime(1899, 12, 31, 23, 59, 59));
    ASSERT_FALSE(before);
    EXPECT_EQ(before.error().code, core::ErrorCode::TimeOutOfRange);

    auto after = TimeUtils::toExcelSerialNumber(utcTime(10000, 1, 1));
    ASSERT_FALSE(after);
    EXPECT_EQ(after.error().code, core::ErrorCode::TimeOutOfRange);
}

// 测试5: 时长换算为天数
TEST(TimeUtilsTest, DurationToDays) {
    EXPECT_DOUBLE_EQ(TimeUtils::durationToExcelDays(std::chrono::hours(36)), 1.5);
    EXPECT_DOUBLE_EQ(TimeUtils::durationToExcelDays(std::chrono::minutes(30)), 1800.0 / 86400.0);
    EXPECT_DOUBLE_EQ(TimeUtils::durationToExcelDays(std::chrono::milliseconds(-43200000)), -0.5);
}
