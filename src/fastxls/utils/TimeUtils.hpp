#pragma once

#include "fastxls/core/CellValue.hpp"

#include <cmath>
#include <cstdint>
#include <optional>

namespace fastxls {
namespace utils {

/**
 * @brief 时间工具类 - OA日期序列号与日历时间的互相转换
 *
 * 1900日期系统以 1899-12-30 为第0天，这样1900年3月1日之后的序列号
 * 与Excel把1900年当作闰年的行为一致。
 */
class TimeUtils {
public:
    static constexpr int64_t kMillisPerDay = 86400000LL;

    // OA日期允许的范围（不含端点），对应 0100-01-01 到 9999-12-31
    static constexpr double kMinOADate = -657435.0;
    static constexpr double kMaxOADate = 2958466.0;

    // 1904日期系统与1900日期系统之间的天数差
    static constexpr double kDate1904Offset = 1462.0;

    /**
     * @brief 把OA日期序列号转换为日历时间
     * @param value 序列号，整数部分为天数，小数部分为一天中的时间
     * @return 超出范围或非有限值时返回 std::nullopt
     *
     * 负值的小数部分按正的时间处理（-1.25 为 1899-12-29 06:00）。
     */
    static std::optional<core::DateTime> fromOADate(double value) {
        if (!std::isfinite(value) || value <= kMinOADate || value >= kMaxOADate) {
            return std::nullopt;
        }

        int64_t millis = static_cast<int64_t>(value * kMillisPerDay + (value >= 0 ? 0.5 : -0.5));
        if (millis < 0) {
            millis -= (millis % kMillisPerDay) * 2;
        }

        int64_t days = millis / kMillisPerDay;
        int64_t time_of_day = millis % kMillisPerDay;
        if (time_of_day < 0) {
            time_of_day += kMillisPerDay;
            days -= 1;
        }

        core::DateTime result;
        civilFromDays(days + kOAEpochDays, result.year, result.month, result.day);
        result.hour = static_cast<int>(time_of_day / 3600000);
        result.minute = static_cast<int>((time_of_day / 60000) % 60);
        result.second = static_cast<int>((time_of_day / 1000) % 60);
        result.millisecond = static_cast<int>(time_of_day % 1000);
        return result;
    }

    /**
     * @brief 日历时间转换为OA日期序列号
     */
    static double toOADate(const core::DateTime& dt) {
        const int64_t days = daysFromCivil(dt.year, dt.month, dt.day) - kOAEpochDays;
        const double fraction = (dt.hour * 3600000.0 + dt.minute * 60000.0 +
                                 dt.second * 1000.0 + dt.millisecond) / kMillisPerDay;
        return days >= 0 ? days + fraction : days - fraction;
    }

    /**
     * @brief 公历日期到 1970-01-01 起的天数
     */
    static int64_t daysFromCivil(int year, int month, int day) {
        const int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const int64_t yoe = y - era * 400;
        const int64_t mp = (month + 9) % 12;
        const int64_t doy = (153 * mp + 2) / 5 + day - 1;
        const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }

    /**
     * @brief 1970-01-01 起的天数到公历日期
     */
    static void civilFromDays(int64_t z, int& year, int& month, int& day) {
        z += 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const int64_t doe = z - era * 146097;
        const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const int64_t mp = (5 * doy + 2) / 153;
        day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
        month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
        year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
    }

private:
    // 1899-12-30 相对 1970-01-01 的天数
    static constexpr int64_t kOAEpochDays = -25569;
};

}} // namespace fastxls::utils
