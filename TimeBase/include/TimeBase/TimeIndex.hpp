#pragma once

#include <Footfall/Records.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace footfall::timebase
{
    /// All day-relative timestamps in FootfallAnalytics are time_index values,
    /// one unit per TimeUnit.
    using TimeUnit = std::chrono::duration<int, std::ratio<10>>;

    constexpr int TimeUnitSeconds = 10;
    constexpr int SecondsPerHour = 3600;
    constexpr int TimeIndexPerHour = SecondsPerHour / TimeUnitSeconds; // 360
    constexpr int TimeIndexPerMinute = 60 / TimeUnitSeconds;          // 6
    constexpr int HoursPerDay = 24;

    [[nodiscard]] std::chrono::seconds toSeconds(TimeIndex t) noexcept;
    [[nodiscard]] double toMinutes(TimeIndex span) noexcept;

    // floor(t * 10 / 3600)
    [[nodiscard]] int hourOf(TimeIndex t) noexcept;
    [[nodiscard]] int minuteBinOf(TimeIndex t) noexcept;

    /// "HH:MM:SS"
    std::string formatClock(TimeIndex t);

    /// Accepts "HH:MM" or "HH:MM:SS". Throws std::invalid_argument otherwise.
    TimeIndex parseClock(std::string_view text);

    constexpr int PeriodCount = 8;

    /// Index of the 1.5 hour day period, 0 = early_morning ... 7 = night (everything past 10.5 h).
    [[nodiscard]] int periodIndexOf(TimeIndex t) noexcept;
    std::string_view periodName(int period) noexcept;

    /// One of the eight 1.5 hour day periods, e.g. "early_morning" or "night".
    std::string_view periodOf(TimeIndex t) noexcept;

    /// "YYYY-MM-DD". Throws std::invalid_argument on malformed or impossible dates.
    std::chrono::year_month_day parseDate(std::string_view text);
    std::string formatDate(const std::chrono::year_month_day &date);

    // 0 = Monday ... 6 = Sunday
    [[nodiscard]] int weekdayOf(const std::chrono::year_month_day &date);
    [[nodiscard]] bool isWeekend(const std::chrono::year_month_day &date);
    std::string_view weekdayName(int weekday) noexcept;

    /// "45s", "12m" or "1h 23m"
    std::string formatDuration(double minutes);
} // namespace footfall::timebase
