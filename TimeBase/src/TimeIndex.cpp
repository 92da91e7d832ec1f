#include <TimeBase/TimeIndex.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <stdexcept>
#include <vector>

namespace footfall::timebase
{
    namespace
    {
        int parseField(std::string_view field, std::string_view whole)
        {
            int value = 0;
            const auto *begin = field.data();
            const auto *end = field.data() + field.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (field.empty() || ec != std::errc{} || ptr != end)
                throw std::invalid_argument("Invalid time format: " + std::string(whole));
            return value;
        }

        std::vector<std::string_view> split(std::string_view text, char sep)
        {
            std::vector<std::string_view> parts;
            std::size_t start = 0;
            while (true)
            {
                const auto pos = text.find(sep, start);
                if (pos == std::string_view::npos)
                {
                    parts.push_back(text.substr(start));
                    break;
                }
                parts.push_back(text.substr(start, pos - start));
                start = pos + 1;
            }
            return parts;
        }
    } // namespace

    std::chrono::seconds toSeconds(TimeIndex t) noexcept
    {
        return std::chrono::duration_cast<std::chrono::seconds>(TimeUnit{t});
    }

    double toMinutes(TimeIndex span) noexcept
    {
        return static_cast<double>(span) * TimeUnitSeconds / 60.0;
    }

    int hourOf(TimeIndex t) noexcept
    {
        const long long seconds = static_cast<long long>(t) * TimeUnitSeconds;
        // floor division so negative indices land in negative hours
        long long hour = seconds / SecondsPerHour;
        if (seconds % SecondsPerHour != 0 && seconds < 0)
            --hour;
        return static_cast<int>(hour);
    }

    int minuteBinOf(TimeIndex t) noexcept
    {
        return t / TimeIndexPerMinute;
    }

    std::string formatClock(TimeIndex t)
    {
        const int total = t * TimeUnitSeconds;
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", total / 3600, (total % 3600) / 60, total % 60);
        return buf;
    }

    TimeIndex parseClock(std::string_view text)
    {
        const auto parts = split(text, ':');
        if (parts.size() != 2 && parts.size() != 3)
            throw std::invalid_argument("Invalid time format: " + std::string(text));

        const int hours = parseField(parts[0], text);
        const int minutes = parseField(parts[1], text);
        const int seconds = parts.size() == 3 ? parseField(parts[2], text) : 0;

        return (hours * 3600 + minutes * 60 + seconds) / TimeUnitSeconds;
    }

    int periodIndexOf(TimeIndex t) noexcept
    {
        // 1.5 h = 540 time_index per period
        const int slot = t < 0 ? 0 : t / 540;
        return std::min(slot, PeriodCount - 1);
    }

    std::string_view periodName(int period) noexcept
    {
        static constexpr std::array<std::string_view, PeriodCount> names{
            "early_morning", "morning", "late_morning", "lunch",
            "afternoon", "late_afternoon", "evening", "night"};
        if (period < 0 || period >= PeriodCount)
            return "unknown";
        return names[static_cast<std::size_t>(period)];
    }

    std::string_view periodOf(TimeIndex t) noexcept
    {
        return periodName(periodIndexOf(t));
    }

    std::chrono::year_month_day parseDate(std::string_view text)
    {
        const auto parts = split(text, '-');
        if (parts.size() != 3 || parts[0].size() != 4 || parts[1].size() != 2 || parts[2].size() != 2)
            throw std::invalid_argument("Invalid date format: " + std::string(text));

        const std::chrono::year_month_day date{
            std::chrono::year{parseField(parts[0], text)},
            std::chrono::month{static_cast<unsigned>(parseField(parts[1], text))},
            std::chrono::day{static_cast<unsigned>(parseField(parts[2], text))}};

        if (!date.ok())
            throw std::invalid_argument("Invalid calendar date: " + std::string(text));
        return date;
    }

    std::string formatDate(const std::chrono::year_month_day &date)
    {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                      static_cast<int>(date.year()),
                      static_cast<unsigned>(date.month()),
                      static_cast<unsigned>(date.day()));
        return buf;
    }

    int weekdayOf(const std::chrono::year_month_day &date)
    {
        // iso_encoding: Monday = 1 ... Sunday = 7
        const std::chrono::weekday wd{std::chrono::sys_days{date}};
        return static_cast<int>(wd.iso_encoding()) - 1;
    }

    bool isWeekend(const std::chrono::year_month_day &date)
    {
        return weekdayOf(date) >= 5;
    }

    std::string_view weekdayName(int weekday) noexcept
    {
        static constexpr std::array<std::string_view, 7> names{
            "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"};
        if (weekday < 0 || weekday >= static_cast<int>(names.size()))
            return "Unknown";
        return names[static_cast<std::size_t>(weekday)];
    }

    std::string formatDuration(double minutes)
    {
        if (minutes < 1.0)
            return std::to_string(static_cast<int>(minutes * 60.0)) + "s";
        if (minutes < 60.0)
            return std::to_string(static_cast<int>(minutes)) + "m";

        const int hours = static_cast<int>(minutes / 60.0);
        const int mins = static_cast<int>(minutes) % 60;
        return std::to_string(hours) + "h " + std::to_string(mins) + "m";
    }

} // namespace footfall::timebase
