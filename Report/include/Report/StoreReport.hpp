#pragma once

#include <Footfall/Records.hpp>
#include <Pipeline/DayPipeline.hpp>
#include <StoreComparator/StoreComparator.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace footfall::report
{
    struct StoreProfile
    {
        std::string name;
        int ward_count{0};
        int day_count{0};
        std::optional<std::chrono::year_month_day> first_date;
        std::optional<std::chrono::year_month_day> last_date;
    };

    // What the cache keeps of one analyzed store-day.
    struct DailySummary
    {
        std::chrono::year_month_day date{};
        int weekday{0};
        ConversionStats conversion;
        ConversionStats legacy_conversion;
        int identifier_count{0};
        int journey_count{0};
        PeakHours peaks;
        std::vector<HourlyConversion> hourly;
        comparison::DwellCategories visitor_dwell;
    };

    struct HourlyPatternEntry
    {
        int hour{0};
        double avg_total_traffic{0.0};
        double avg_visit_count{0.0};
        double avg_conversion_rate{0.0};
    };

    struct OverallStats
    {
        int total_days{0};
        double avg_conversion_rate{0.0};
        double avg_daily_visits{0.0};
        double avg_daily_traffic{0.0};
    };

    struct AggregatedStats
    {
        OverallStats overall;
        std::vector<HourlyPatternEntry> hourly_pattern; // hours 0..23
        std::vector<WeekdayConversion> weekday_pattern;
        std::optional<int> most_common_peak_traffic_hour;
        std::optional<int> most_common_peak_visit_hour;
        std::optional<int> most_common_peak_conversion_hour;
        comparison::DwellCategories dwell_categories_total;
    };

    struct StoreReport
    {
        StoreProfile profile;
        AggregatedStats aggregated_stats;
        std::vector<DailySummary> daily_results; // date order
    };

    DailySummary summarize(const pipeline::DayResult &result);

    /// Days may arrive in any order. Later summaries for an already known date replace earlier ones.
    StoreReport buildStoreReport(const std::string &store, std::vector<DailySummary> days, int wardCount);

    /// Most frequent value; ties go to the smallest hour. Empty when no value is present.
    std::optional<int> mostCommonHour(const std::vector<std::optional<int>> &hours);

    // Collects day results from any thread order into per-store reports.
    // Not synchronized; feed it from one thread (AnalysisPool delivery is serialized).
    class StoreReportBuilder
    {
    public:
        void add(const pipeline::DayResult &result);

        [[nodiscard]] std::size_t dayCount() const noexcept;

        // Sorted by store name
        [[nodiscard]] std::vector<StoreReport> build() const;

    private:
        struct Pending
        {
            int ward_count{0};
            std::vector<DailySummary> days;
        };
        std::map<std::string, Pending> m_stores;
    };

} // namespace footfall::report
