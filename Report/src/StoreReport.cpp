#include <Report/StoreReport.hpp>
#include <TimeBase/TimeIndex.hpp>
#include <VisitorClassifier/TrafficAnalyzer.hpp>

#include <algorithm>
#include <array>

namespace footfall::report
{
    DailySummary summarize(const pipeline::DayResult &result)
    {
        DailySummary d;
        d.date = result.date;
        d.weekday = timebase::weekdayOf(result.date);
        d.conversion = result.conversion;
        d.legacy_conversion = result.legacy_conversion;
        d.identifier_count = static_cast<int>(result.stitch.features.size());
        d.journey_count = static_cast<int>(result.stitch.journeys.size());
        d.peaks = result.peaks;
        d.hourly = result.hourly;
        d.visitor_dwell = result.visitor_dwell;
        return d;
    }

    std::optional<int> mostCommonHour(const std::vector<std::optional<int>> &hours)
    {
        std::map<int, int> counts;
        for (const auto &h : hours)
            if (h)
                ++counts[*h];

        std::optional<int> best;
        int bestCount = 0;
        for (const auto &[hour, n] : counts)
        {
            if (n > bestCount)
            {
                best = hour;
                bestCount = n;
            }
        }
        return best;
    }

    StoreReport buildStoreReport(const std::string &store, std::vector<DailySummary> days, int wardCount)
    {
        std::stable_sort(days.begin(), days.end(), [](const DailySummary &a, const DailySummary &b)
                         { return a.date < b.date; });
        // keep the last summary of each date
        std::vector<DailySummary> unique;
        for (auto &d : days)
        {
            if (!unique.empty() && unique.back().date == d.date)
                unique.back() = std::move(d);
            else
                unique.push_back(std::move(d));
        }

        StoreReport report;
        report.profile.name = store;
        report.profile.ward_count = wardCount;
        report.profile.day_count = static_cast<int>(unique.size());
        if (!unique.empty())
        {
            report.profile.first_date = unique.front().date;
            report.profile.last_date = unique.back().date;
        }

        auto &agg = report.aggregated_stats;
        agg.overall.total_days = static_cast<int>(unique.size());

        std::array<HourlyPatternEntry, timebase::HoursPerDay> hourly{};
        for (int h = 0; h < timebase::HoursPerDay; ++h)
            hourly[static_cast<std::size_t>(h)].hour = h;

        std::vector<classification::DatedConversion> dated;
        std::vector<std::optional<int>> peakTraffic, peakVisit, peakConversion;

        for (const auto &d : unique)
        {
            agg.overall.avg_conversion_rate += d.conversion.conversion_rate;
            agg.overall.avg_daily_visits += d.conversion.visit_count;
            agg.overall.avg_daily_traffic += d.conversion.total_traffic;

            for (const auto &hc : d.hourly)
            {
                if (hc.hour < 0 || hc.hour >= timebase::HoursPerDay)
                    continue;
                auto &e = hourly[static_cast<std::size_t>(hc.hour)];
                e.avg_total_traffic += hc.stats.total_traffic;
                e.avg_visit_count += hc.stats.visit_count;
                e.avg_conversion_rate += hc.stats.conversion_rate;
            }

            dated.emplace_back(d.date, d.conversion);
            peakTraffic.push_back(d.peaks.traffic_hour);
            peakVisit.push_back(d.peaks.visit_hour);
            peakConversion.push_back(d.peaks.conversion_hour);
            agg.dwell_categories_total += d.visitor_dwell;
        }

        if (!unique.empty())
        {
            const double n = static_cast<double>(unique.size());
            agg.overall.avg_conversion_rate /= n;
            agg.overall.avg_daily_visits /= n;
            agg.overall.avg_daily_traffic /= n;
            for (auto &e : hourly)
            {
                e.avg_total_traffic /= n;
                e.avg_visit_count /= n;
                e.avg_conversion_rate /= n;
            }
        }

        agg.hourly_pattern.assign(hourly.begin(), hourly.end());
        agg.weekday_pattern = classification::TrafficAnalyzer::weekdayPattern(dated);
        agg.most_common_peak_traffic_hour = mostCommonHour(peakTraffic);
        agg.most_common_peak_visit_hour = mostCommonHour(peakVisit);
        agg.most_common_peak_conversion_hour = mostCommonHour(peakConversion);

        report.daily_results = std::move(unique);
        return report;
    }

    void StoreReportBuilder::add(const pipeline::DayResult &result)
    {
        auto &pending = m_stores[result.store];
        pending.ward_count = std::max(pending.ward_count, result.ward_count);
        pending.days.push_back(summarize(result));
    }

    std::size_t StoreReportBuilder::dayCount() const noexcept
    {
        std::size_t n = 0;
        for (const auto &[store, pending] : m_stores)
            n += pending.days.size();
        return n;
    }

    std::vector<StoreReport> StoreReportBuilder::build() const
    {
        std::vector<StoreReport> out;
        out.reserve(m_stores.size());
        for (const auto &[store, pending] : m_stores)
            out.push_back(buildStoreReport(store, pending.days, pending.ward_count));
        return out;
    }

} // namespace footfall::report
