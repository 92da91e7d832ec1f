#pragma once

#include <Footfall/Records.hpp>
#include <VisitorClassifier/Subject.hpp>
#include <VisitorClassifier/VisitRule.hpp>

#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace footfall::classification
{
    struct VisitCounts
    {
        int total{0};
        int visit_count{0};
        int pass_by_count{0};
    };

    // Visitor count correction for days analyzed without stitching.
    struct RotationAdjustment
    {
        int original_visitors{0};
        double estimated_rotations{1.0};
        int adjusted_visitors{0};
    };

    struct HourlyPresence
    {
        int hour{0};
        int visitors{0};
        int passers_by{0};
    };

    using DatedConversion = std::pair<std::chrono::year_month_day, ConversionStats>;

    // Aggregations over one visit rule. The rule is borrowed and must outlive the analyzer.
    class TrafficAnalyzer
    {
    public:
        explicit TrafficAnalyzer(const VisitRule &rule);

        [[nodiscard]] std::vector<ClassificationRecord> classify(const std::vector<Subject> &subjects) const;

        /// Counts only. Agrees with conversion(classify(subjects)).
        [[nodiscard]] VisitCounts countVisits(const std::vector<Subject> &subjects) const;

        /// Detections are bucketed by hourOf(time_index) and classified independently per hour.
        /// journeyOf, when given, groups identifiers into their journeys first.
        /// Always 24 entries; detections outside hours 0..23 are ignored.
        [[nodiscard]] std::vector<HourlyConversion> hourlyBreakdown(
            const std::vector<DetectionRecord> &detections,
            const std::map<std::string, std::string> *journeyOf = nullptr) const;

        [[nodiscard]] const VisitRule &rule() const noexcept { return m_rule; }

        static ConversionStats conversion(const std::vector<ClassificationRecord> &records);

        /// Each peak is the first hour holding the maximum of its own metric.
        /// All three are empty when no hour has traffic.
        static PeakHours peakHours(const std::vector<HourlyConversion> &hourly);

        /// Per weekday present in days, the mean conversion rate and mean visit count. Sorted by weekday.
        static std::vector<WeekdayConversion> weekdayPattern(const std::vector<DatedConversion> &days);

        static VisitorStats visitorStats(const std::vector<ClassificationRecord> &records);

        /// rotations = max(1, mean visitor dwell in time_index / rotationInterval)
        static RotationAdjustment rotationAdjustment(const std::vector<ClassificationRecord> &records,
                                                     int rotationInterval = 6);

        /// Distinct visitor and passer-by subjects heard in each hour, 24 entries.
        static std::vector<HourlyPresence> hourlyPresence(
            const std::vector<DetectionRecord> &detections,
            const std::vector<ClassificationRecord> &records,
            const std::map<std::string, std::string> *journeyOf = nullptr);

    private:
        const VisitRule &m_rule;
    };

} // namespace footfall::classification
