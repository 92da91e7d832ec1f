#include <VisitorClassifier/TrafficAnalyzer.hpp>
#include <TimeBase/TimeIndex.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace footfall::classification
{
    namespace
    {
        double meanOrZero(double sum, int n)
        {
            return n > 0 ? sum / static_cast<double>(n) : 0.0;
        }

        const std::string &subjectOf(const std::string &identifier,
                                     const std::map<std::string, std::string> *journeyOf)
        {
            if (journeyOf)
            {
                auto it = journeyOf->find(identifier);
                if (it != journeyOf->end())
                    return it->second;
            }
            return identifier;
        }
    } // namespace

    TrafficAnalyzer::TrafficAnalyzer(const VisitRule &rule) : m_rule(rule) {}

    std::vector<ClassificationRecord> TrafficAnalyzer::classify(const std::vector<Subject> &subjects) const
    {
        return classifyAll(m_rule, subjects);
    }

    VisitCounts TrafficAnalyzer::countVisits(const std::vector<Subject> &subjects) const
    {
        VisitCounts counts;
        for (const auto &s : subjects)
        {
            if (m_rule.classify(s).visitor_type == VisitorType::Visit)
                ++counts.visit_count;
            else
                ++counts.pass_by_count;
        }
        counts.total = counts.visit_count + counts.pass_by_count;
        return counts;
    }

    ConversionStats TrafficAnalyzer::conversion(const std::vector<ClassificationRecord> &records)
    {
        ConversionStats stats;
        double dwellVisit = 0.0;
        double dwellPass = 0.0;

        for (const auto &r : records)
        {
            if (r.visitor_type == VisitorType::Visit)
            {
                ++stats.visit_count;
                dwellVisit += r.dwell_minutes;
            }
            else
            {
                ++stats.pass_by_count;
                dwellPass += r.dwell_minutes;
            }
        }

        stats.total_traffic = stats.visit_count + stats.pass_by_count;
        stats.conversion_rate = meanOrZero(static_cast<double>(stats.visit_count), stats.total_traffic);
        stats.avg_dwell_visit = meanOrZero(dwellVisit, stats.visit_count);
        stats.avg_dwell_pass_by = meanOrZero(dwellPass, stats.pass_by_count);
        return stats;
    }

    std::vector<HourlyConversion> TrafficAnalyzer::hourlyBreakdown(
        const std::vector<DetectionRecord> &detections,
        const std::map<std::string, std::string> *journeyOf) const
    {
        std::array<std::vector<DetectionRecord>, timebase::HoursPerDay> buckets;
        for (const auto &d : detections)
        {
            const int hour = timebase::hourOf(d.time_index);
            if (hour < 0 || hour >= timebase::HoursPerDay)
                continue;
            buckets[static_cast<std::size_t>(hour)].push_back(d);
        }

        const std::map<std::string, std::string> noGroups;
        std::vector<HourlyConversion> out;
        out.reserve(timebase::HoursPerDay);
        for (int h = 0; h < timebase::HoursPerDay; ++h)
        {
            const auto &bucket = buckets[static_cast<std::size_t>(h)];
            HourlyConversion hc;
            hc.hour = h;
            if (!bucket.empty())
                hc.stats = conversion(classify(subjectsFromDetections(bucket, journeyOf ? *journeyOf : noGroups)));
            out.push_back(hc);
        }
        return out;
    }

    PeakHours TrafficAnalyzer::peakHours(const std::vector<HourlyConversion> &hourly)
    {
        PeakHours peaks;
        const bool anyTraffic = std::any_of(hourly.begin(), hourly.end(), [](const HourlyConversion &h)
                                            { return h.stats.total_traffic > 0; });
        if (!anyTraffic)
            return peaks;

        auto argmax = [&hourly](auto metric)
        {
            auto it = std::max_element(hourly.begin(), hourly.end(),
                                       [&metric](const HourlyConversion &a, const HourlyConversion &b)
                                       { return metric(a) < metric(b); });
            return it->hour;
        };

        peaks.traffic_hour = argmax([](const HourlyConversion &h)
                                    { return static_cast<double>(h.stats.total_traffic); });
        peaks.visit_hour = argmax([](const HourlyConversion &h)
                                  { return static_cast<double>(h.stats.visit_count); });
        peaks.conversion_hour = argmax([](const HourlyConversion &h)
                                       { return h.stats.conversion_rate; });
        return peaks;
    }

    std::vector<WeekdayConversion> TrafficAnalyzer::weekdayPattern(const std::vector<DatedConversion> &days)
    {
        std::map<int, WeekdayConversion> byWeekday;
        for (const auto &[date, stats] : days)
        {
            const int wd = timebase::weekdayOf(date);
            auto &w = byWeekday[wd];
            w.weekday = wd;
            ++w.day_count;
            w.avg_conversion_rate += stats.conversion_rate;
            w.avg_visit_count += static_cast<double>(stats.visit_count);
        }

        std::vector<WeekdayConversion> out;
        out.reserve(byWeekday.size());
        for (auto &[wd, w] : byWeekday)
        {
            w.avg_conversion_rate = meanOrZero(w.avg_conversion_rate, w.day_count);
            w.avg_visit_count = meanOrZero(w.avg_visit_count, w.day_count);
            out.push_back(w);
        }
        return out;
    }

    VisitorStats TrafficAnalyzer::visitorStats(const std::vector<ClassificationRecord> &records)
    {
        VisitorStats s;
        double dwellV = 0.0, dwellP = 0.0, sigV = 0.0, sigP = 0.0, memV = 0.0, memP = 0.0;

        for (const auto &r : records)
        {
            if (r.visitor_type == VisitorType::Visit)
            {
                ++s.visitors;
                dwellV += r.dwell_minutes;
                sigV += r.mean_signal;
                memV += r.member_count;
            }
            else
            {
                ++s.passers_by;
                dwellP += r.dwell_minutes;
                sigP += r.mean_signal;
                memP += r.member_count;
            }
        }

        s.total_subjects = s.visitors + s.passers_by;
        s.visitor_ratio = meanOrZero(static_cast<double>(s.visitors), s.total_subjects);
        s.avg_dwell_visitors = meanOrZero(dwellV, s.visitors);
        s.avg_dwell_passers = meanOrZero(dwellP, s.passers_by);
        s.avg_signal_visitors = meanOrZero(sigV, s.visitors);
        s.avg_signal_passers = meanOrZero(sigP, s.passers_by);
        s.avg_members_per_visitor = meanOrZero(memV, s.visitors);
        s.avg_members_per_passer = meanOrZero(memP, s.passers_by);
        return s;
    }

    RotationAdjustment TrafficAnalyzer::rotationAdjustment(const std::vector<ClassificationRecord> &records,
                                                           int rotationInterval)
    {
        if (rotationInterval <= 0)
            throw std::invalid_argument("rotationAdjustment: rotationInterval must be positive");

        RotationAdjustment adj;
        double span = 0.0;
        for (const auto &r : records)
        {
            if (r.visitor_type != VisitorType::Visit)
                continue;
            ++adj.original_visitors;
            span += static_cast<double>(r.last_time - r.first_time);
        }

        if (adj.original_visitors == 0)
            return adj;

        const double meanSpan = span / static_cast<double>(adj.original_visitors);
        adj.estimated_rotations = std::max(1.0, meanSpan / static_cast<double>(rotationInterval));
        adj.adjusted_visitors = static_cast<int>(std::floor(adj.original_visitors / adj.estimated_rotations));
        return adj;
    }

    std::vector<HourlyPresence> TrafficAnalyzer::hourlyPresence(
        const std::vector<DetectionRecord> &detections,
        const std::vector<ClassificationRecord> &records,
        const std::map<std::string, std::string> *journeyOf)
    {
        std::unordered_map<std::string, VisitorType> typeOf;
        for (const auto &r : records)
            typeOf[r.subject_id] = r.visitor_type;

        std::array<std::set<std::string>, timebase::HoursPerDay> visitors;
        std::array<std::set<std::string>, timebase::HoursPerDay> passers;

        for (const auto &d : detections)
        {
            const int hour = timebase::hourOf(d.time_index);
            if (hour < 0 || hour >= timebase::HoursPerDay)
                continue;

            const std::string &subject = subjectOf(d.identifier, journeyOf);
            auto it = typeOf.find(subject);
            if (it == typeOf.end())
                continue;

            auto &bucket = it->second == VisitorType::Visit ? visitors : passers;
            bucket[static_cast<std::size_t>(hour)].insert(subject);
        }

        std::vector<HourlyPresence> out;
        out.reserve(timebase::HoursPerDay);
        for (int h = 0; h < timebase::HoursPerDay; ++h)
        {
            const auto i = static_cast<std::size_t>(h);
            out.push_back({h, static_cast<int>(visitors[i].size()), static_cast<int>(passers[i].size())});
        }
        return out;
    }

} // namespace footfall::classification
