#include <VisitorClassifier/VisitRule.hpp>
#include <TimeBase/TimeIndex.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace footfall::classification
{
    namespace
    {
        // Fills everything except the verdict and the threshold.
        ClassificationRecord summarize(const Subject &subject)
        {
            ClassificationRecord r;
            r.subject_id = subject.id;
            r.device_class = subject.device_class;
            r.first_time = subject.first_time;
            r.last_time = subject.last_time;
            r.appearance_count = subject.appearance_count;
            r.member_count = subject.member_count;
            r.dwell_minutes = timebase::toMinutes(subject.last_time - subject.first_time);

            if (!subject.has_signal || subject.samples.empty())
                return r;

            double sum = 0.0;
            for (const auto &s : subject.samples)
                sum += s.signal_strength;
            const double n = static_cast<double>(subject.samples.size());
            r.mean_signal = sum / n;

            // sample stddev, 0 for a single reading
            if (subject.samples.size() > 1)
            {
                double sq = 0.0;
                for (const auto &s : subject.samples)
                    sq += (s.signal_strength - r.mean_signal) * (s.signal_strength - r.mean_signal);
                r.signal_stddev = std::sqrt(sq / (n - 1.0));
            }
            return r;
        }
    } // namespace

    double ThresholdTable::lookup(DeviceClass dc) const
    {
        auto it = byClass.find(dc);
        return it == byClass.end() ? fallback : it->second;
    }

    SignalWindowRule::SignalWindowRule(const SignalWindowConfig &config) : m_config(config)
    {
        if (m_config.windowLength <= 0)
            throw std::invalid_argument("SignalWindowConfig: windowLength must be positive");
        if (m_config.minDetections <= 0)
            throw std::invalid_argument("SignalWindowConfig: minDetections must be positive");
    }

    bool SignalWindowRule::qualifies(const std::vector<SignalSample> &samples, double threshold) const
    {
        const auto minDetections = static_cast<std::size_t>(m_config.minDetections);
        if (samples.size() < minDetections)
            return false;

        for (std::size_t i = 0; i < samples.size(); ++i)
        {
            const TimeIndex windowEnd = samples[i].time_index + m_config.windowLength;
            auto endIt = std::lower_bound(samples.begin() + static_cast<std::ptrdiff_t>(i), samples.end(), windowEnd,
                                          [](const SignalSample &s, TimeIndex t)
                                          { return s.time_index < t; });
            const auto j = static_cast<std::size_t>(endIt - samples.begin());
            if (j - i < minDetections)
                continue;

            double sum = 0.0;
            for (std::size_t k = i; k < j; ++k)
                sum += samples[k].signal_strength;

            if (sum / static_cast<double>(j - i) > threshold)
                return true;
        }
        return false;
    }

    ClassificationRecord SignalWindowRule::classify(const Subject &subject) const
    {
        ClassificationRecord r = summarize(subject);
        r.threshold_used = m_config.thresholds.lookup(subject.device_class);

        // fast reject before the window scan; qualifies() would reach the same verdict
        const bool visit = subject.has_signal &&
                           subject.samples.size() >= static_cast<std::size_t>(m_config.minDetections) &&
                           qualifies(subject.samples, r.threshold_used);

        r.visitor_type = visit ? VisitorType::Visit : VisitorType::PassBy;
        return r;
    }

    DwellSpanRule::DwellSpanRule(const DwellSpanConfig &config) : m_config(config)
    {
        if (!(m_config.minDwellMinutes >= 0.0))
            throw std::invalid_argument("DwellSpanConfig: minDwellMinutes must not be negative");
    }

    ClassificationRecord DwellSpanRule::classify(const Subject &subject) const
    {
        ClassificationRecord r = summarize(subject);
        r.threshold_used = m_config.minDwellMinutes;
        r.visitor_type = (subject.appearance_count > 0 && r.dwell_minutes >= m_config.minDwellMinutes)
                             ? VisitorType::Visit
                             : VisitorType::PassBy;
        return r;
    }

    std::vector<ClassificationRecord> classifyAll(const VisitRule &rule, const std::vector<Subject> &subjects)
    {
        std::vector<ClassificationRecord> out;
        out.reserve(subjects.size());
        for (const auto &s : subjects)
            out.push_back(rule.classify(s));
        return out;
    }

    std::string_view trafficTypeName(VisitorType type) noexcept
    {
        return type == VisitorType::Visit ? "visit" : "pass_by";
    }

    std::string_view visitorTypeName(VisitorType type) noexcept
    {
        return type == VisitorType::Visit ? "real_visitor" : "passer_by";
    }

} // namespace footfall::classification
