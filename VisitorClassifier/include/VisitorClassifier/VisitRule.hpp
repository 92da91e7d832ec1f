#pragma once

#include <Footfall/Records.hpp>
#include <VisitorClassifier/Subject.hpp>

#include <map>
#include <string_view>
#include <vector>

namespace footfall::classification
{
    // device_class -> minimum mean window RSSI (dBm) for a visit
    struct ThresholdTable
    {
        std::map<DeviceClass, double> byClass{
            {device::iPhone, -75.0},
            {device::Android, -85.0},
        };
        double fallback = -80.0;

        [[nodiscard]] double lookup(DeviceClass dc) const;
    };

    // Decides whether one subject's observed behavior is a visit.
    class VisitRule
    {
    public:
        virtual ~VisitRule() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual ClassificationRecord classify(const Subject &subject) const = 0;
    };

    struct SignalWindowConfig
    {
        int windowLength = 12; // time_index units, 2 minutes
        int minDetections = 6;
        ThresholdTable thresholds{};
    };

    // Visit when some window [t_i, t_i + windowLength) opened at a detection holds at least
    // minDetections detections whose mean RSSI exceeds the device-class threshold.
    class SignalWindowRule final : public VisitRule
    {
    public:
        explicit SignalWindowRule(const SignalWindowConfig &config = {});

        [[nodiscard]] std::string_view name() const noexcept override { return "signal_window"; }
        [[nodiscard]] ClassificationRecord classify(const Subject &subject) const override;

        /// samples must be sorted by time_index. Stops at the first qualifying window.
        [[nodiscard]] bool qualifies(const std::vector<SignalSample> &samples, double threshold) const;

        [[nodiscard]] const SignalWindowConfig &config() const noexcept { return m_config; }

    private:
        SignalWindowConfig m_config;
    };

    struct DwellSpanConfig
    {
        double minDwellMinutes = 2.0;
    };

    // Legacy rule: visit when last - first detection spans at least minDwellMinutes.
    // Ignores signal strength entirely, so it accepts far more subjects than SignalWindowRule.
    class DwellSpanRule final : public VisitRule
    {
    public:
        explicit DwellSpanRule(const DwellSpanConfig &config = {});

        [[nodiscard]] std::string_view name() const noexcept override { return "dwell_span"; }
        [[nodiscard]] ClassificationRecord classify(const Subject &subject) const override;

    private:
        DwellSpanConfig m_config;
    };

    std::vector<ClassificationRecord> classifyAll(const VisitRule &rule, const std::vector<Subject> &subjects);

    // "visit" / "pass_by"
    std::string_view trafficTypeName(VisitorType type) noexcept;
    // "real_visitor" / "passer_by"
    std::string_view visitorTypeName(VisitorType type) noexcept;

} // namespace footfall::classification
