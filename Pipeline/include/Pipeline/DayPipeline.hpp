#pragma once

#include <Footfall/Records.hpp>
#include <DeviceLocalizer/DeviceLocalizer.hpp>
#include <IdentifierStitcher/IdentifierStitcher.hpp>
#include <StoreComparator/StoreComparator.hpp>
#include <VisitorClassifier/TrafficAnalyzer.hpp>
#include <VisitorClassifier/VisitRule.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace footfall::pipeline
{
    // Everything one analysis unit needs: one store, one calendar day.
    struct StoreDay
    {
        std::string store;
        std::chrono::year_month_day date{};
        std::vector<WardConfig> wards;
        std::vector<DetectionRecord> detections;
    };

    struct PipelineConfig
    {
        localization::LocalizerConfig localizer{};
        stitching::StitcherConfig stitcher{};
        classification::SignalWindowConfig signalWindow{};
        classification::DwellSpanConfig dwellSpan{};

        // Off: every identifier is its own journey.
        bool stitchIdentifiers = true;
    };

    struct DayResult
    {
        std::string store;
        std::chrono::year_month_day date{};
        int ward_count{0};
        int detection_count{0};        // as loaded
        int usable_detection_count{0}; // heard by a configured ward

        std::vector<PositionEstimate> positions;
        stitching::StitchResult stitch;

        std::vector<ClassificationRecord> identifier_classes; // signal-window rule, per identifier
        std::vector<ClassificationRecord> journey_classes;    // signal-window rule, per journey
        std::vector<ClassificationRecord> dwell_span_classes; // legacy rule, per identifier

        ConversionStats conversion; // journey based
        ConversionStats legacy_conversion;
        std::vector<HourlyConversion> hourly;
        PeakHours peaks;
        VisitorStats visitor_stats;
        classification::RotationAdjustment rotation;
        std::vector<classification::HourlyPresence> presence;
        comparison::DwellCategories visitor_dwell; // visit journeys only
    };

    // localize -> stitch -> classify -> aggregate for one store-day.
    // Holds no per-run state; run() may be called concurrently.
    class DayPipeline
    {
    public:
        explicit DayPipeline(const PipelineConfig &config = {});

        DayResult run(const StoreDay &day) const;

        [[nodiscard]] const PipelineConfig &config() const noexcept { return m_config; }

    private:
        PipelineConfig m_config;
        stitching::IdentifierStitcher m_stitcher;
        classification::SignalWindowRule m_signalRule;
        classification::DwellSpanRule m_dwellRule;
    };

} // namespace footfall::pipeline
