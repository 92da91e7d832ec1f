#include <Pipeline/DayPipeline.hpp>
#include <IdentifierStitcher/SignalTable.hpp>
#include <VisitorClassifier/Subject.hpp>

#include <utility>

namespace footfall::pipeline
{
    DayPipeline::DayPipeline(const PipelineConfig &config)
        : m_config(config),
          m_stitcher(config.stitcher),
          m_signalRule(config.signalWindow),
          m_dwellRule(config.dwellSpan)
    {
        // fail at construction, not on the first store-day
        localization::DeviceLocalizer::validate(m_config.localizer);
    }

    DayResult DayPipeline::run(const StoreDay &day) const
    {
        DayResult r;
        r.store = day.store;
        r.date = day.date;
        r.ward_count = static_cast<int>(day.wards.size());
        r.detection_count = static_cast<int>(day.detections.size());

        localization::WardLayout layout(day.wards);

        // readings from unconfigured wards carry no usable information
        std::vector<DetectionRecord> usable;
        usable.reserve(day.detections.size());
        for (const auto &d : day.detections)
            if (layout.contains(d.sensor_id))
                usable.push_back(d);
        r.usable_detection_count = static_cast<int>(usable.size());

        localization::DeviceLocalizer localizer(m_config.localizer, std::move(layout));
        localization::SmoothingState state(m_config.localizer.seed);
        r.positions = localizer.localize(usable, state);

        if (m_config.stitchIdentifiers)
        {
            const stitching::SignalTable signals(usable);
            r.stitch = m_stitcher.stitch(r.positions, &signals);
        }
        else
        {
            r.stitch.features = m_stitcher.extractFeatures(r.positions);
            r.stitch.journeys = m_stitcher.buildJourneys(r.stitch.features, {});
            for (const auto &j : r.stitch.journeys)
                for (const auto &id : j.member_identifiers)
                    r.stitch.journeyOf[id] = j.journey_id;
        }

        const classification::TrafficAnalyzer analyzer(m_signalRule);
        const classification::TrafficAnalyzer legacy(m_dwellRule);

        const auto identifiers = classification::subjectsFromDetections(usable);
        r.identifier_classes = analyzer.classify(identifiers);
        r.dwell_span_classes = legacy.classify(identifiers);
        r.journey_classes = analyzer.classify(classification::subjectsFromJourneys(usable, r.stitch.journeys));

        r.conversion = classification::TrafficAnalyzer::conversion(r.journey_classes);
        r.legacy_conversion = classification::TrafficAnalyzer::conversion(r.dwell_span_classes);
        r.hourly = analyzer.hourlyBreakdown(usable, &r.stitch.journeyOf);
        r.peaks = classification::TrafficAnalyzer::peakHours(r.hourly);
        r.visitor_stats = classification::TrafficAnalyzer::visitorStats(r.journey_classes);
        r.rotation = classification::TrafficAnalyzer::rotationAdjustment(r.identifier_classes);
        r.presence = classification::TrafficAnalyzer::hourlyPresence(usable, r.journey_classes, &r.stitch.journeyOf);

        for (const auto &c : r.journey_classes)
            if (c.visitor_type == VisitorType::Visit)
                r.visitor_dwell.add(c.dwell_minutes);

        return r;
    }

} // namespace footfall::pipeline
