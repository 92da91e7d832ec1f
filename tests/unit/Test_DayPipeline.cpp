#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <Pipeline/DayPipeline.hpp>
#include <TimeBase/TimeIndex.hpp>

#include <stdexcept>

using Catch::Approx;
using namespace footfall;
using namespace footfall::pipeline;

namespace
{
    WardConfig ward(const std::string &id, double x, double y)
    {
        WardConfig w;
        w.id = id;
        w.position = Eigen::Vector2d(x, y);
        return w;
    }

    DetectionRecord heard(TimeIndex t, const std::string &sensor, const std::string &id, double rssi)
    {
        DetectionRecord d;
        d.time_index = t;
        d.sensor_id = sensor;
        d.identifier = id;
        d.device_class = device::iPhone;
        d.signal_strength = rssi;
        return d;
    }

    // "aa" stays close to all three wards for six slices in hour 1,
    // "bb" is heard once, faintly, later in the same hour.
    StoreDay sampleDay()
    {
        StoreDay day;
        day.store = "Store_A";
        day.date = timebase::parseDate("2025-11-10");
        day.wards = {ward("S1", 0.0, 0.0), ward("S2", 10.0, 0.0), ward("S3", 0.0, 10.0)};

        for (TimeIndex t = 360; t <= 370; t += 2)
            for (const char *s : {"S1", "S2", "S3"})
                day.detections.push_back(heard(t, s, "aa", -60.0));
        day.detections.push_back(heard(360, "S9", "aa", -40.0));
        day.detections.push_back(heard(400, "S1", "bb", -85.0));
        return day;
    }
} // namespace

TEST_CASE("DayPipeline runs one store-day end to end", "[DayPipeline]")
{
    DayPipeline pipeline;
    auto r = pipeline.run(sampleDay());

    REQUIRE(r.store == "Store_A");
    REQUIRE(timebase::formatDate(r.date) == "2025-11-10");
    REQUIRE(r.ward_count == 3);
    REQUIRE(r.detection_count == 20);
    REQUIRE(r.usable_detection_count == 19);

    REQUIRE(r.positions.size() == 7);
    REQUIRE(r.stitch.features.size() == 2);
    REQUIRE(r.stitch.journeys.size() == 2);
    REQUIRE(r.stitch.journeyOf.size() == 2);

    REQUIRE(r.conversion.total_traffic == 2);
    REQUIRE(r.conversion.visit_count == 1);
    REQUIRE(r.conversion.pass_by_count == 1);
    REQUIRE(r.conversion.conversion_rate == Approx(0.5));

    // neither identifier spans the two-minute dwell floor
    REQUIRE(r.legacy_conversion.total_traffic == 2);
    REQUIRE(r.legacy_conversion.visit_count == 0);

    REQUIRE(r.identifier_classes.size() == 2);
    REQUIRE(r.dwell_span_classes.size() == 2);
    REQUIRE(r.journey_classes.size() == 2);

    REQUIRE(r.hourly.size() == 24);
    REQUIRE(r.hourly[1].stats.total_traffic == 2);
    REQUIRE(r.hourly[1].stats.visit_count == 1);
    REQUIRE(r.peaks.traffic_hour == 1);
    REQUIRE(r.peaks.visit_hour == 1);

    REQUIRE(r.visitor_stats.visitors == 1);
    REQUIRE(r.rotation.original_visitors == 1);
    REQUIRE(r.presence[1].visitors == 1);
    REQUIRE(r.presence[1].passers_by == 1);

    REQUIRE(r.visitor_dwell.total() == 1);
    REQUIRE(r.visitor_dwell.counts[0] == 1);
}

TEST_CASE("DayPipeline is deterministic", "[DayPipeline]")
{
    DayPipeline pipeline;
    auto a = pipeline.run(sampleDay());
    auto b = pipeline.run(sampleDay());

    REQUIRE(a.positions.size() == b.positions.size());
    for (std::size_t i = 0; i < a.positions.size(); ++i)
    {
        REQUIRE(a.positions[i].identifier == b.positions[i].identifier);
        REQUIRE(a.positions[i].position.isApprox(b.positions[i].position));
    }
    REQUIRE(a.stitch.journeyOf == b.stitch.journeyOf);
}

TEST_CASE("DayPipeline without stitching keeps one journey per identifier", "[DayPipeline]")
{
    PipelineConfig cfg;
    cfg.stitchIdentifiers = false;
    DayPipeline pipeline(cfg);

    auto r = pipeline.run(sampleDay());
    REQUIRE(r.stitch.links.empty());
    REQUIRE(r.stitch.journeys.size() == r.stitch.features.size());
    REQUIRE(r.stitch.journeyOf.size() == 2);
    REQUIRE(r.conversion.visit_count == 1);
}

TEST_CASE("DayPipeline handles an empty day", "[DayPipeline]")
{
    StoreDay day = sampleDay();
    day.detections.clear();

    DayPipeline pipeline;
    auto r = pipeline.run(day);
    REQUIRE(r.positions.empty());
    REQUIRE(r.stitch.journeys.empty());
    REQUIRE(r.conversion.total_traffic == 0);
    REQUIRE(r.conversion.conversion_rate == 0.0);
    REQUIRE(r.hourly.size() == 24);
    REQUIRE_FALSE(r.peaks.traffic_hour.has_value());
    REQUIRE(r.visitor_dwell.total() == 0);
}

TEST_CASE("DayPipeline rejects invalid configuration up front", "[DayPipeline]")
{
    PipelineConfig cfg;
    cfg.localizer.alpha = 2.0;
    REQUIRE_THROWS_AS(DayPipeline(cfg), std::invalid_argument);

    PipelineConfig window;
    window.signalWindow.minDetections = 0;
    REQUIRE_THROWS_AS(DayPipeline(window), std::invalid_argument);
}
