#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <TimeBase/TimeIndex.hpp>
#include <VisitorClassifier/TrafficAnalyzer.hpp>

#include <stdexcept>

using Catch::Approx;
using namespace footfall;
using namespace footfall::classification;

namespace
{
    DetectionRecord heard(TimeIndex t, const std::string &id, double rssi)
    {
        DetectionRecord d;
        d.time_index = t;
        d.sensor_id = "S1";
        d.identifier = id;
        d.device_class = device::iPhone;
        d.signal_strength = rssi;
        return d;
    }

    ClassificationRecord record(const std::string &id, VisitorType type, TimeIndex first, TimeIndex last)
    {
        ClassificationRecord r;
        r.subject_id = id;
        r.visitor_type = type;
        r.first_time = first;
        r.last_time = last;
        r.dwell_minutes = timebase::toMinutes(last - first);
        return r;
    }

    // "aa" lingers close to the ward in hour 0, "bb" is heard once in hour 1.
    std::vector<DetectionRecord> morning()
    {
        std::vector<DetectionRecord> d;
        for (TimeIndex t = 0; t < 12; t += 2)
            d.push_back(heard(t, "aa", -60.0));
        d.push_back(heard(370, "bb", -60.0));
        return d;
    }
} // namespace

TEST_CASE("TrafficAnalyzer conversion statistics", "[TrafficAnalyzer]")
{
    SECTION("an empty day is all zeros")
    {
        auto stats = TrafficAnalyzer::conversion({});
        REQUIRE(stats.total_traffic == 0);
        REQUIRE(stats.visit_count == 0);
        REQUIRE(stats.pass_by_count == 0);
        REQUIRE(stats.conversion_rate == 0.0);
        REQUIRE(stats.avg_dwell_visit == 0.0);
        REQUIRE(stats.avg_dwell_pass_by == 0.0);
    }

    SECTION("counts and dwell averages")
    {
        auto stats = TrafficAnalyzer::conversion({record("a", VisitorType::Visit, 0, 30),
                                                  record("b", VisitorType::Visit, 0, 18),
                                                  record("c", VisitorType::PassBy, 0, 6),
                                                  record("d", VisitorType::PassBy, 0, 0)});
        REQUIRE(stats.total_traffic == 4);
        REQUIRE(stats.visit_count + stats.pass_by_count == stats.total_traffic);
        REQUIRE(stats.conversion_rate == Approx(0.5));
        REQUIRE(stats.avg_dwell_visit == Approx(4.0));
        REQUIRE(stats.avg_dwell_pass_by == Approx(0.5));
    }
}

TEST_CASE("TrafficAnalyzer counts agree with full classification", "[TrafficAnalyzer]")
{
    SignalWindowRule rule;
    TrafficAnalyzer analyzer(rule);

    auto subjects = subjectsFromDetections(morning());
    auto counts = analyzer.countVisits(subjects);
    auto stats = TrafficAnalyzer::conversion(analyzer.classify(subjects));
    REQUIRE(counts.total == stats.total_traffic);
    REQUIRE(counts.visit_count == stats.visit_count);
    REQUIRE(counts.visit_count == 1);
    REQUIRE(counts.pass_by_count == 1);
    REQUIRE(&analyzer.rule() == &rule);
}

TEST_CASE("TrafficAnalyzer hourly breakdown and peaks", "[TrafficAnalyzer]")
{
    SignalWindowRule rule;
    TrafficAnalyzer analyzer(rule);

    auto detections = morning();
    detections.push_back(heard(-5, "zz", -60.0));
    detections.push_back(heard(8640, "zz", -60.0));

    auto hourly = analyzer.hourlyBreakdown(detections);
    REQUIRE(hourly.size() == 24);
    for (int h = 0; h < 24; ++h)
        REQUIRE(hourly[static_cast<std::size_t>(h)].hour == h);

    REQUIRE(hourly[0].stats.total_traffic == 1);
    REQUIRE(hourly[0].stats.visit_count == 1);
    REQUIRE(hourly[1].stats.total_traffic == 1);
    REQUIRE(hourly[1].stats.pass_by_count == 1);
    REQUIRE(hourly[23].stats.total_traffic == 0);

    auto peaks = TrafficAnalyzer::peakHours(hourly);
    REQUIRE(peaks.traffic_hour == 0);
    REQUIRE(peaks.visit_hour == 0);
    REQUIRE(peaks.conversion_hour == 0);

    SECTION("journeys group identifiers within an hour")
    {
        std::vector<DetectionRecord> d{heard(400, "cc", -90.0), heard(401, "dd", -90.0)};
        const std::map<std::string, std::string> journeyOf{{"cc", "J0001"}, {"dd", "J0001"}};
        REQUIRE(analyzer.hourlyBreakdown(d)[1].stats.total_traffic == 2);
        REQUIRE(analyzer.hourlyBreakdown(d, &journeyOf)[1].stats.total_traffic == 1);
    }
}

TEST_CASE("TrafficAnalyzer peaks are empty without traffic", "[TrafficAnalyzer]")
{
    SignalWindowRule rule;
    TrafficAnalyzer analyzer(rule);

    auto peaks = TrafficAnalyzer::peakHours(analyzer.hourlyBreakdown({}));
    REQUIRE_FALSE(peaks.traffic_hour.has_value());
    REQUIRE_FALSE(peaks.visit_hour.has_value());
    REQUIRE_FALSE(peaks.conversion_hour.has_value());
}

TEST_CASE("TrafficAnalyzer peaks are chosen per metric", "[TrafficAnalyzer]")
{
    std::vector<HourlyConversion> hourly(24);
    for (int h = 0; h < 24; ++h)
        hourly[static_cast<std::size_t>(h)].hour = h;

    hourly[9].stats = {10, 8, 2, 0.2, 0.0, 0.0};
    hourly[14].stats = {6, 2, 4, 4.0 / 6.0, 0.0, 0.0}; // total, pass-bys, visits, rate
    hourly[17].stats = {10, 4, 6, 0.6, 0.0, 0.0};

    auto peaks = TrafficAnalyzer::peakHours(hourly);
    REQUIRE(peaks.traffic_hour == 9);
    REQUIRE(peaks.visit_hour == 17);
    REQUIRE(peaks.conversion_hour == 14);
}

TEST_CASE("TrafficAnalyzer weekday pattern", "[TrafficAnalyzer]")
{
    ConversionStats a;
    a.conversion_rate = 0.5;
    a.visit_count = 2;
    ConversionStats b;
    b.conversion_rate = 0.3;
    b.visit_count = 4;
    ConversionStats c;
    c.conversion_rate = 0.2;
    c.visit_count = 1;

    auto pattern = TrafficAnalyzer::weekdayPattern({{timebase::parseDate("2025-11-15"), c},
                                                    {timebase::parseDate("2025-11-10"), a},
                                                    {timebase::parseDate("2025-11-17"), b}});
    REQUIRE(pattern.size() == 2);
    REQUIRE(pattern[0].weekday == 0);
    REQUIRE(pattern[0].day_count == 2);
    REQUIRE(pattern[0].avg_conversion_rate == Approx(0.4));
    REQUIRE(pattern[0].avg_visit_count == Approx(3.0));
    REQUIRE(pattern[1].weekday == 5);
    REQUIRE(pattern[1].day_count == 1);

    REQUIRE(TrafficAnalyzer::weekdayPattern({}).empty());
}

TEST_CASE("TrafficAnalyzer visitor statistics", "[TrafficAnalyzer]")
{
    auto v = record("J0001", VisitorType::Visit, 0, 30);
    v.mean_signal = -60.0;
    v.member_count = 3;
    auto p = record("J0002", VisitorType::PassBy, 0, 6);
    p.mean_signal = -90.0;

    auto stats = TrafficAnalyzer::visitorStats({v, p});
    REQUIRE(stats.total_subjects == 2);
    REQUIRE(stats.visitor_ratio == Approx(0.5));
    REQUIRE(stats.avg_dwell_visitors == Approx(5.0));
    REQUIRE(stats.avg_signal_passers == Approx(-90.0));
    REQUIRE(stats.avg_members_per_visitor == Approx(3.0));
    REQUIRE(stats.avg_members_per_passer == Approx(1.0));
}

TEST_CASE("TrafficAnalyzer rotation adjustment", "[TrafficAnalyzer]")
{
    SECTION("long visits imply several identifiers per device")
    {
        std::vector<ClassificationRecord> records;
        for (int i = 0; i < 4; ++i)
            records.push_back(record("v" + std::to_string(i), VisitorType::Visit, 0, 12));
        records.push_back(record("p", VisitorType::PassBy, 0, 300));

        auto adj = TrafficAnalyzer::rotationAdjustment(records);
        REQUIRE(adj.original_visitors == 4);
        REQUIRE(adj.estimated_rotations == Approx(2.0));
        REQUIRE(adj.adjusted_visitors == 2);
    }

    SECTION("short visits are never inflated")
    {
        auto adj = TrafficAnalyzer::rotationAdjustment({record("v", VisitorType::Visit, 0, 2)});
        REQUIRE(adj.estimated_rotations == Approx(1.0));
        REQUIRE(adj.adjusted_visitors == 1);
    }

    SECTION("no visitors")
    {
        auto adj = TrafficAnalyzer::rotationAdjustment({});
        REQUIRE(adj.original_visitors == 0);
        REQUIRE(adj.adjusted_visitors == 0);
    }

    REQUIRE_THROWS_AS(TrafficAnalyzer::rotationAdjustment({}, 0), std::invalid_argument);
}

TEST_CASE("TrafficAnalyzer hourly presence", "[TrafficAnalyzer]")
{
    auto detections = morning();
    detections.push_back(heard(380, "aa", -60.0));

    auto presence = TrafficAnalyzer::hourlyPresence(detections,
                                                    {record("aa", VisitorType::Visit, 0, 380),
                                                     record("bb", VisitorType::PassBy, 370, 370)});
    REQUIRE(presence.size() == 24);
    REQUIRE(presence[0].visitors == 1);
    REQUIRE(presence[0].passers_by == 0);
    REQUIRE(presence[1].visitors == 1);
    REQUIRE(presence[1].passers_by == 1);
    REQUIRE(presence[2].visitors == 0);
}
