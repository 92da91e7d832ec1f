#include <catch2/catch_test_macros.hpp>
#include <Report/JsonSerializer.hpp>
#include <Report/StoreComparison.hpp>
#include <TimeBase/TimeIndex.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace footfall;
using namespace footfall::report;

namespace
{
    PositionEstimate at(const std::string &id, TimeIndex t)
    {
        PositionEstimate p;
        p.identifier = id;
        p.time_index = t;
        p.device_class = device::iPhone;
        p.sensor_count = 1;
        return p;
    }

    ClassificationRecord classified(const std::string &id, VisitorType type)
    {
        ClassificationRecord r;
        r.subject_id = id;
        r.visitor_type = type;
        return r;
    }

    pipeline::DayResult dayResult(const std::string &store, const std::string &date, std::vector<PositionEstimate> positions)
    {
        pipeline::DayResult r;
        r.store = store;
        r.date = timebase::parseDate(date);
        r.positions = std::move(positions);
        return r;
    }

    // Store_A: Monday 2025-11-10 and Saturday 2025-11-15. Store_B: the Monday only.
    StoreComparisonBuilder twoStores()
    {
        StoreComparisonBuilder builder;

        auto monday = dayResult("Store_A", "2025-11-10", {at("aa", 0), at("aa", 60), at("bb", 6)});
        monday.identifier_classes = {classified("aa", VisitorType::Visit), classified("bb", VisitorType::PassBy)};
        builder.add(monday);

        builder.add(dayResult("Store_A", "2025-11-15", {at("cc", 0)}));
        builder.add(dayResult("Store_B", "2025-11-10", {at("dd", 0), at("dd", 12)}));
        return builder;
    }
} // namespace

TEST_CASE("StoreComparison single-day tables use the latest shared date", "[StoreComparison]")
{
    auto builder = twoStores();
    REQUIRE(builder.dayCount() == 3);

    auto c = builder.build();
    REQUIRE(c.stores == (std::vector<std::string>{"Store_A", "Store_B"}));
    REQUIRE(c.reference_date.has_value());
    REQUIRE(timebase::formatDate(*c.reference_date) == "2025-11-10");

    REQUIRE(c.basic.at("Store_A").total_identifiers == 2);
    REQUIRE(c.basic.at("Store_A").total_records == 3);
    REQUIRE(c.basic.at("Store_A").peak_hour == 0);
    REQUIRE(c.basic.at("Store_B").total_identifiers == 1);
    REQUIRE(c.movement.size() == 2);

    REQUIRE(c.hourly.total.at(0).size() == 2);
    REQUIRE(c.hourly.visitors.at(0).at("Store_A") > 0.0);
    REQUIRE(c.hourly.visitors.at(0).at("Store_B") == 0.0);
    REQUIRE_FALSE(c.periods.empty());
}

TEST_CASE("StoreComparison multi-day tables cover every analyzed day", "[StoreComparison]")
{
    auto c = twoStores().build();

    REQUIRE(c.weekdays.at(0).at("Store_A") == 2.0);
    REQUIRE(c.weekdays.at(0).at("Store_B") == 1.0);
    REQUIRE(c.weekdays.at(5).at("Store_A") == 1.0);
    REQUIRE(c.weekdays.at(5).at("Store_B") == 0.0);

    REQUIRE(c.weekend.at("Store_A").weekday == 2);
    REQUIRE(c.weekend.at("Store_A").weekend == 1);
    REQUIRE(c.weekend.at("Store_B").weekend == 0);

    // bb and cc stay under 3 minutes, aa is seen for 10
    const auto &dwell = c.dwell.at("Store_A");
    REQUIRE(dwell.total() == 3);
    REQUIRE(dwell.counts[comparison::DwellCategories::categoryOf(0.0)] == 2);
    REQUIRE(dwell.counts[comparison::DwellCategories::categoryOf(10.0)] == 1);
}

TEST_CASE("StoreComparison without a shared date", "[StoreComparison]")
{
    StoreComparisonBuilder builder;
    builder.add(dayResult("Store_A", "2025-11-15", {at("cc", 0)}));
    builder.add(dayResult("Store_B", "2025-11-10", {at("dd", 0)}));

    SECTION("a repeated date replaces the earlier day")
    {
        builder.add(dayResult("Store_B", "2025-11-10", {at("ee", 0), at("ff", 0)}));
        REQUIRE(builder.dayCount() == 2);
        REQUIRE(builder.build().weekdays.at(0).at("Store_B") == 2.0);
    }

    auto c = builder.build();
    REQUIRE_FALSE(c.reference_date.has_value());
    REQUIRE(c.basic.empty());
    REQUIRE(c.hourly.total.empty());
    REQUIRE(c.weekend.size() == 2);

    const auto json = JsonSerializer::toJson(c);
    REQUIRE(json.find("\"reference_date\":null") != std::string::npos);
    REQUIRE(json.find("\"Store_A\":{\"basic\":null,\"movement\":null,") != std::string::npos);
}

TEST_CASE("StoreComparison is written beside the conversion cache", "[StoreComparison]")
{
    auto c = twoStores().build();
    const auto json = JsonSerializer::toJson(c);
    REQUIRE(json.rfind("{\"reference_date\":\"2025-11-10\",\"stores\":{\"Store_A\":{\"basic\":{", 0) == 0);
    REQUIRE(json.find("\"weekday_vs_weekend\":{\"weekday\":2,\"weekend\":1}") != std::string::npos);
    REQUIRE(json.find("\"weekday_traffic\":[{\"weekday\":0,\"stores\":{\"Store_A\":2.000000,\"Store_B\":1.000000}}") !=
            std::string::npos);

    CacheConfig cfg;
    cfg.outputFolder = std::filesystem::temp_directory_path() /
                       ("footfall_comparison_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    REQUIRE(writeComparison(cfg, c));

    std::ifstream in(cfg.comparisonFile());
    std::string line;
    REQUIRE(std::getline(in, line));
    REQUIRE(line == json);

    std::filesystem::remove_all(cfg.outputFolder);
}
