#include <catch2/catch_test_macros.hpp>
#include <Report/JsonSerializer.hpp>
#include <TimeBase/TimeIndex.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using namespace footfall;
using namespace footfall::report;

namespace
{
    StoreReport namedReport(const std::string &name)
    {
        DailySummary d;
        d.date = timebase::parseDate("2025-11-10");
        d.conversion.total_traffic = 4;
        d.conversion.visit_count = 1;
        d.conversion.pass_by_count = 3;
        d.conversion.conversion_rate = 0.25;
        d.peaks.traffic_hour = 9;
        return buildStoreReport(name, {d}, 3);
    }
} // namespace

TEST_CASE("JsonSerializer formats ConversionStats", "[JsonSerializer]")
{
    ConversionStats s;
    s.total_traffic = 4;
    s.visit_count = 1;
    s.pass_by_count = 3;
    s.conversion_rate = 0.25;
    s.avg_dwell_visit = 5.5;

    const auto json = JsonSerializer::toJson(s);
    REQUIRE(json == R"({"total_traffic":4,"visit_count":1,"pass_by_count":3,"conversion_rate":0.250000,)"
                    R"("avg_dwell_visit":5.500000,"avg_dwell_pass_by":0.000000})");
}

TEST_CASE("JsonSerializer formats PeakHours", "[JsonSerializer]")
{
    PeakHours p;
    p.traffic_hour = 14;
    p.visit_hour = 9;

    const auto json = JsonSerializer::toJson(p);
    REQUIRE(json == R"({"peak_traffic_hour":14,"peak_visit_hour":9,"peak_conversion_hour":null})");
}

TEST_CASE("JsonSerializer formats DwellCategories", "[JsonSerializer]")
{
    comparison::DwellCategories c;
    c.add(1.0);
    c.add(45.0);
    c.add(45.0);

    const auto json = JsonSerializer::toJson(c);
    REQUIRE(json == R"({"very_short":1,"short":0,"medium":0,"long":2,"very_long":0})");
}

TEST_CASE("JsonSerializer numbers and escaping", "[JsonSerializer]")
{
    REQUIRE(JsonSerializer::number(1.0 / 3.0) == "0.333333");
    REQUIRE(JsonSerializer::number(std::numeric_limits<double>::quiet_NaN()) == "null");
    REQUIRE(JsonSerializer::number(std::numeric_limits<double>::infinity()) == "null");

    REQUIRE(JsonSerializer::escape(R"(a"b\c)") == R"(a\"b\\c)");
    REQUIRE(JsonSerializer::escape("tab\there") == "tab\\there");
    REQUIRE(JsonSerializer::escape(std::string("\x01", 1)) == "\\u0001");
}

TEST_CASE("JsonSerializer store reports are keyed and ordered by name", "[JsonSerializer]")
{
    const std::vector<StoreReport> reports{namedReport("Store_B"), namedReport("Store_A")};
    const auto json = JsonSerializer::toJson(reports);

    REQUIRE(json.front() == '{');
    REQUIRE(json.back() == '}');
    const auto a = json.find(R"("Store_A":{"profile":)");
    const auto b = json.find(R"("Store_B":{"profile":)");
    REQUIRE(a != std::string::npos);
    REQUIRE(b != std::string::npos);
    REQUIRE(a < b);

    REQUIRE(json.find(R"("first_date":"2025-11-10")") != std::string::npos);
    REQUIRE(json.find(R"("weekday_name":"Monday")") != std::string::npos);
    REQUIRE(json.find(R"("most_common_peak_traffic_hour":9)") != std::string::npos);
    REQUIRE(json.find(R"("most_common_peak_visit_hour":null)") != std::string::npos);
    REQUIRE(json.find(R"("conversion_stats":{"total_traffic":4)") != std::string::npos);

    // same input, same bytes
    const std::vector<StoreReport> reversed{namedReport("Store_A"), namedReport("Store_B")};
    REQUIRE(JsonSerializer::toJson(reversed) == json);
}

TEST_CASE("JsonSerializer writes the cache file", "[JsonSerializer]")
{
    CacheConfig cfg;
    cfg.outputFolder = std::filesystem::temp_directory_path() /
                       ("footfall_cache_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count())) /
                       "nested";

    const std::vector<StoreReport> reports{namedReport("Store_A")};
    REQUIRE(writeCache(cfg, reports));
    REQUIRE(std::filesystem::exists(cfg.cacheFile()));

    std::ifstream in(cfg.cacheFile());
    std::stringstream content;
    content << in.rdbuf();
    REQUIRE(content.str() == JsonSerializer::toJson(reports) + "\n");

    std::filesystem::remove_all(cfg.outputFolder.parent_path());
}
