#pragma once

#include <Footfall/Records.hpp>

#include <array>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace footfall::comparison
{
    // Row key -> store name -> value. A store present in any row has a value (possibly 0) in every row.
    template <typename Key>
    using StoreTable = std::map<Key, std::map<std::string, double>>;

    using StorePositions = std::map<std::string, std::vector<PositionEstimate>>;
    // store -> identifier -> classification of that identifier over the whole day
    using StoreClassifications = std::map<std::string, std::map<std::string, VisitorType>>;

    struct DayPositions
    {
        std::chrono::year_month_day date{};
        std::vector<PositionEstimate> positions;
    };
    using StoreDays = std::map<std::string, std::vector<DayPositions>>;

    struct BasicStats
    {
        std::string store_name;
        int total_identifiers{0};
        int total_records{0};
        double avg_dwell_minutes{0.0};
        DeviceClassHistogram device_classes;
        std::optional<int> peak_hour;
        int peak_identifiers{0};
    };

    struct HourlyTraffic
    {
        StoreTable<int> total;
        StoreTable<int> visitors;
        StoreTable<int> passers_by;
    };

    struct WeekendSplit
    {
        int weekday{0};
        int weekend{0};
    };

    // Identifier counts per dwell span bucket.
    struct DwellCategories
    {
        static constexpr std::size_t Count = 5;

        std::array<int, Count> counts{};

        void add(double dwellMinutes);
        DwellCategories &operator+=(const DwellCategories &other);
        [[nodiscard]] int total() const;

        // "very_short" (<3 min), "short" (3-10), "medium" (10-30), "long" (30-60), "very_long" (>=60)
        static std::string_view name(std::size_t category) noexcept;
        static std::size_t categoryOf(double dwellMinutes) noexcept;
    };

    struct MovementStats
    {
        double avg_distance{0.0};
        double total_distance{0.0};
        double avg_speed{0.0}; // units per second over the observed span
    };

    /// Per-identifier dwell minutes, (last - first) time_index.
    std::map<std::string, double> dwellByIdentifier(const std::vector<PositionEstimate> &positions);

    BasicStats basicStats(const std::vector<PositionEstimate> &positions, const std::string &storeName);

    /// Per hour, the mean over one-minute bins of distinct identifiers heard in the bin.
    /// Visitor / passer-by tables only cover stores with an entry in classifications.
    HourlyTraffic hourlyTraffic(const StorePositions &stores, const StoreClassifications &classifications = {});

    /// Distinct identifiers per day period (key = timebase::periodIndexOf).
    StoreTable<int> periodTraffic(const StorePositions &stores);

    /// Distinct identifiers per weekday (0 = Monday) across all days of each store.
    StoreTable<int> weekdayTraffic(const StoreDays &stores);

    std::map<std::string, WeekendSplit> weekendVsWeekday(const StoreDays &stores);

    std::map<std::string, DwellCategories> dwellDistribution(const StorePositions &stores);

    MovementStats movementStats(const std::vector<PositionEstimate> &positions);

} // namespace footfall::comparison
