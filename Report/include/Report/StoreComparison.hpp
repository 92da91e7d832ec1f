#pragma once

#include <Footfall/Records.hpp>
#include <Pipeline/DayPipeline.hpp>
#include <StoreComparator/StoreComparator.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace footfall::report
{
    // Cross-store statistics. Single-day tables use the reference date, the latest
    // date analyzed for every store; they stay empty when the stores share no date.
    struct StoreComparison
    {
        std::vector<std::string> stores; // name order
        std::optional<std::chrono::year_month_day> reference_date;

        std::map<std::string, comparison::BasicStats> basic;
        std::map<std::string, comparison::MovementStats> movement;
        comparison::HourlyTraffic hourly;
        comparison::StoreTable<int> periods;

        // all analyzed days
        comparison::StoreTable<int> weekdays;
        std::map<std::string, comparison::WeekendSplit> weekend;
        std::map<std::string, comparison::DwellCategories> dwell;
    };

    // Keeps the positions and identifier classes of every day it is given.
    // Not synchronized, like StoreReportBuilder.
    class StoreComparisonBuilder
    {
    public:
        void add(const pipeline::DayResult &result);

        [[nodiscard]] std::size_t dayCount() const noexcept;

        [[nodiscard]] StoreComparison build() const;

    private:
        struct Day
        {
            std::vector<PositionEstimate> positions;
            std::map<std::string, VisitorType> classes;
        };
        std::map<std::string, std::map<std::chrono::year_month_day, Day>> m_stores;
    };

} // namespace footfall::report
