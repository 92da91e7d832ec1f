#include <Report/StoreComparison.hpp>

#include <algorithm>

namespace footfall::report
{
    void StoreComparisonBuilder::add(const pipeline::DayResult &result)
    {
        Day day;
        day.positions = result.positions;
        for (const auto &c : result.identifier_classes)
            day.classes[c.subject_id] = c.visitor_type;

        // a repeated date replaces the earlier day
        m_stores[result.store][result.date] = std::move(day);
    }

    std::size_t StoreComparisonBuilder::dayCount() const noexcept
    {
        std::size_t n = 0;
        for (const auto &[store, days] : m_stores)
            n += days.size();
        return n;
    }

    StoreComparison StoreComparisonBuilder::build() const
    {
        StoreComparison out;
        if (m_stores.empty())
            return out;

        for (const auto &[store, days] : m_stores)
            out.stores.push_back(store);

        // Latest date present for every store.
        for (auto it = m_stores.begin()->second.rbegin(); it != m_stores.begin()->second.rend(); ++it)
        {
            const auto &date = it->first;
            const bool shared = std::all_of(m_stores.begin(), m_stores.end(), [&](const auto &entry)
                                            { return entry.second.count(date) > 0; });
            if (shared)
            {
                out.reference_date = date;
                break;
            }
        }

        if (out.reference_date)
        {
            comparison::StorePositions positions;
            comparison::StoreClassifications classes;
            for (const auto &[store, days] : m_stores)
            {
                const auto &day = days.at(*out.reference_date);
                positions[store] = day.positions;
                classes[store] = day.classes;
                out.basic[store] = comparison::basicStats(day.positions, store);
                out.movement[store] = comparison::movementStats(day.positions);
            }
            out.hourly = comparison::hourlyTraffic(positions, classes);
            out.periods = comparison::periodTraffic(positions);
        }

        comparison::StoreDays all;
        for (const auto &[store, days] : m_stores)
        {
            auto &list = all[store];
            auto &dwell = out.dwell[store];
            for (const auto &[date, day] : days)
            {
                list.push_back({date, day.positions});

                comparison::StorePositions single{{store, day.positions}};
                auto perDay = comparison::dwellDistribution(single);
                auto found = perDay.find(store);
                if (found != perDay.end())
                    dwell += found->second;
            }
        }
        out.weekdays = comparison::weekdayTraffic(all);
        out.weekend = comparison::weekendVsWeekday(all);

        return out;
    }

} // namespace footfall::report
