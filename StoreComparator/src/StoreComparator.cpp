#include <StoreComparator/StoreComparator.hpp>
#include <TimeBase/TimeIndex.hpp>

#include <algorithm>
#include <limits>
#include <set>
#include <utility>

namespace footfall::comparison
{
    namespace
    {
        struct Span
        {
            TimeIndex first{std::numeric_limits<TimeIndex>::max()};
            TimeIndex last{std::numeric_limits<TimeIndex>::min()};
        };

        std::map<std::string, Span> spans(const std::vector<PositionEstimate> &positions)
        {
            std::map<std::string, Span> out;
            for (const auto &p : positions)
            {
                auto &s = out[p.identifier];
                s.first = std::min(s.first, p.time_index);
                s.last = std::max(s.last, p.time_index);
            }
            return out;
        }

        // Gives every store of the table a value in every row.
        template <typename Key>
        void fillMissing(StoreTable<Key> &table, const std::set<std::string> &stores)
        {
            for (auto &[key, row] : table)
                for (const auto &store : stores)
                    row.try_emplace(store, 0.0);
        }

        // hour -> mean over minute bins of the bin's count
        std::map<int, double> meanPerHour(const std::map<std::pair<int, int>, int> &binCounts)
        {
            std::map<int, std::pair<double, int>> acc;
            for (const auto &[key, count] : binCounts)
            {
                auto &a = acc[key.first];
                a.first += count;
                ++a.second;
            }

            std::map<int, double> out;
            for (const auto &[hour, a] : acc)
                out[hour] = a.first / static_cast<double>(a.second);
            return out;
        }
    } // namespace

    void DwellCategories::add(double dwellMinutes)
    {
        ++counts[categoryOf(dwellMinutes)];
    }

    DwellCategories &DwellCategories::operator+=(const DwellCategories &other)
    {
        for (std::size_t i = 0; i < Count; ++i)
            counts[i] += other.counts[i];
        return *this;
    }

    int DwellCategories::total() const
    {
        int sum = 0;
        for (int c : counts)
            sum += c;
        return sum;
    }

    std::string_view DwellCategories::name(std::size_t category) noexcept
    {
        static constexpr std::array<std::string_view, Count> names{
            "very_short", "short", "medium", "long", "very_long"};
        return category < Count ? names[category] : "unknown";
    }

    std::size_t DwellCategories::categoryOf(double dwellMinutes) noexcept
    {
        if (dwellMinutes < 3.0)
            return 0;
        if (dwellMinutes < 10.0)
            return 1;
        if (dwellMinutes < 30.0)
            return 2;
        if (dwellMinutes < 60.0)
            return 3;
        return 4;
    }

    std::map<std::string, double> dwellByIdentifier(const std::vector<PositionEstimate> &positions)
    {
        std::map<std::string, double> out;
        for (const auto &[id, s] : spans(positions))
            out[id] = timebase::toMinutes(s.last - s.first);
        return out;
    }

    BasicStats basicStats(const std::vector<PositionEstimate> &positions, const std::string &storeName)
    {
        BasicStats stats;
        stats.store_name = storeName;
        if (positions.empty())
            return stats;

        const auto dwell = dwellByIdentifier(positions);
        stats.total_identifiers = static_cast<int>(dwell.size());
        stats.total_records = static_cast<int>(positions.size());

        double sum = 0.0;
        for (const auto &[id, minutes] : dwell)
            sum += minutes;
        stats.avg_dwell_minutes = sum / static_cast<double>(dwell.size());

        std::map<int, std::set<std::string>> perHour;
        for (const auto &p : positions)
        {
            ++stats.device_classes[p.device_class];
            perHour[timebase::hourOf(p.time_index)].insert(p.identifier);
        }

        // first hour with the maximum count
        for (const auto &[hour, ids] : perHour)
        {
            const int n = static_cast<int>(ids.size());
            if (!stats.peak_hour || n > stats.peak_identifiers)
            {
                stats.peak_hour = hour;
                stats.peak_identifiers = n;
            }
        }
        return stats;
    }

    HourlyTraffic hourlyTraffic(const StorePositions &stores, const StoreClassifications &classifications)
    {
        HourlyTraffic out;
        std::set<std::string> totalStores;
        std::set<std::string> classifiedStores;

        for (const auto &[store, positions] : stores)
        {
            if (positions.empty())
                continue;

            // (hour, minute_bin) -> distinct identifiers
            std::map<std::pair<int, int>, std::set<std::string>> bins;
            for (const auto &p : positions)
                bins[{timebase::hourOf(p.time_index), timebase::minuteBinOf(p.time_index)}].insert(p.identifier);

            std::map<std::pair<int, int>, int> totalCounts;
            for (const auto &[key, ids] : bins)
                totalCounts[key] = static_cast<int>(ids.size());
            for (const auto &[hour, mean] : meanPerHour(totalCounts))
                out.total[hour][store] = mean;
            totalStores.insert(store);

            auto cls = classifications.find(store);
            if (cls == classifications.end())
                continue;

            std::map<std::pair<int, int>, int> visitorCounts;
            std::map<std::pair<int, int>, int> passerCounts;
            for (const auto &[key, ids] : bins)
            {
                int v = 0;
                int p = 0;
                for (const auto &id : ids)
                {
                    auto it = cls->second.find(id);
                    if (it == cls->second.end())
                        continue;
                    if (it->second == VisitorType::Visit)
                        ++v;
                    else
                        ++p;
                }
                visitorCounts[key] = v;
                passerCounts[key] = p;
            }
            for (const auto &[hour, mean] : meanPerHour(visitorCounts))
                out.visitors[hour][store] = mean;
            for (const auto &[hour, mean] : meanPerHour(passerCounts))
                out.passers_by[hour][store] = mean;
            classifiedStores.insert(store);
        }

        fillMissing(out.total, totalStores);
        fillMissing(out.visitors, classifiedStores);
        fillMissing(out.passers_by, classifiedStores);
        return out;
    }

    StoreTable<int> periodTraffic(const StorePositions &stores)
    {
        StoreTable<int> out;
        std::set<std::string> seen;
        for (const auto &[store, positions] : stores)
        {
            if (positions.empty())
                continue;

            std::map<int, std::set<std::string>> perPeriod;
            for (const auto &p : positions)
                perPeriod[timebase::periodIndexOf(p.time_index)].insert(p.identifier);

            for (const auto &[period, ids] : perPeriod)
                out[period][store] = static_cast<double>(ids.size());
            seen.insert(store);
        }
        fillMissing(out, seen);
        return out;
    }

    StoreTable<int> weekdayTraffic(const StoreDays &stores)
    {
        StoreTable<int> out;
        std::set<std::string> seen;
        for (const auto &[store, days] : stores)
        {
            std::map<int, std::set<std::string>> perWeekday;
            for (const auto &day : days)
                for (const auto &p : day.positions)
                    perWeekday[timebase::weekdayOf(day.date)].insert(p.identifier);

            if (perWeekday.empty())
                continue;
            for (const auto &[wd, ids] : perWeekday)
                out[wd][store] = static_cast<double>(ids.size());
            seen.insert(store);
        }
        fillMissing(out, seen);
        return out;
    }

    std::map<std::string, WeekendSplit> weekendVsWeekday(const StoreDays &stores)
    {
        std::map<std::string, WeekendSplit> out;
        for (const auto &[store, days] : stores)
        {
            std::set<std::string> weekday;
            std::set<std::string> weekend;
            for (const auto &day : days)
            {
                auto &target = timebase::isWeekend(day.date) ? weekend : weekday;
                for (const auto &p : day.positions)
                    target.insert(p.identifier);
            }
            if (weekday.empty() && weekend.empty())
                continue;
            out[store] = {static_cast<int>(weekday.size()), static_cast<int>(weekend.size())};
        }
        return out;
    }

    std::map<std::string, DwellCategories> dwellDistribution(const StorePositions &stores)
    {
        std::map<std::string, DwellCategories> out;
        for (const auto &[store, positions] : stores)
        {
            if (positions.empty())
                continue;
            auto &cats = out[store];
            for (const auto &[id, minutes] : dwellByIdentifier(positions))
                cats.add(minutes);
        }
        return out;
    }

    MovementStats movementStats(const std::vector<PositionEstimate> &positions)
    {
        MovementStats stats;
        if (positions.empty())
            return stats;

        std::map<std::string, std::vector<const PositionEstimate *>> tracks;
        TimeIndex first = positions.front().time_index;
        TimeIndex last = positions.front().time_index;
        for (const auto &p : positions)
        {
            tracks[p.identifier].push_back(&p);
            first = std::min(first, p.time_index);
            last = std::max(last, p.time_index);
        }

        int moving = 0;
        for (auto &[id, track] : tracks)
        {
            if (track.size() < 2)
                continue;
            std::stable_sort(track.begin(), track.end(), [](const PositionEstimate *a, const PositionEstimate *b)
                             { return a->time_index < b->time_index; });

            double distance = 0.0;
            for (std::size_t i = 1; i < track.size(); ++i)
                distance += (track[i]->position - track[i - 1]->position).norm();

            stats.total_distance += distance;
            ++moving;
        }

        if (moving > 0)
            stats.avg_distance = stats.total_distance / static_cast<double>(moving);

        const double seconds = static_cast<double>(timebase::toSeconds(last - first).count());
        if (seconds > 0.0)
            stats.avg_speed = stats.total_distance / seconds;
        return stats;
    }

} // namespace footfall::comparison
