#include <Report/JsonSerializer.hpp>
#include <TimeBase/TimeIndex.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace footfall::report
{
    namespace
    {
        std::string optionalHour(const std::optional<int> &h)
        {
            return h ? std::to_string(*h) : "null";
        }

        std::string optionalDate(const std::optional<std::chrono::year_month_day> &d)
        {
            return d ? "\"" + timebase::formatDate(*d) + "\"" : "null";
        }

        template <typename T>
        std::string array(const std::vector<T> &items)
        {
            std::ostringstream oss;
            oss << "[";
            for (std::size_t i = 0; i < items.size(); ++i)
                oss << (i ? "," : "") << JsonSerializer::toJson(items[i]);
            oss << "]";
            return oss.str();
        }

        std::string storeValues(const std::map<std::string, double> &values)
        {
            std::ostringstream oss;
            oss << "{";
            std::size_t i = 0;
            for (const auto &[store, v] : values)
                oss << (i++ ? "," : "") << "\"" << JsonSerializer::escape(store) << "\":" << JsonSerializer::number(v);
            oss << "}";
            return oss.str();
        }

        // [{"<key>":k,"stores":{...}},...]
        std::string storeTable(const comparison::StoreTable<int> &table, const char *key)
        {
            std::ostringstream oss;
            oss << "[";
            std::size_t i = 0;
            for (const auto &[k, values] : table)
                oss << (i++ ? "," : "") << "{\"" << key << "\":" << k << ",\"stores\":" << storeValues(values) << "}";
            oss << "]";
            return oss.str();
        }

        bool writeText(const std::filesystem::path &folder, const std::filesystem::path &path, const std::string &text)
        {
            std::error_code ec;
            std::filesystem::create_directories(folder, ec);
            if (ec)
            {
                std::cerr << "[Report] Cannot create " << folder.string() << ": " << ec.message() << "\n";
                return false;
            }

            std::ofstream out(path, std::ios::out | std::ios::trunc);
            if (!out.is_open())
            {
                std::cerr << "[Report] Cannot open " << path.string() << " for writing\n";
                return false;
            }

            out << text << "\n";
            out.close();
            if (!out)
            {
                std::cerr << "[Report] Write to " << path.string() << " failed\n";
                return false;
            }
            return true;
        }
    } // namespace

    std::string JsonSerializer::escape(std::string_view text)
    {
        std::string out;
        out.reserve(text.size() + 2);
        for (char c : text)
        {
            switch (c)
            {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                }
                else
                    out += c;
            }
        }
        return out;
    }

    std::string JsonSerializer::number(double value)
    {
        if (!std::isfinite(value))
            return "null";
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(6) << value;
        return oss.str();
    }

    std::string JsonSerializer::toJson(const ConversionStats &s)
    {
        std::ostringstream oss;
        oss << "{"
            << "\"total_traffic\":" << s.total_traffic << ","
            << "\"visit_count\":" << s.visit_count << ","
            << "\"pass_by_count\":" << s.pass_by_count << ","
            << "\"conversion_rate\":" << number(s.conversion_rate) << ","
            << "\"avg_dwell_visit\":" << number(s.avg_dwell_visit) << ","
            << "\"avg_dwell_pass_by\":" << number(s.avg_dwell_pass_by)
            << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const PeakHours &p)
    {
        std::ostringstream oss;
        oss << "{"
            << "\"peak_traffic_hour\":" << optionalHour(p.traffic_hour) << ","
            << "\"peak_visit_hour\":" << optionalHour(p.visit_hour) << ","
            << "\"peak_conversion_hour\":" << optionalHour(p.conversion_hour)
            << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const HourlyConversion &h)
    {
        std::ostringstream oss;
        oss << "{"
            << "\"hour\":" << h.hour << ","
            << "\"total_traffic\":" << h.stats.total_traffic << ","
            << "\"visit_count\":" << h.stats.visit_count << ","
            << "\"pass_by_count\":" << h.stats.pass_by_count << ","
            << "\"conversion_rate\":" << number(h.stats.conversion_rate)
            << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const comparison::DwellCategories &c)
    {
        std::ostringstream oss;
        oss << "{";
        for (std::size_t i = 0; i < comparison::DwellCategories::Count; ++i)
            oss << (i ? "," : "") << "\"" << comparison::DwellCategories::name(i) << "\":" << c.counts[i];
        oss << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const DailySummary &d)
    {
        std::ostringstream oss;
        oss << "{"
            << "\"date\":\"" << timebase::formatDate(d.date) << "\","
            << "\"weekday\":" << d.weekday << ","
            << "\"weekday_name\":\"" << timebase::weekdayName(d.weekday) << "\","
            << "\"conversion_stats\":" << toJson(d.conversion) << ","
            << "\"legacy_conversion_stats\":" << toJson(d.legacy_conversion) << ","
            << "\"identifier_count\":" << d.identifier_count << ","
            << "\"journey_count\":" << d.journey_count << ","
            << "\"peak_hours\":" << toJson(d.peaks) << ","
            << "\"dwell_categories\":" << toJson(d.visitor_dwell) << ","
            << "\"hourly\":" << array(d.hourly)
            << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const AggregatedStats &a)
    {
        std::ostringstream oss;
        oss << "{"
            << "\"overall\":{"
            << "\"total_days\":" << a.overall.total_days << ","
            << "\"avg_conversion_rate\":" << number(a.overall.avg_conversion_rate) << ","
            << "\"avg_daily_visits\":" << number(a.overall.avg_daily_visits) << ","
            << "\"avg_daily_traffic\":" << number(a.overall.avg_daily_traffic)
            << "},";

        oss << "\"hourly_pattern\":[";
        for (std::size_t i = 0; i < a.hourly_pattern.size(); ++i)
        {
            const auto &e = a.hourly_pattern[i];
            oss << (i ? "," : "") << "{"
                << "\"hour\":" << e.hour << ","
                << "\"avg_total_traffic\":" << number(e.avg_total_traffic) << ","
                << "\"avg_visit_count\":" << number(e.avg_visit_count) << ","
                << "\"avg_conversion_rate\":" << number(e.avg_conversion_rate)
                << "}";
        }
        oss << "],";

        oss << "\"weekday_pattern\":[";
        for (std::size_t i = 0; i < a.weekday_pattern.size(); ++i)
        {
            const auto &w = a.weekday_pattern[i];
            oss << (i ? "," : "") << "{"
                << "\"weekday\":" << w.weekday << ","
                << "\"weekday_name\":\"" << timebase::weekdayName(w.weekday) << "\","
                << "\"day_count\":" << w.day_count << ","
                << "\"avg_conversion_rate\":" << number(w.avg_conversion_rate) << ","
                << "\"avg_visit_count\":" << number(w.avg_visit_count)
                << "}";
        }
        oss << "],";

        oss << "\"most_common_peak_traffic_hour\":" << optionalHour(a.most_common_peak_traffic_hour) << ","
            << "\"most_common_peak_visit_hour\":" << optionalHour(a.most_common_peak_visit_hour) << ","
            << "\"most_common_peak_conversion_hour\":" << optionalHour(a.most_common_peak_conversion_hour) << ","
            << "\"dwell_categories_total\":" << toJson(a.dwell_categories_total)
            << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const StoreProfile &p)
    {
        std::ostringstream oss;
        oss << "{"
            << "\"name\":\"" << escape(p.name) << "\","
            << "\"ward_count\":" << p.ward_count << ","
            << "\"day_count\":" << p.day_count << ","
            << "\"first_date\":" << optionalDate(p.first_date) << ","
            << "\"last_date\":" << optionalDate(p.last_date)
            << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const StoreReport &r)
    {
        std::ostringstream oss;
        oss << "{"
            << "\"profile\":" << toJson(r.profile) << ","
            << "\"aggregated_stats\":" << toJson(r.aggregated_stats) << ","
            << "\"daily_results\":" << array(r.daily_results)
            << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const std::vector<StoreReport> &reports)
    {
        std::vector<const StoreReport *> sorted;
        sorted.reserve(reports.size());
        for (const auto &r : reports)
            sorted.push_back(&r);
        std::stable_sort(sorted.begin(), sorted.end(), [](const StoreReport *a, const StoreReport *b)
                         { return a->profile.name < b->profile.name; });

        std::ostringstream oss;
        oss << "{";
        for (std::size_t i = 0; i < sorted.size(); ++i)
            oss << (i ? "," : "") << "\"" << escape(sorted[i]->profile.name) << "\":" << toJson(*sorted[i]);
        oss << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const comparison::BasicStats &b)
    {
        std::ostringstream oss;
        oss << "{"
            << "\"total_identifiers\":" << b.total_identifiers << ","
            << "\"total_records\":" << b.total_records << ","
            << "\"avg_dwell_minutes\":" << number(b.avg_dwell_minutes) << ","
            << "\"device_classes\":{";
        std::size_t i = 0;
        for (const auto &[dc, n] : b.device_classes)
            oss << (i++ ? "," : "") << "\"" << dc << "\":" << n;
        oss << "},"
            << "\"peak_hour\":" << optionalHour(b.peak_hour) << ","
            << "\"peak_identifiers\":" << b.peak_identifiers
            << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const StoreComparison &c)
    {
        std::ostringstream oss;
        oss << "{"
            << "\"reference_date\":" << optionalDate(c.reference_date) << ","
            << "\"stores\":{";
        for (std::size_t i = 0; i < c.stores.size(); ++i)
        {
            const auto &name = c.stores[i];
            oss << (i ? "," : "") << "\"" << escape(name) << "\":{";

            auto basic = c.basic.find(name);
            oss << "\"basic\":" << (basic != c.basic.end() ? toJson(basic->second) : "null") << ",";

            auto move = c.movement.find(name);
            if (move != c.movement.end())
                oss << "\"movement\":{"
                    << "\"avg_distance\":" << number(move->second.avg_distance) << ","
                    << "\"total_distance\":" << number(move->second.total_distance) << ","
                    << "\"avg_speed\":" << number(move->second.avg_speed)
                    << "},";
            else
                oss << "\"movement\":null,";

            auto split = c.weekend.find(name);
            const comparison::WeekendSplit w = split != c.weekend.end() ? split->second : comparison::WeekendSplit{};
            oss << "\"weekday_vs_weekend\":{\"weekday\":" << w.weekday << ",\"weekend\":" << w.weekend << "},";

            auto dwell = c.dwell.find(name);
            oss << "\"dwell_categories\":" << toJson(dwell != c.dwell.end() ? dwell->second : comparison::DwellCategories{})
                << "}";
        }
        oss << "},";

        oss << "\"hourly_traffic\":{"
            << "\"total\":" << storeTable(c.hourly.total, "hour") << ","
            << "\"visitors\":" << storeTable(c.hourly.visitors, "hour") << ","
            << "\"passers_by\":" << storeTable(c.hourly.passers_by, "hour")
            << "},"
            << "\"period_traffic\":" << storeTable(c.periods, "period") << ","
            << "\"weekday_traffic\":" << storeTable(c.weekdays, "weekday")
            << "}";
        return oss.str();
    }

    bool writeCache(const CacheConfig &config, const std::vector<StoreReport> &reports)
    {
        const auto path = config.cacheFile();
        if (!writeText(config.outputFolder, path, JsonSerializer::toJson(reports)))
            return false;

        std::cout << "[Report] Wrote " << reports.size() << " store(s) to " << path.string() << "\n";
        return true;
    }

    bool writeComparison(const CacheConfig &config, const StoreComparison &result)
    {
        const auto path = config.comparisonFile();
        if (!writeText(config.outputFolder, path, JsonSerializer::toJson(result)))
            return false;

        std::cout << "[Report] Wrote comparison of " << result.stores.size() << " store(s) to " << path.string() << "\n";
        return true;
    }

} // namespace footfall::report
