#include <Dataset/StoreCatalog.hpp>
#include <TimeBase/TimeIndex.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

namespace footfall::dataset
{
    namespace fs = std::filesystem;

    namespace
    {
        std::string missingColumn(const CsvReader &reader, std::string_view what)
        {
            std::string header;
            for (const auto &h : reader.header())
                header += (header.empty() ? "" : ",") + h;
            return "missing column '" + std::string(what) + "' (header: " + header + ")";
        }

        bool fieldsCover(const std::vector<std::string> &fields, std::initializer_list<std::size_t> columns)
        {
            for (auto c : columns)
                if (c >= fields.size())
                    return false;
            return true;
        }
    } // namespace

    std::optional<std::vector<WardConfig>> readWards(std::istream &in, LoadReport &report)
    {
        CsvReader reader(in);
        if (!reader.readHeader())
        {
            std::cerr << "[Dataset] Ward table is empty\n";
            return std::nullopt;
        }

        const auto nameCol = reader.column({"name", "sward_id", "sensor_id"});
        const auto xCol = reader.column({"x"});
        const auto yCol = reader.column({"y"});
        const auto descCol = reader.column({"description", "label"});

        for (auto [col, what] : {std::pair{nameCol, "name"}, std::pair{xCol, "x"}, std::pair{yCol, "y"}})
        {
            if (!col)
            {
                std::cerr << "[Dataset] Ward table: " << missingColumn(reader, what) << "\n";
                return std::nullopt;
            }
        }

        std::vector<WardConfig> wards;
        std::set<std::string> seen;
        std::vector<std::string> fields;
        while (reader.next(fields))
        {
            ++report.rows_read;
            if (!fieldsCover(fields, {*nameCol, *xCol, *yCol}))
            {
                report.skip(reader.line(), "too few fields");
                continue;
            }

            const auto x = parseDouble(fields[*xCol]);
            const auto y = parseDouble(fields[*yCol]);
            if (fields[*nameCol].empty() || !x || !y)
            {
                report.skip(reader.line(), "bad ward name or coordinate");
                continue;
            }
            if (!seen.insert(fields[*nameCol]).second)
            {
                report.skip(reader.line(), "duplicate ward " + fields[*nameCol]);
                continue;
            }

            WardConfig w;
            w.id = fields[*nameCol];
            w.position = Eigen::Vector2d(*x, *y);
            if (descCol && *descCol < fields.size())
                w.label = fields[*descCol];
            wards.push_back(std::move(w));
        }
        return wards;
    }

    std::optional<std::vector<DetectionRecord>> readDetections(std::istream &in, LoadReport &report,
                                                               std::optional<TimeRange> range)
    {
        CsvReader reader(in);
        if (!reader.readHeader())
            return std::vector<DetectionRecord>{};

        const auto timeCol = reader.column({"time_index"});
        const auto wardCol = reader.column({"sward_name", "sensor_id"});
        const auto idCol = reader.column({"mac_address", "identifier"});
        const auto typeCol = reader.column({"type", "device_class"});
        const auto rssiCol = reader.column({"rssi", "signal_strength"});

        for (auto [col, what] : {std::pair{timeCol, "time_index"}, std::pair{wardCol, "sward_name"},
                                 std::pair{idCol, "mac_address"}, std::pair{typeCol, "type"},
                                 std::pair{rssiCol, "rssi"}})
        {
            if (!col)
            {
                std::cerr << "[Dataset] Detection table: " << missingColumn(reader, what) << "\n";
                return std::nullopt;
            }
        }

        std::vector<DetectionRecord> out;
        std::vector<std::string> fields;
        while (reader.next(fields))
        {
            ++report.rows_read;
            if (!fieldsCover(fields, {*timeCol, *wardCol, *idCol, *typeCol, *rssiCol}))
            {
                report.skip(reader.line(), "too few fields");
                continue;
            }

            const auto t = parseInt(fields[*timeCol]);
            const auto dc = parseInt(fields[*typeCol]);
            const auto rssi = parseDouble(fields[*rssiCol]);
            if (!t || !dc || !rssi || fields[*wardCol].empty() || fields[*idCol].empty())
            {
                report.skip(reader.line(), "unparsable detection");
                continue;
            }
            if (range && !range->contains(*t))
                continue;

            out.push_back({*t, fields[*wardCol], fields[*idCol], *dc, *rssi});
        }
        return out;
    }

    std::optional<std::vector<WardConfig>> loadWards(const fs::path &file, LoadReport &report)
    {
        std::ifstream in(file);
        if (!in.is_open())
        {
            std::cerr << "[Dataset] Cannot open " << file.string() << "\n";
            return std::nullopt;
        }
        return readWards(in, report);
    }

    std::optional<std::vector<DetectionRecord>> loadDetections(const fs::path &file, LoadReport &report,
                                                               std::optional<TimeRange> range)
    {
        std::ifstream in(file);
        if (!in.is_open())
        {
            std::cerr << "[Dataset] Cannot open " << file.string() << "\n";
            return std::nullopt;
        }
        return readDetections(in, report, range);
    }

    StoreCatalog::StoreCatalog(fs::path root) : m_root(std::move(root)) {}

    std::optional<StoreCatalog> StoreCatalog::scan(const fs::path &root)
    {
        std::error_code ec;
        if (!fs::is_directory(root, ec))
        {
            std::cerr << "[Dataset] Data folder not found: " << root.string() << "\n";
            return std::nullopt;
        }

        StoreCatalog catalog(root);
        for (const auto &entry : fs::directory_iterator(root, ec))
        {
            const std::string name = entry.path().filename().string();
            if (!entry.is_directory() || name.empty() || name.front() == '.')
                continue;

            StoreInfo info;
            info.name = name;
            info.path = entry.path();
            info.has_wards = fs::exists(entry.path() / WardFile);

            const std::string suffix = DaySuffix;
            std::error_code storeEc;
            for (const auto &file : fs::directory_iterator(entry.path(), storeEc))
            {
                const std::string fname = file.path().filename().string();
                if (!file.is_regular_file() || fname.size() <= suffix.size() ||
                    fname.compare(fname.size() - suffix.size(), suffix.size(), suffix) != 0)
                    continue;
                try
                {
                    info.dates.push_back(timebase::parseDate(fname.substr(0, fname.size() - suffix.size())));
                }
                catch (const std::invalid_argument &e)
                {
                    std::cerr << "[Dataset] Ignoring " << fname << ": " << e.what() << "\n";
                }
            }
            if (storeEc)
                std::cerr << "[Dataset] Cannot list " << entry.path().string() << ": " << storeEc.message() << "\n";
            std::sort(info.dates.begin(), info.dates.end());
            catalog.m_stores.push_back(std::move(info));
        }

        if (ec)
        {
            std::cerr << "[Dataset] Cannot list " << root.string() << ": " << ec.message() << "\n";
            return std::nullopt;
        }

        std::sort(catalog.m_stores.begin(), catalog.m_stores.end(), [](const StoreInfo &a, const StoreInfo &b)
                  { return a.name < b.name; });
        return catalog;
    }

    const StoreInfo *StoreCatalog::find(const std::string &name) const
    {
        auto it = std::find_if(m_stores.begin(), m_stores.end(), [&name](const StoreInfo &s)
                               { return s.name == name; });
        return it == m_stores.end() ? nullptr : &*it;
    }

    std::vector<std::chrono::year_month_day> StoreCatalog::commonDates(const std::vector<std::string> &names) const
    {
        std::vector<const StoreInfo *> selected;
        if (names.empty())
        {
            for (const auto &s : m_stores)
                selected.push_back(&s);
        }
        else
        {
            for (const auto &n : names)
            {
                const StoreInfo *s = find(n);
                if (!s)
                    return {};
                selected.push_back(s);
            }
        }
        if (selected.empty())
            return {};

        std::vector<std::chrono::year_month_day> common = selected.front()->dates;
        for (std::size_t i = 1; i < selected.size(); ++i)
        {
            std::vector<std::chrono::year_month_day> next;
            std::set_intersection(common.begin(), common.end(),
                                  selected[i]->dates.begin(), selected[i]->dates.end(),
                                  std::back_inserter(next));
            common = std::move(next);
        }
        return common;
    }

    std::optional<std::vector<WardConfig>> StoreCatalog::loadWards(const std::string &store, LoadReport &report) const
    {
        const StoreInfo *s = find(store);
        if (!s || !s->has_wards)
        {
            std::cerr << "[Dataset] No " << WardFile << " for store " << store << "\n";
            return std::nullopt;
        }
        return dataset::loadWards(s->path / WardFile, report);
    }

    std::optional<std::vector<DetectionRecord>> StoreCatalog::loadDay(const std::string &store,
                                                                      const std::chrono::year_month_day &date,
                                                                      LoadReport &report,
                                                                      std::optional<TimeRange> range) const
    {
        const StoreInfo *s = find(store);
        if (!s)
        {
            std::cerr << "[Dataset] Unknown store " << store << "\n";
            return std::nullopt;
        }
        return loadDetections(dayFile(s->path, date), report, range);
    }

    fs::path StoreCatalog::dayFile(const fs::path &storeDir, const std::chrono::year_month_day &date)
    {
        return storeDir / (timebase::formatDate(date) + DaySuffix);
    }

} // namespace footfall::dataset
