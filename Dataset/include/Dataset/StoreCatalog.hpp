#pragma once

#include <Footfall/Records.hpp>
#include <Dataset/CsvReader.hpp>

#include <chrono>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace footfall::dataset
{
    // Inclusive time_index range.
    struct TimeRange
    {
        TimeIndex first{0};
        TimeIndex last{0};

        [[nodiscard]] bool contains(TimeIndex t) const noexcept { return t >= first && t <= last; }
    };

    /// Ward table: name | sward_id | sensor_id, x, y and an optional description.
    /// std::nullopt when a required column is missing.
    std::optional<std::vector<WardConfig>> readWards(std::istream &in, LoadReport &report);

    /// Detection extract: time_index, sward_name | sensor_id, mac_address | identifier,
    /// type | device_class, rssi | signal_strength. std::nullopt when a required column is missing.
    std::optional<std::vector<DetectionRecord>> readDetections(std::istream &in, LoadReport &report,
                                                               std::optional<TimeRange> range = std::nullopt);

    std::optional<std::vector<WardConfig>> loadWards(const std::filesystem::path &file, LoadReport &report);
    std::optional<std::vector<DetectionRecord>> loadDetections(const std::filesystem::path &file, LoadReport &report,
                                                               std::optional<TimeRange> range = std::nullopt);

    struct StoreInfo
    {
        std::string name;
        std::filesystem::path path;
        bool has_wards{false};
        std::vector<std::chrono::year_month_day> dates; // sorted
    };

    // Data root layout: one folder per store holding swards.csv and YYYY-MM-DD_parsing.csv extracts.
    class StoreCatalog
    {
    public:
        static constexpr const char *WardFile = "swards.csv";
        static constexpr const char *DaySuffix = "_parsing.csv";

        /// std::nullopt when root is not a readable directory.
        static std::optional<StoreCatalog> scan(const std::filesystem::path &root);

        [[nodiscard]] const std::filesystem::path &root() const noexcept { return m_root; }
        // Sorted by name
        [[nodiscard]] const std::vector<StoreInfo> &stores() const noexcept { return m_stores; }
        [[nodiscard]] const StoreInfo *find(const std::string &name) const;

        /// Dates present for every named store (all stores when names is empty).
        [[nodiscard]] std::vector<std::chrono::year_month_day> commonDates(const std::vector<std::string> &names = {}) const;

        std::optional<std::vector<WardConfig>> loadWards(const std::string &store, LoadReport &report) const;
        std::optional<std::vector<DetectionRecord>> loadDay(const std::string &store,
                                                            const std::chrono::year_month_day &date,
                                                            LoadReport &report,
                                                            std::optional<TimeRange> range = std::nullopt) const;

        static std::filesystem::path dayFile(const std::filesystem::path &storeDir,
                                             const std::chrono::year_month_day &date);

    private:
        explicit StoreCatalog(std::filesystem::path root);

        std::filesystem::path m_root;
        std::vector<StoreInfo> m_stores;
    };

} // namespace footfall::dataset
