#pragma once

#include <Report/StoreComparison.hpp>
#include <Report/StoreReport.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace footfall::report
{
    // Deterministic JSON text: fixed key order, fixed number formatting, stores in name order.
    struct JsonSerializer
    {
        static std::string toJson(const ConversionStats &s);
        static std::string toJson(const PeakHours &p);
        static std::string toJson(const HourlyConversion &h);
        static std::string toJson(const comparison::DwellCategories &c);
        static std::string toJson(const DailySummary &d);
        static std::string toJson(const AggregatedStats &a);
        static std::string toJson(const StoreProfile &p);
        static std::string toJson(const StoreReport &r);

        /// One object keyed by store name.
        static std::string toJson(const std::vector<StoreReport> &reports);

        static std::string toJson(const comparison::BasicStats &b);
        static std::string toJson(const StoreComparison &c);

        static std::string escape(std::string_view text);
        /// Six decimals; non-finite values become null.
        static std::string number(double value);
    };

    struct CacheConfig
    {
        std::filesystem::path outputFolder = "Cache";
        std::string fileName = "conversion_analysis_cache.json";
        std::string comparisonFileName = "store_comparison_cache.json";

        [[nodiscard]] std::filesystem::path cacheFile() const { return outputFolder / fileName; }
        [[nodiscard]] std::filesystem::path comparisonFile() const { return outputFolder / comparisonFileName; }
    };

    /// Writes the cache file, creating the output folder. False (and a console message) on failure.
    bool writeCache(const CacheConfig &config, const std::vector<StoreReport> &reports);

    /// Same as writeCache, for the cross-store comparison file.
    bool writeComparison(const CacheConfig &config, const StoreComparison &result);

} // namespace footfall::report
