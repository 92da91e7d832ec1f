#pragma once

#include <Footfall/Records.hpp>
#include <SignalModel/SignalModel.hpp>
#include <Eigen/Core>

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace footfall::localization
{
    struct LocalizerConfig
    {
        double alpha = 0.3; // EMA weight of the new raw estimate
        bool applySmoothing = true;
        std::uint32_t seed = 20251110u; // single-ward heading draws
        double minHeadingDistance = 0.1; // previous position closer than this to the ward gives no heading
        signal::SignalModelConfig signal{};
    };

    // Static ward table of one location. Readings from unknown wards are unusable.
    class WardLayout
    {
    public:
        WardLayout() = default;
        explicit WardLayout(const std::vector<WardConfig> &wards);

        void add(const WardConfig &ward);

        [[nodiscard]] const WardConfig *find(const std::string &id) const;
        [[nodiscard]] bool contains(const std::string &id) const { return find(id) != nullptr; }
        [[nodiscard]] std::size_t size() const noexcept { return m_wards.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_wards.empty(); }

        // Sorted by id
        [[nodiscard]] std::vector<WardConfig> wards() const;

    private:
        std::unordered_map<std::string, WardConfig> m_wards;
    };

    struct WardReading
    {
        std::string sensor_id;
        double signal_strength{0.0};
    };

    struct RawFix
    {
        Eigen::Vector2d position{Eigen::Vector2d::Zero()};
        int sensor_count{0};
    };

    // Carry-over between time slices of one localization run: the last smoothed position
    // per identifier and the generator for single-ward headings. Construct one per
    // store-day and discard it afterwards.
    class SmoothingState
    {
    public:
        explicit SmoothingState(std::uint32_t seed = LocalizerConfig{}.seed);

        [[nodiscard]] std::optional<Eigen::Vector2d> previous(const std::string &identifier) const;
        void remember(const std::string &identifier, const Eigen::Vector2d &position);

        [[nodiscard]] std::size_t size() const noexcept { return m_previous.size(); }
        std::mt19937 &rng() noexcept { return m_rng; }

    private:
        std::unordered_map<std::string, Eigen::Vector2d> m_previous;
        std::mt19937 m_rng;
    };

    class DeviceLocalizer
    {
    public:
        DeviceLocalizer(const LocalizerConfig &config, WardLayout layout);

        /// Throws std::invalid_argument on a config the constructor would reject.
        static void validate(const LocalizerConfig &config);

        /// Fuses the readings of one identifier in one time slice. Unknown wards are skipped;
        /// std::nullopt when no usable reading remains.
        std::optional<RawFix> rawPosition(const std::string &identifier,
                                          const std::vector<WardReading> &readings,
                                          SmoothingState &state) const;

        /// smoothed = alpha * raw + (1 - alpha) * previous; the first fix passes through.
        Eigen::Vector2d smooth(const std::string &identifier,
                               const Eigen::Vector2d &raw,
                               SmoothingState &state) const;

        /// One estimate per (identifier, time_index) with a usable reading,
        /// sorted by (identifier, time_index).
        std::vector<PositionEstimate> localize(const std::vector<DetectionRecord> &records,
                                               SmoothingState &state) const;

        /// Same as above with a fresh state seeded from the config.
        std::vector<PositionEstimate> localize(const std::vector<DetectionRecord> &records) const;

        [[nodiscard]] const WardLayout &layout() const noexcept { return m_layout; }
        [[nodiscard]] const signal::SignalModel &signalModel() const noexcept { return m_signal; }

    private:
        Eigen::Vector2d singleWard(const std::string &identifier,
                                   const WardConfig &ward,
                                   double rssi,
                                   SmoothingState &state) const;
        Eigen::Vector2d twoWards(const WardConfig &a, double rssiA,
                                 const WardConfig &b, double rssiB) const;
        Eigen::Vector2d weightedCentroid(const std::vector<std::pair<const WardConfig *, double>> &usable) const;

        LocalizerConfig m_config;
        WardLayout m_layout;
        signal::SignalModel m_signal;
    };

} // namespace footfall::localization
