#include <DeviceLocalizer/DeviceLocalizer.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <tuple>

namespace footfall::localization
{
    WardLayout::WardLayout(const std::vector<WardConfig> &wards)
    {
        for (const auto &w : wards)
            add(w);
    }

    void WardLayout::add(const WardConfig &ward)
    {
        m_wards[ward.id] = ward;
    }

    const WardConfig *WardLayout::find(const std::string &id) const
    {
        auto it = m_wards.find(id);
        return it == m_wards.end() ? nullptr : &it->second;
    }

    std::vector<WardConfig> WardLayout::wards() const
    {
        std::vector<WardConfig> out;
        out.reserve(m_wards.size());
        for (const auto &[id, ward] : m_wards)
            out.push_back(ward);

        std::sort(out.begin(), out.end(), [](const WardConfig &a, const WardConfig &b)
                  { return a.id < b.id; });
        return out;
    }

    SmoothingState::SmoothingState(std::uint32_t seed) : m_rng(seed) {}

    std::optional<Eigen::Vector2d> SmoothingState::previous(const std::string &identifier) const
    {
        auto it = m_previous.find(identifier);
        if (it == m_previous.end())
            return std::nullopt;
        return it->second;
    }

    void SmoothingState::remember(const std::string &identifier, const Eigen::Vector2d &position)
    {
        m_previous[identifier] = position;
    }

    DeviceLocalizer::DeviceLocalizer(const LocalizerConfig &config, WardLayout layout)
        : m_config(config), m_layout(std::move(layout)), m_signal(config.signal)
    {
        validate(m_config);
    }

    void DeviceLocalizer::validate(const LocalizerConfig &config)
    {
        if (!(config.alpha > 0.0 && config.alpha <= 1.0))
            throw std::invalid_argument("LocalizerConfig: alpha must be in (0, 1]");
        if (config.minHeadingDistance < 0.0)
            throw std::invalid_argument("LocalizerConfig: minHeadingDistance must not be negative");
        signal::SignalModel check(config.signal);
        (void)check;
    }

    Eigen::Vector2d DeviceLocalizer::singleWard(const std::string &identifier,
                                                const WardConfig &ward,
                                                double rssi,
                                                SmoothingState &state) const
    {
        constexpr double pi = 3.14159265358979323846;
        const double range = m_signal.distance(rssi);

        // Continue the previous heading so a momentary single-ward slice does not jump.
        double angle = 0.0;
        bool hasHeading = false;
        if (auto prev = state.previous(identifier))
        {
            const Eigen::Vector2d offset = *prev - ward.position;
            if (offset.norm() > m_config.minHeadingDistance)
            {
                angle = std::atan2(offset.y(), offset.x());
                hasHeading = true;
            }
        }

        if (!hasHeading)
        {
            std::uniform_real_distribution<double> heading(0.0, 2.0 * pi);
            angle = heading(state.rng());
        }

        return ward.position + range * Eigen::Vector2d(std::cos(angle), std::sin(angle));
    }

    Eigen::Vector2d DeviceLocalizer::twoWards(const WardConfig &a, double rssiA,
                                              const WardConfig &b, double rssiB) const
    {
        // Inverse-distance weights pull the estimate toward the closer ward.
        const double wA = 1.0 / m_signal.distance(rssiA);
        const double wB = 1.0 / m_signal.distance(rssiB);
        return (a.position * wA + b.position * wB) / (wA + wB);
    }

    Eigen::Vector2d DeviceLocalizer::weightedCentroid(const std::vector<std::pair<const WardConfig *, double>> &usable) const
    {
        Eigen::Vector2d weighted = Eigen::Vector2d::Zero();
        double total = 0.0;
        for (const auto &[ward, rssi] : usable)
        {
            const double w = m_signal.weight(rssi);
            weighted += ward->position * w;
            total += w;
        }
        return weighted / total;
    }

    std::optional<RawFix> DeviceLocalizer::rawPosition(const std::string &identifier,
                                                       const std::vector<WardReading> &readings,
                                                       SmoothingState &state) const
    {
        std::vector<std::pair<const WardConfig *, double>> usable;
        usable.reserve(readings.size());
        for (const auto &r : readings)
        {
            if (const auto *ward = m_layout.find(r.sensor_id))
                usable.emplace_back(ward, r.signal_strength);
        }

        if (usable.empty())
            return std::nullopt;

        RawFix fix;
        fix.sensor_count = static_cast<int>(usable.size());

        switch (usable.size())
        {
        case 1:
            fix.position = singleWard(identifier, *usable[0].first, usable[0].second, state);
            break;
        case 2:
            fix.position = twoWards(*usable[0].first, usable[0].second, *usable[1].first, usable[1].second);
            break;
        default:
            fix.position = weightedCentroid(usable);
            break;
        }
        return fix;
    }

    Eigen::Vector2d DeviceLocalizer::smooth(const std::string &identifier,
                                            const Eigen::Vector2d &raw,
                                            SmoothingState &state) const
    {
        Eigen::Vector2d smoothed = raw;
        if (auto prev = state.previous(identifier))
            smoothed = m_config.alpha * raw + (1.0 - m_config.alpha) * (*prev);

        state.remember(identifier, smoothed);
        return smoothed;
    }

    std::vector<PositionEstimate> DeviceLocalizer::localize(const std::vector<DetectionRecord> &records,
                                                            SmoothingState &state) const
    {
        std::vector<PositionEstimate> out;
        if (records.empty())
            return out;

        // Walk (time_index, identifier) groups in time order so smoothing sees each
        // identifier's slices chronologically.
        std::vector<std::size_t> order(records.size());
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b)
                         { return std::tie(records[a].time_index, records[a].identifier) <
                                  std::tie(records[b].time_index, records[b].identifier); });

        std::vector<WardReading> readings;
        std::size_t i = 0;
        while (i < order.size())
        {
            const auto &head = records[order[i]];
            readings.clear();

            std::size_t j = i;
            while (j < order.size() &&
                   records[order[j]].time_index == head.time_index &&
                   records[order[j]].identifier == head.identifier)
            {
                const auto &r = records[order[j]];
                readings.push_back({r.sensor_id, r.signal_strength});
                ++j;
            }

            if (auto fix = rawPosition(head.identifier, readings, state))
            {
                PositionEstimate est;
                est.time_index = head.time_index;
                est.identifier = head.identifier;
                est.device_class = head.device_class;
                est.sensor_count = fix->sensor_count;

                if (m_config.applySmoothing)
                {
                    est.position = smooth(head.identifier, fix->position, state);
                }
                else
                {
                    est.position = fix->position;
                    state.remember(head.identifier, fix->position);
                }
                out.push_back(std::move(est));
            }

            i = j;
        }

        std::sort(out.begin(), out.end(), [](const PositionEstimate &a, const PositionEstimate &b)
                  { return std::tie(a.identifier, a.time_index) < std::tie(b.identifier, b.time_index); });
        return out;
    }

    std::vector<PositionEstimate> DeviceLocalizer::localize(const std::vector<DetectionRecord> &records) const
    {
        SmoothingState state(m_config.seed);
        return localize(records, state);
    }

} // namespace footfall::localization
