#pragma once

namespace footfall::signal
{
    struct SignalModelConfig
    {
        // Piecewise-linear distance reference points
        double nearRssi = -60.0;   // dBm
        double nearDistance = 2.0; // distance at or above nearRssi
        double farRssi = -80.0;    // dBm
        double farDistance = 10.0; // distance at or below farRssi

        // Fusion weight normalization range
        double strongRssi = -40.0;
        double weakRssi = -100.0;
        double weightOffset = 0.1; // bounds the weight at 1 / weightOffset
    };

    // Maps received signal strength to an estimated distance and a position-fusion weight.
    // Stateless; safe to share between threads.
    class SignalModel
    {
    public:
        explicit SignalModel(const SignalModelConfig &config = {});

        /// Clamped to [nearDistance, farDistance], non-increasing in rssi.
        [[nodiscard]] double distance(double rssi) const noexcept;

        /// In (0, 1 / weightOffset], non-decreasing in rssi.
        [[nodiscard]] double weight(double rssi) const noexcept;

        [[nodiscard]] const SignalModelConfig &config() const noexcept { return m_config; }

    private:
        SignalModelConfig m_config;
    };

    // Default-calibrated helpers
    double rssiToDistance(double rssi) noexcept;
    double rssiToWeight(double rssi) noexcept;

} // namespace footfall::signal
