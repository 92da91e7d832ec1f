#include <SignalModel/SignalModel.hpp>

#include <algorithm>
#include <stdexcept>

namespace footfall::signal
{
    SignalModel::SignalModel(const SignalModelConfig &config) : m_config(config)
    {
        if (!(m_config.nearRssi > m_config.farRssi))
            throw std::invalid_argument("SignalModelConfig: nearRssi must be stronger than farRssi");
        if (!(m_config.nearDistance > 0.0) || !(m_config.farDistance >= m_config.nearDistance))
            throw std::invalid_argument("SignalModelConfig: distances must satisfy 0 < nearDistance <= farDistance");
        if (!(m_config.strongRssi > m_config.weakRssi))
            throw std::invalid_argument("SignalModelConfig: strongRssi must be stronger than weakRssi");
        if (!(m_config.weightOffset > 0.0))
            throw std::invalid_argument("SignalModelConfig: weightOffset must be positive");
    }

    double SignalModel::distance(double rssi) const noexcept
    {
        if (rssi >= m_config.nearRssi)
            return m_config.nearDistance;
        if (rssi <= m_config.farRssi)
            return m_config.farDistance;

        const double t = (m_config.nearRssi - rssi) / (m_config.nearRssi - m_config.farRssi);
        return m_config.nearDistance + (m_config.farDistance - m_config.nearDistance) * t;
    }

    double SignalModel::weight(double rssi) const noexcept
    {
        // 0 for the strongest signal, 1 for the weakest
        double normalized = (m_config.strongRssi - rssi) / (m_config.strongRssi - m_config.weakRssi);
        normalized = std::clamp(normalized, 0.0, 1.0);

        return 1.0 / (normalized + m_config.weightOffset);
    }

    double rssiToDistance(double rssi) noexcept
    {
        static const SignalModel model{};
        return model.distance(rssi);
    }

    double rssiToWeight(double rssi) noexcept
    {
        static const SignalModel model{};
        return model.weight(rssi);
    }

} // namespace footfall::signal
