#pragma once

#include <Footfall/Records.hpp>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace footfall::stitching
{
    // Per-ward signal vectors indexed by (time_index, identifier), built from raw detections.
    class SignalTable
    {
    public:
        using SignalVector = std::map<std::string, double>; // sensor_id -> dBm

        SignalTable() = default;
        explicit SignalTable(const std::vector<DetectionRecord> &records);

        void add(const DetectionRecord &record);

        /// nullptr when the identifier was not heard at that time.
        [[nodiscard]] const SignalVector *find(TimeIndex t, const std::string &identifier) const;

        [[nodiscard]] std::size_t size() const noexcept { return m_vectors.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_vectors.empty(); }

    private:
        std::map<std::pair<TimeIndex, std::string>, SignalVector> m_vectors;
    };

} // namespace footfall::stitching
