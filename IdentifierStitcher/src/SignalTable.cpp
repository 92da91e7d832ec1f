#include <IdentifierStitcher/SignalTable.hpp>

namespace footfall::stitching
{
    SignalTable::SignalTable(const std::vector<DetectionRecord> &records)
    {
        for (const auto &r : records)
            add(r);
    }

    void SignalTable::add(const DetectionRecord &record)
    {
        // a repeated ward in the same slice keeps the latest reading
        m_vectors[{record.time_index, record.identifier}][record.sensor_id] = record.signal_strength;
    }

    const SignalTable::SignalVector *SignalTable::find(TimeIndex t, const std::string &identifier) const
    {
        auto it = m_vectors.find({t, identifier});
        return it == m_vectors.end() ? nullptr : &it->second;
    }

} // namespace footfall::stitching
