#include <VisitorClassifier/Subject.hpp>

#include <algorithm>
#include <unordered_map>

namespace footfall::classification
{
    namespace
    {
        void sortSamples(Subject &s)
        {
            std::stable_sort(s.samples.begin(), s.samples.end(), [](const SignalSample &a, const SignalSample &b)
                             { return a.time_index < b.time_index; });
        }

        void spanFromSamples(Subject &s)
        {
            if (s.samples.empty())
                return;
            s.first_time = s.samples.front().time_index;
            s.last_time = s.samples.back().time_index;
            s.appearance_count = static_cast<int>(s.samples.size());
        }
    } // namespace

    std::vector<Subject> subjectsFromDetections(const std::vector<DetectionRecord> &detections,
                                                const std::map<std::string, std::string> &groupOf)
    {
        std::map<std::string, Subject> byId;
        std::map<std::string, std::vector<std::string>> members;

        for (const auto &d : detections)
        {
            auto g = groupOf.find(d.identifier);
            const std::string &key = g == groupOf.end() ? d.identifier : g->second;

            auto [it, inserted] = byId.try_emplace(key);
            if (inserted)
            {
                it->second.id = key;
                it->second.device_class = d.device_class;
            }
            it->second.samples.push_back({d.time_index, d.signal_strength});

            auto &m = members[key];
            if (std::find(m.begin(), m.end(), d.identifier) == m.end())
                m.push_back(d.identifier);
        }

        std::vector<Subject> out;
        out.reserve(byId.size());
        for (auto &[id, s] : byId)
        {
            sortSamples(s);
            spanFromSamples(s);
            s.member_count = static_cast<int>(members[id].size());
            out.push_back(std::move(s));
        }
        return out;
    }

    std::vector<Subject> subjectsFromPositions(const std::vector<PositionEstimate> &positions)
    {
        std::map<std::string, Subject> byId;
        for (const auto &p : positions)
        {
            auto [it, inserted] = byId.try_emplace(p.identifier);
            if (inserted)
            {
                it->second.id = p.identifier;
                it->second.device_class = p.device_class;
                it->second.has_signal = false;
            }
            it->second.samples.push_back({p.time_index, 0.0});
        }

        std::vector<Subject> out;
        out.reserve(byId.size());
        for (auto &[id, s] : byId)
        {
            sortSamples(s);
            spanFromSamples(s);
            out.push_back(std::move(s));
        }
        return out;
    }

    std::vector<Subject> subjectsFromJourneys(const std::vector<DetectionRecord> &detections,
                                              const std::vector<Journey> &journeys)
    {
        std::unordered_map<std::string, std::size_t> slot;
        std::vector<Subject> out;
        out.reserve(journeys.size());

        for (const auto &j : journeys)
        {
            Subject s;
            s.id = j.journey_id;
            s.device_class = j.device_class;
            s.first_time = j.first_time;
            s.last_time = j.last_time;
            s.appearance_count = j.appearance_count;
            s.member_count = static_cast<int>(j.member_identifiers.size());

            for (const auto &id : j.member_identifiers)
                slot[id] = out.size();
            out.push_back(std::move(s));
        }

        for (const auto &d : detections)
        {
            auto it = slot.find(d.identifier);
            if (it != slot.end())
                out[it->second].samples.push_back({d.time_index, d.signal_strength});
        }

        for (auto &s : out)
            sortSamples(s);
        return out;
    }

} // namespace footfall::classification
