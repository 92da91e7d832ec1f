#include <IdentifierStitcher/IdentifierStitcher.hpp>
#include <TimeBase/TimeIndex.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <tuple>
#include <unordered_map>

namespace footfall::stitching
{
    namespace
    {
        // Latest time_index present in both sorted lists.
        std::optional<TimeIndex> latestCommon(const std::vector<TimeIndex> &a, const std::vector<TimeIndex> &b)
        {
            auto ia = a.rbegin();
            auto ib = b.rbegin();
            while (ia != a.rend() && ib != b.rend())
            {
                if (*ia == *ib)
                    return *ia;
                if (*ia > *ib)
                    ++ia;
                else
                    ++ib;
            }
            return std::nullopt;
        }

        std::string journeyName(std::size_t n)
        {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "J%04zu", n);
            return buf;
        }
    } // namespace

    IdentifierStitcher::IdentifierStitcher(const StitcherConfig &config) : m_config(config)
    {
        if (m_config.timeWindowSeconds <= 0)
            throw std::invalid_argument("StitcherConfig: timeWindowSeconds must be positive");
        if (!(m_config.threshold >= 0.0 && m_config.threshold <= 1.0))
            throw std::invalid_argument("StitcherConfig: threshold must be in [0, 1]");
        if (!(m_config.fastModeSignalScore >= 0.0 && m_config.fastModeSignalScore <= 1.0))
            throw std::invalid_argument("StitcherConfig: fastModeSignalScore must be in [0, 1]");
        if (!(m_config.signalDiffScale > 0.0) || !(m_config.spatialScale > 0.0) || !(m_config.movementScale > 0.0))
            throw std::invalid_argument("StitcherConfig: similarity scales must be positive");
        if (m_config.minCommonSensors < 1)
            throw std::invalid_argument("StitcherConfig: minCommonSensors must be at least 1");

        auto classes = m_config.rotatingClasses;
        std::sort(classes.begin(), classes.end());
        if (std::adjacent_find(classes.begin(), classes.end()) != classes.end())
            throw std::invalid_argument("StitcherConfig: rotatingClasses must not repeat a class");

        const auto &w = m_config.weights;
        if (w.signal < 0.0 || w.temporal < 0.0 || w.spatial < 0.0 || w.pattern < 0.0 || w.movement < 0.0)
            throw std::invalid_argument("StitcherConfig: similarity weights must not be negative");
        const double sum = w.signal + w.temporal + w.spatial + w.pattern + w.movement;
        if (std::abs(sum - 1.0) > 1e-9)
            throw std::invalid_argument("StitcherConfig: similarity weights must sum to 1");
    }

    bool IdentifierStitcher::isRotating(DeviceClass dc) const
    {
        return std::find(m_config.rotatingClasses.begin(), m_config.rotatingClasses.end(), dc) !=
               m_config.rotatingClasses.end();
    }

    std::vector<IdentifierFeatures> IdentifierStitcher::extractFeatures(const std::vector<PositionEstimate> &positions) const
    {
        std::vector<std::size_t> order(positions.size());
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b)
                         { return std::tie(positions[a].identifier, positions[a].time_index) <
                                  std::tie(positions[b].identifier, positions[b].time_index); });

        std::vector<IdentifierFeatures> features;
        std::size_t i = 0;
        while (i < order.size())
        {
            const auto &head = positions[order[i]];
            std::size_t j = i;
            while (j < order.size() && positions[order[j]].identifier == head.identifier)
                ++j;

            IdentifierFeatures f;
            f.identifier = head.identifier;
            f.device_class = head.device_class;
            f.first_time = head.time_index;
            f.last_time = positions[order[j - 1]].time_index;
            f.appearances = static_cast<int>(j - i);
            f.first_position = head.position;
            f.last_position = positions[order[j - 1]].position;

            Eigen::Vector2d sum = Eigen::Vector2d::Zero();
            for (std::size_t k = i; k < j; ++k)
            {
                const auto &p = positions[order[k]].position;
                sum += p;
                if (k > i)
                    f.path_length += (p - positions[order[k - 1]].position).norm();
            }
            f.mean_position = sum / static_cast<double>(f.appearances);

            if (f.appearances > 1)
            {
                Eigen::Vector2d sq = Eigen::Vector2d::Zero();
                for (std::size_t k = i; k < j; ++k)
                    sq += (positions[order[k]].position - f.mean_position).cwiseAbs2();
                f.std_position = (sq / static_cast<double>(f.appearances)).cwiseSqrt();
            }

            f.lifetime_seconds = static_cast<double>(timebase::toSeconds(f.last_time - f.first_time).count());
            features.push_back(std::move(f));
            i = j;
        }
        return features;
    }

    std::vector<CandidatePair> IdentifierStitcher::generateCandidates(const std::vector<IdentifierFeatures> &features,
                                                                      const std::vector<PositionEstimate> &positions) const
    {
        std::vector<CandidatePair> candidates;

        std::unordered_map<std::string, std::vector<TimeIndex>> activeTimes;
        for (const auto &p : positions)
        {
            if (isRotating(p.device_class))
                activeTimes[p.identifier].push_back(p.time_index);
        }
        for (auto &[id, times] : activeTimes)
        {
            std::sort(times.begin(), times.end());
            times.erase(std::unique(times.begin(), times.end()), times.end());
        }

        const double windowUnits = static_cast<double>(m_config.timeWindowSeconds) / timebase::TimeUnitSeconds;

        auto tryPair = [&](const IdentifierFeatures &a, const IdentifierFeatures &b, TimeIndex overlap)
        {
            if (b.first_time > a.last_time + windowUnits)
                return;
            candidates.push_back({a.identifier, b.identifier, b.first_time - a.last_time, overlap});
        };

        for (DeviceClass dc : m_config.rotatingClasses)
        {
            std::vector<const IdentifierFeatures *> group;
            for (const auto &f : features)
            {
                if (f.device_class == dc && activeTimes.count(f.identifier))
                    group.push_back(&f);
            }
            if (group.size() < 2)
                continue;

            // Sweep by first appearance; only intervals still open can share a time_index.
            std::sort(group.begin(), group.end(), [](const IdentifierFeatures *a, const IdentifierFeatures *b)
                      { return std::tie(a->first_time, a->identifier) < std::tie(b->first_time, b->identifier); });

            std::vector<const IdentifierFeatures *> open;
            for (const auto *incoming : group)
            {
                open.erase(std::remove_if(open.begin(), open.end(), [&](const IdentifierFeatures *f)
                                          { return f->last_time < incoming->first_time; }),
                           open.end());

                const auto &incomingTimes = activeTimes.at(incoming->identifier);
                for (const auto *other : open)
                {
                    auto overlap = latestCommon(activeTimes.at(other->identifier), incomingTimes);
                    if (!overlap)
                        continue;
                    tryPair(*other, *incoming, *overlap);
                    tryPair(*incoming, *other, *overlap);
                }
                open.push_back(incoming);
            }
        }

        std::sort(candidates.begin(), candidates.end(), [](const CandidatePair &a, const CandidatePair &b)
                  { return std::tie(a.identifier_a, a.identifier_b) < std::tie(b.identifier_a, b.identifier_b); });
        return candidates;
    }

    double IdentifierStitcher::signalSimilarity(const SignalVector &a, const SignalVector &b) const
    {
        double diffSum = 0.0;
        int common = 0;
        for (const auto &[sensor, rssiA] : a)
        {
            auto it = b.find(sensor);
            if (it == b.end())
                continue;
            diffSum += std::abs(rssiA - it->second);
            ++common;
        }

        if (common < m_config.minCommonSensors)
            return 0.0;

        const double meanDiff = diffSum / common;
        return std::max(0.0, 1.0 - meanDiff / m_config.signalDiffScale);
    }

    SimilarityBreakdown IdentifierStitcher::score(const IdentifierFeatures &a,
                                                  const IdentifierFeatures &b,
                                                  const CandidatePair &candidate,
                                                  const SignalTable *signals) const
    {
        SimilarityBreakdown s;

        if (m_config.fastMode)
        {
            s.signal = m_config.fastModeSignalScore;
        }
        else
        {
            if (signals)
            {
                const auto *va = signals->find(candidate.overlap_time, a.identifier);
                const auto *vb = signals->find(candidate.overlap_time, b.identifier);
                if (va && vb)
                    s.signal = signalSimilarity(*va, *vb);
            }

            // Weak signal agreement overrides spatial and temporal plausibility.
            if (s.signal < m_config.signalCapBelow)
            {
                s.signalCapped = true;
                s.total = s.signal * m_config.signalCapBelow;
                return s;
            }
        }

        const double gapSeconds = static_cast<double>(timebase::toSeconds(candidate.time_gap).count());
        s.temporal = std::max(0.0, 1.0 - std::abs(gapSeconds) / m_config.timeWindowSeconds);
        s.spatial = std::max(0.0, 1.0 - (b.first_position - a.last_position).norm() / m_config.spatialScale);
        s.pattern = std::max(0.0, 1.0 - (b.mean_position - a.mean_position).norm() / m_config.spatialScale);

        const double stdDiff = (a.std_position - b.std_position).cwiseAbs().sum();
        s.movement = std::max(0.0, 1.0 - stdDiff / m_config.movementScale);

        const auto &w = m_config.weights;
        s.total = w.signal * s.signal + w.temporal * s.temporal + w.spatial * s.spatial +
                  w.pattern * s.pattern + w.movement * s.movement;
        return s;
    }

    std::vector<ScoredLink> IdentifierStitcher::link(const std::vector<IdentifierFeatures> &features,
                                                     const std::vector<CandidatePair> &candidates,
                                                     const SignalTable *signals) const
    {
        std::unordered_map<std::string, const IdentifierFeatures *> byId;
        for (const auto &f : features)
            byId[f.identifier] = &f;

        std::map<std::string, ScoredLink> best;
        for (const auto &c : candidates)
        {
            auto ia = byId.find(c.identifier_a);
            auto ib = byId.find(c.identifier_b);
            if (ia == byId.end() || ib == byId.end())
                continue;

            const double total = score(*ia->second, *ib->second, c, signals).total;
            if (total < m_config.threshold)
                continue;

            auto it = best.find(c.identifier_a);
            if (it == best.end())
            {
                best.emplace(c.identifier_a, ScoredLink{c.identifier_a, c.identifier_b, total});
                continue;
            }

            auto &current = it->second;
            if (total > current.score || (total == current.score && c.identifier_b < current.identifier_b))
            {
                current.identifier_b = c.identifier_b;
                current.score = total;
            }
        }

        std::vector<ScoredLink> links;
        links.reserve(best.size());
        for (auto &[id, l] : best)
            links.push_back(std::move(l));
        return links;
    }

    std::vector<Journey> IdentifierStitcher::buildJourneys(const std::vector<IdentifierFeatures> &features,
                                                           const std::vector<ScoredLink> &links) const
    {
        std::unordered_map<std::string, std::size_t> index;
        for (std::size_t i = 0; i < features.size(); ++i)
            index[features[i].identifier] = i;

        // Links are walked by source identifier. A link only extends the source's
        // group with a target that has no group yet; existing groups never merge.
        std::vector<const ScoredLink *> ordered;
        ordered.reserve(links.size());
        for (const auto &l : links)
            ordered.push_back(&l);
        std::stable_sort(ordered.begin(), ordered.end(), [](const ScoredLink *a, const ScoredLink *b)
                         { return a->identifier_a < b->identifier_a; });

        constexpr std::size_t unassigned = static_cast<std::size_t>(-1);
        std::vector<std::size_t> groupOf(features.size(), unassigned);
        std::size_t groupCount = 0;
        for (const auto *l : ordered)
        {
            auto ia = index.find(l->identifier_a);
            auto ib = index.find(l->identifier_b);
            if (ia == index.end() || ib == index.end())
                continue;

            if (groupOf[ia->second] == unassigned)
                groupOf[ia->second] = groupCount++;
            if (groupOf[ib->second] == unassigned)
                groupOf[ib->second] = groupOf[ia->second];
        }
        for (auto &g : groupOf)
        {
            if (g == unassigned)
                g = groupCount++;
        }

        std::map<std::size_t, std::vector<const IdentifierFeatures *>> groups;
        for (std::size_t i = 0; i < features.size(); ++i)
            groups[groupOf[i]].push_back(&features[i]);

        std::vector<Journey> journeys;
        journeys.reserve(groups.size());
        for (auto &[group, members] : groups)
        {
            std::sort(members.begin(), members.end(), [](const IdentifierFeatures *a, const IdentifierFeatures *b)
                      { return std::tie(a->first_time, a->identifier) < std::tie(b->first_time, b->identifier); });

            Journey j;
            j.device_class = members.front()->device_class;
            j.first_time = members.front()->first_time;
            j.last_time = members.front()->last_time;
            for (const auto *m : members)
            {
                j.member_identifiers.push_back(m->identifier);
                j.first_time = std::min(j.first_time, m->first_time);
                j.last_time = std::max(j.last_time, m->last_time);
                j.appearance_count += m->appearances;
            }
            j.lifetime_seconds = static_cast<double>(timebase::toSeconds(j.last_time - j.first_time).count());
            journeys.push_back(std::move(j));
        }

        // Number journeys by first appearance so ids are stable across runs.
        std::sort(journeys.begin(), journeys.end(), [](const Journey &a, const Journey &b)
                  { return std::tie(a.first_time, a.member_identifiers.front()) <
                           std::tie(b.first_time, b.member_identifiers.front()); });
        for (std::size_t i = 0; i < journeys.size(); ++i)
            journeys[i].journey_id = journeyName(i + 1);

        return journeys;
    }

    StitchResult IdentifierStitcher::stitch(const std::vector<PositionEstimate> &positions,
                                            const SignalTable *signals) const
    {
        StitchResult result;
        result.features = extractFeatures(positions);
        result.candidates = generateCandidates(result.features, positions);
        result.links = link(result.features, result.candidates, signals);
        result.journeys = buildJourneys(result.features, result.links);

        for (const auto &j : result.journeys)
        {
            for (const auto &id : j.member_identifiers)
                result.journeyOf[id] = j.journey_id;
        }
        return result;
    }

} // namespace footfall::stitching
