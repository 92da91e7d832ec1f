#pragma once

#include <Footfall/Records.hpp>
#include <IdentifierStitcher/SignalTable.hpp>

#include <map>
#include <string>
#include <vector>

namespace footfall::stitching
{
    struct SimilarityWeights
    {
        double signal = 0.60;
        double temporal = 0.15;
        double spatial = 0.15;
        double pattern = 0.05;
        double movement = 0.05;
    };

    struct StitcherConfig
    {
        int timeWindowSeconds = 60;
        double threshold = 0.6;

        // Skips signal-vector comparison and scores every pair's signal term as
        // fastModeSignalScore. Roughly 3x faster, noticeably less accurate.
        bool fastMode = false;
        double fastModeSignalScore = 0.7;

        // Only identifiers of these classes rotate; fixed tags never do.
        std::vector<DeviceClass> rotatingClasses{device::iPhone, device::Android};

        SimilarityWeights weights{};
        double signalDiffScale = 20.0;   // dB at which the signal term reaches 0
        double signalCapBelow = 0.5;     // weaker signal terms cap the whole score
        int minCommonSensors = 2;
        double spatialScale = 100.0;     // distance at which spatial terms reach 0
        double movementScale = 50.0;     // summed stddev difference at which the movement term reaches 0
    };

    struct SimilarityBreakdown
    {
        double signal{0.0};
        double temporal{0.0};
        double spatial{0.0};
        double pattern{0.0};
        double movement{0.0};
        double total{0.0};
        bool signalCapped{false};
    };

    struct StitchResult
    {
        std::vector<IdentifierFeatures> features;
        std::vector<CandidatePair> candidates;
        std::vector<ScoredLink> links; // best outgoing link per identifier, above threshold
        std::map<std::string, std::string> journeyOf; // identifier -> journey_id
        std::vector<Journey> journeys;
    };

    // Merges identifiers that belong to one physical device rotating its address.
    // Pipeline: features -> candidates -> scored best links -> journeys.
    class IdentifierStitcher
    {
    public:
        using SignalVector = SignalTable::SignalVector;

        explicit IdentifierStitcher(const StitcherConfig &config = {});

        /// Positions need not be sorted. One entry per identifier, sorted by identifier.
        std::vector<IdentifierFeatures> extractFeatures(const std::vector<PositionEstimate> &positions) const;

        /// Ordered pairs (a, b) of the same rotating class that share at least one time_index
        /// and where b starts no later than a.last + window. Sorted by (a, b).
        std::vector<CandidatePair> generateCandidates(const std::vector<IdentifierFeatures> &features,
                                                      const std::vector<PositionEstimate> &positions) const;

        /// Score in [0, 1]. signals may be null; the signal term is then 0 unless in fast mode.
        SimilarityBreakdown score(const IdentifierFeatures &a,
                                  const IdentifierFeatures &b,
                                  const CandidatePair &candidate,
                                  const SignalTable *signals) const;

        /// Mean absolute difference over wards both identifiers were heard on at time t,
        /// mapped to [0, 1]. 0 with fewer than minCommonSensors common wards.
        double signalSimilarity(const SignalVector &a, const SignalVector &b) const;

        /// Best link per source identifier. Ties go to the lexically smallest target.
        std::vector<ScoredLink> link(const std::vector<IdentifierFeatures> &features,
                                     const std::vector<CandidatePair> &candidates,
                                     const SignalTable *signals) const;

        /// Partition of all identifiers. A link adds its target to the source's journey
        /// only while the target has none, so two existing journeys are never merged.
        std::vector<Journey> buildJourneys(const std::vector<IdentifierFeatures> &features,
                                           const std::vector<ScoredLink> &links) const;

        StitchResult stitch(const std::vector<PositionEstimate> &positions,
                            const SignalTable *signals = nullptr) const;

        [[nodiscard]] const StitcherConfig &config() const noexcept { return m_config; }

    private:
        [[nodiscard]] bool isRotating(DeviceClass dc) const;

        StitcherConfig m_config;
    };

} // namespace footfall::stitching
