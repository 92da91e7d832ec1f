#pragma once

#include <Footfall/Records.hpp>

#include <map>
#include <string>
#include <vector>

namespace footfall::classification
{
    struct SignalSample
    {
        TimeIndex time_index{0};
        double signal_strength{0.0};
    };

    // Everything a visit rule looks at: one identifier or one journey.
    // samples are sorted by time_index.
    struct Subject
    {
        std::string id;
        DeviceClass device_class{0};
        std::vector<SignalSample> samples;
        bool has_signal{true};

        TimeIndex first_time{0};
        TimeIndex last_time{0};
        int appearance_count{0};
        int member_count{1};
    };

    /// One subject per identifier (or per group when groupOf maps the identifier),
    /// sorted by id. Device class is taken from the subject's first record.
    std::vector<Subject> subjectsFromDetections(const std::vector<DetectionRecord> &detections,
                                                const std::map<std::string, std::string> &groupOf = {});

    /// One subject per identifier without signal samples.
    std::vector<Subject> subjectsFromPositions(const std::vector<PositionEstimate> &positions);

    /// One subject per journey. Samples come from the members' detections; time span and
    /// appearance count come from the journey itself.
    std::vector<Subject> subjectsFromJourneys(const std::vector<DetectionRecord> &detections,
                                              const std::vector<Journey> &journeys);

} // namespace footfall::classification
