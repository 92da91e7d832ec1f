#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <Eigen/Core>

namespace footfall
{
    // Day-relative time bucket, one unit = 10 seconds.
    using TimeIndex = int;
    using DeviceClass = int;

    namespace device
    {
        constexpr DeviceClass iPhone = 1;
        constexpr DeviceClass Android = 10;
        constexpr DeviceClass TWard = 32;
        constexpr DeviceClass Trace = 101;
    } // namespace device

    // One raw RSSI reading of one identifier by one ward.
    struct DetectionRecord
    {
        TimeIndex time_index{0};
        std::string sensor_id;
        std::string identifier;
        DeviceClass device_class{0};
        double signal_strength{0.0}; // dBm
    };

    // Fixed BLE receiver at a known planar coordinate.
    struct WardConfig
    {
        std::string id;
        Eigen::Vector2d position{Eigen::Vector2d::Zero()};
        std::string label;
    };

    // Smoothed planar estimate for one identifier at one time slice.
    struct PositionEstimate
    {
        TimeIndex time_index{0};
        std::string identifier;
        DeviceClass device_class{0};
        Eigen::Vector2d position{Eigen::Vector2d::Zero()};
        int sensor_count{0};
    };

    // Per-identifier summary over one day, only used as stitching input.
    struct IdentifierFeatures
    {
        std::string identifier;
        DeviceClass device_class{0};
        TimeIndex first_time{0};
        TimeIndex last_time{0};
        int appearances{0};

        Eigen::Vector2d first_position{Eigen::Vector2d::Zero()};
        Eigen::Vector2d last_position{Eigen::Vector2d::Zero()};
        Eigen::Vector2d mean_position{Eigen::Vector2d::Zero()};
        Eigen::Vector2d std_position{Eigen::Vector2d::Zero()}; // population stddev per axis

        double path_length{0.0};
        double lifetime_seconds{0.0};
    };

    struct CandidatePair
    {
        std::string identifier_a;
        std::string identifier_b;
        TimeIndex time_gap{0}; // b.first - a.last
        TimeIndex overlap_time{0};
    };

    struct ScoredLink
    {
        std::string identifier_a;
        std::string identifier_b;
        double score{0.0};
    };

    // One believed physical device across its rotating identifiers.
    struct Journey
    {
        std::string journey_id;
        std::vector<std::string> member_identifiers;
        DeviceClass device_class{0};
        TimeIndex first_time{0};
        TimeIndex last_time{0};
        double lifetime_seconds{0.0};
        int appearance_count{0};
    };

    enum class VisitorType
    {
        Visit,
        PassBy
    };

    struct ClassificationRecord
    {
        std::string subject_id;
        VisitorType visitor_type{VisitorType::PassBy};
        double dwell_minutes{0.0};
        double mean_signal{0.0};
        double signal_stddev{0.0};
        int appearance_count{0};
        DeviceClass device_class{0};
        double threshold_used{0.0};

        TimeIndex first_time{0};
        TimeIndex last_time{0};
        int member_count{1};
    };

    struct ConversionStats
    {
        int total_traffic{0};
        int pass_by_count{0};
        int visit_count{0};
        double conversion_rate{0.0};
        double avg_dwell_pass_by{0.0};
        double avg_dwell_visit{0.0};
    };

    struct HourlyConversion
    {
        int hour{0};
        ConversionStats stats{};
    };

    // Each peak is chosen independently; they need not agree.
    struct PeakHours
    {
        std::optional<int> traffic_hour;
        std::optional<int> visit_hour;
        std::optional<int> conversion_hour;
    };

    struct VisitorStats
    {
        int total_subjects{0};
        int visitors{0};
        int passers_by{0};
        double visitor_ratio{0.0};
        double avg_dwell_visitors{0.0};
        double avg_dwell_passers{0.0};
        double avg_signal_visitors{0.0};
        double avg_signal_passers{0.0};
        double avg_members_per_visitor{0.0};
        double avg_members_per_passer{0.0};
    };

    struct WeekdayConversion
    {
        int weekday{0}; // 0 = Monday
        int day_count{0};
        double avg_conversion_rate{0.0};
        double avg_visit_count{0.0};
    };

    using DeviceClassHistogram = std::map<DeviceClass, int>;
} // namespace footfall
