// src/pipeline/records.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "can/decoded_signal.hpp"

namespace pipeline {

// Observed vs expected frame count for one (window, arbitration id, channel)
struct QualityWindow {
    double window_start = 0.0;
    double window_end = 0.0;
    uint32_t arbitration_id = 0;
    std::string message_name;
    std::string channel;
    uint64_t message_count = 0;
    int64_t expected_count = 0;
    double expected_period_ms = 0.0;
    // 1 - message_count / expected_count. Negative on bursts; never clamped.
    double missing_rate = 0.0;
    double first_ts = 0.0;
    double last_ts = 0.0;
    std::string source_id;
};

// One fused sample per bucket per source. Each field is the last value
// observed (by timestamp) in the bucket; unset if no message carried it.
struct AggregatedSample {
    double timestamp = 0.0;   // bucket start (or end, for end-labelled views)
    std::optional<double> speed_kmh;
    std::optional<double> rpm;
    std::optional<double> throttle_pct;
    std::optional<double> brake_pressure;
    std::optional<bool> brake_active;
    std::optional<double> steering_angle;
    std::string source_id;

    // Fields outside the six dashboard columns, same merge rule
    can::FieldMap extra;

    uint32_t contributing_signals = 0;
};

enum class EventType {
    HardBrake,
    HardAcceleration,
    SharpTurn
};

inline const char* to_string(EventType t) {
    switch (t) {
        case EventType::HardBrake: return "hard_brake";
        case EventType::HardAcceleration: return "hard_acceleration";
        case EventType::SharpTurn: return "sharp_turn";
    }
    return "unknown";
}

// Derived from two adjacent samples of one source; values are the later sample's
struct Event {
    double timestamp = 0.0;
    EventType event_type = EventType::HardBrake;
    std::optional<double> speed_kmh;
    std::optional<double> acceleration_kmh_s;
    std::optional<double> steering_angle;
    std::optional<double> steering_angle_delta;
    std::optional<double> brake_pressure;
    std::string source_id;
};

// Per (UTC date, source_id)
struct VehicleStats {
    std::string date;   // YYYY-MM-DD
    std::string source_id;
    std::optional<double> avg_speed_kmh;
    std::optional<double> max_speed_kmh;
    std::optional<double> avg_rpm;
    std::optional<double> max_rpm;
    double distance_km = 0.0;
    uint64_t sample_count = 0;
    double first_timestamp = 0.0;
    double last_timestamp = 0.0;
};

// Everything one push()/finish() produced
struct PipelineOutputs {
    std::vector<can::DecodedSignal> decoded;
    std::vector<QualityWindow> quality;
    std::vector<AggregatedSample> aggregated;
    std::vector<AggregatedSample> latest;
    std::vector<Event> events;
    std::vector<VehicleStats> stats;

    bool empty() const {
        return decoded.empty() && quality.empty() && aggregated.empty() &&
               latest.empty() && events.empty() && stats.empty();
    }

    void append(PipelineOutputs&& o);
};

} // namespace pipeline
