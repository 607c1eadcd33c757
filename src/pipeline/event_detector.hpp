// src/pipeline/event_detector.hpp
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pipeline/records.hpp"

namespace pipeline {

struct EventThresholds {
    double hard_brake_kmh_s = 35.0;    // deceleration magnitude
    double hard_accel_kmh_s = 35.0;
    double sharp_turn_deg = 20.0;      // steering change per step, absolute
};

struct EventDetectorConfig {
    int64_t bucket_ms = 100;           // spacing of the aggregated samples
    EventThresholds thresholds;
};

/**
 * EventDetector - driving events from adjacent aggregated samples
 *
 * Keeps only the previous sample per source. For each new sample:
 *   accel = (v - v_prev) / dt           dt = bucket length in seconds
 *   accel < -hard_brake   -> hard_brake
 *   accel >  hard_accel   -> hard_acceleration
 *   |steer - steer_prev| > sharp_turn -> sharp_turn
 * The first matching rule wins; at most one event per sample. A missing
 * value on either side skips the rule that needs it.
 */
class EventDetector {
public:
    explicit EventDetector(EventDetectorConfig cfg);

    /**
     * @throws UnorderedInputError if the sample is older than the previous
     *         sample of the same source. Equal timestamps are accepted.
     */
    std::optional<Event> observe(const AggregatedSample& sample);

    // Fold over a sequence with fresh state
    std::vector<Event> detect(const std::vector<AggregatedSample>& samples);

    void reset() { prev_.clear(); }
    void discard_source(const std::string& source_id) { prev_.erase(source_id); }

    const EventDetectorConfig& config() const { return cfg_; }

private:
    EventDetectorConfig cfg_;
    double dt_s_;
    std::map<std::string, AggregatedSample> prev_;
};

} // namespace pipeline
