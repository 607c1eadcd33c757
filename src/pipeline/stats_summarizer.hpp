// src/pipeline/stats_summarizer.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "can/decoded_signal.hpp"
#include "pipeline/records.hpp"

namespace pipeline {

struct StatsConfig {
    std::string speed_field = "speed_kmh";
    std::string rpm_field = "rpm";
    // Nominal period of the speed message. Each speed sample contributes
    // speed * period to the distance, regardless of the actual spacing.
    double speed_period_ms = 20.0;
};

/**
 * StatsSummarizer - running per-day, per-source totals
 *
 * Group key is (UTC date of the signal timestamp, source_id). Input order
 * does not matter.
 */
class StatsSummarizer {
public:
    explicit StatsSummarizer(StatsConfig cfg = {});

    void add(const can::DecodedSignal& sig);

    // Current values, ordered by (date, source_id)
    std::vector<VehicleStats> snapshot() const;

    void discard_source(const std::string& source_id);
    void clear() { groups_.clear(); }
    size_t size() const { return groups_.size(); }

    static std::vector<VehicleStats> summarize(const std::vector<can::DecodedSignal>& signals,
                                               StatsConfig cfg = {});

private:
    struct Accum {
        double speed_sum = 0.0;
        uint64_t speed_n = 0;
        double speed_max = 0.0;
        double rpm_sum = 0.0;
        uint64_t rpm_n = 0;
        double rpm_max = 0.0;
        double distance_km = 0.0;
        uint64_t samples = 0;
        double first_ts = 0.0;
        double last_ts = 0.0;
    };

    StatsConfig cfg_;
    double speed_interval_s_;
    std::map<std::pair<std::string, std::string>, Accum> groups_;
};

} // namespace pipeline
