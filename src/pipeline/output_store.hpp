// src/pipeline/output_store.hpp
#pragma once

#include <limits>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "pipeline/records.hpp"

namespace pipeline {

/**
 * OutputStore - in-memory copy of every relation the pipeline produced
 *
 * Queries filter by source (empty = all sources) and by the half-open time
 * range [t_from, t_to). The time of a record is its timestamp; for quality
 * windows it is window_start, for stats the first_timestamp of the day.
 * Results keep insertion order, except stats which are ordered by
 * (date, source_id).
 *
 * Stats are snapshots: a newer record for the same (date, source_id)
 * replaces the older one.
 */
class OutputStore {
public:
    static constexpr double kAll = std::numeric_limits<double>::infinity();

    void add(const PipelineOutputs& out);

    std::vector<can::DecodedSignal> query_decoded(const std::string& source_id = "",
                                                  double t_from = -kAll, double t_to = kAll) const;
    std::vector<QualityWindow> query_quality(const std::string& source_id = "",
                                             double t_from = -kAll, double t_to = kAll) const;
    std::vector<AggregatedSample> query_aggregated(const std::string& source_id = "",
                                                   double t_from = -kAll, double t_to = kAll) const;
    std::vector<AggregatedSample> query_latest(const std::string& source_id = "",
                                               double t_from = -kAll, double t_to = kAll) const;
    std::vector<Event> query_events(const std::string& source_id = "",
                                    double t_from = -kAll, double t_to = kAll) const;
    std::vector<VehicleStats> query_stats(const std::string& source_id = "",
                                          double t_from = -kAll, double t_to = kAll) const;

    // Most recent latest-view sample of a source, or nullptr
    const AggregatedSample* latest_for(const std::string& source_id) const;

    size_t decoded_count() const { return decoded_.size(); }
    size_t quality_count() const { return quality_.size(); }
    size_t aggregated_count() const { return aggregated_.size(); }
    size_t event_count() const { return events_.size(); }
    size_t stats_count() const { return stats_.size(); }

    void clear();

private:
    std::vector<can::DecodedSignal> decoded_;
    std::vector<QualityWindow> quality_;
    std::vector<AggregatedSample> aggregated_;
    std::vector<AggregatedSample> latest_;
    std::vector<Event> events_;
    std::map<std::pair<std::string, std::string>, VehicleStats> stats_;
};

} // namespace pipeline
