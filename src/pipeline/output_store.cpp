// src/pipeline/output_store.cpp
#include "pipeline/output_store.hpp"

namespace pipeline {

namespace {

bool matches(const std::string& want, const std::string& have, double ts, double from, double to) {
    return (want.empty() || want == have) && ts >= from && ts < to;
}

template <typename T, typename TimeOf>
std::vector<T> select(const std::vector<T>& rows, const std::string& source_id,
                      double from, double to, TimeOf time_of) {
    std::vector<T> out;
    for (const auto& r : rows) {
        if (matches(source_id, r.source_id, time_of(r), from, to)) {
            out.push_back(r);
        }
    }
    return out;
}

} // namespace

void OutputStore::add(const PipelineOutputs& out) {
    decoded_.insert(decoded_.end(), out.decoded.begin(), out.decoded.end());
    quality_.insert(quality_.end(), out.quality.begin(), out.quality.end());
    aggregated_.insert(aggregated_.end(), out.aggregated.begin(), out.aggregated.end());
    latest_.insert(latest_.end(), out.latest.begin(), out.latest.end());
    events_.insert(events_.end(), out.events.begin(), out.events.end());
    for (const auto& s : out.stats) {
        stats_[std::make_pair(s.date, s.source_id)] = s;
    }
}

std::vector<can::DecodedSignal> OutputStore::query_decoded(const std::string& source_id,
                                                           double t_from, double t_to) const {
    return select(decoded_, source_id, t_from, t_to,
                  [](const can::DecodedSignal& r) { return r.timestamp; });
}

std::vector<QualityWindow> OutputStore::query_quality(const std::string& source_id,
                                                      double t_from, double t_to) const {
    return select(quality_, source_id, t_from, t_to,
                  [](const QualityWindow& r) { return r.window_start; });
}

std::vector<AggregatedSample> OutputStore::query_aggregated(const std::string& source_id,
                                                            double t_from, double t_to) const {
    return select(aggregated_, source_id, t_from, t_to,
                  [](const AggregatedSample& r) { return r.timestamp; });
}

std::vector<AggregatedSample> OutputStore::query_latest(const std::string& source_id,
                                                        double t_from, double t_to) const {
    return select(latest_, source_id, t_from, t_to,
                  [](const AggregatedSample& r) { return r.timestamp; });
}

std::vector<Event> OutputStore::query_events(const std::string& source_id,
                                             double t_from, double t_to) const {
    return select(events_, source_id, t_from, t_to,
                  [](const Event& r) { return r.timestamp; });
}

std::vector<VehicleStats> OutputStore::query_stats(const std::string& source_id,
                                                   double t_from, double t_to) const {
    std::vector<VehicleStats> out;
    for (const auto& kv : stats_) {
        const VehicleStats& s = kv.second;
        if (matches(source_id, s.source_id, s.first_timestamp, t_from, t_to)) {
            out.push_back(s);
        }
    }
    return out;
}

const AggregatedSample* OutputStore::latest_for(const std::string& source_id) const {
    const AggregatedSample* best = nullptr;
    for (const auto& s : latest_) {
        if (s.source_id == source_id && (!best || s.timestamp >= best->timestamp)) {
            best = &s;
        }
    }
    return best;
}

void OutputStore::clear() {
    decoded_.clear();
    quality_.clear();
    aggregated_.clear();
    latest_.clear();
    events_.clear();
    stats_.clear();
}

} // namespace pipeline
