// src/pipeline/stats_summarizer.cpp
#include "pipeline/stats_summarizer.hpp"
#include "utils/time_util.hpp"

#include <algorithm>
#include <stdexcept>

namespace pipeline {

StatsSummarizer::StatsSummarizer(StatsConfig cfg)
    : cfg_(std::move(cfg)), speed_interval_s_(cfg_.speed_period_ms / 1000.0) {
    if (!(cfg_.speed_period_ms > 0.0)) {
        throw std::invalid_argument("speed period must be positive");
    }
}

void StatsSummarizer::add(const can::DecodedSignal& sig) {
    Accum& a = groups_[std::make_pair(utils::utc_date(sig.timestamp), sig.source_id)];

    if (a.samples == 0) {
        a.first_ts = sig.timestamp;
        a.last_ts = sig.timestamp;
    } else {
        a.first_ts = std::min(a.first_ts, sig.timestamp);
        a.last_ts = std::max(a.last_ts, sig.timestamp);
    }
    a.samples++;

    if (const can::FieldValue* v = sig.find(cfg_.speed_field)) {
        const double speed = v->as_double();
        a.speed_max = (a.speed_n == 0) ? speed : std::max(a.speed_max, speed);
        a.speed_sum += speed;
        a.speed_n++;
        a.distance_km += speed * speed_interval_s_ / 3600.0;
    }
    if (const can::FieldValue* v = sig.find(cfg_.rpm_field)) {
        const double rpm = v->as_double();
        a.rpm_max = (a.rpm_n == 0) ? rpm : std::max(a.rpm_max, rpm);
        a.rpm_sum += rpm;
        a.rpm_n++;
    }
}

std::vector<VehicleStats> StatsSummarizer::snapshot() const {
    std::vector<VehicleStats> out;
    out.reserve(groups_.size());
    for (const auto& kv : groups_) {
        const Accum& a = kv.second;
        VehicleStats s;
        s.date = kv.first.first;
        s.source_id = kv.first.second;
        if (a.speed_n > 0) {
            s.avg_speed_kmh = a.speed_sum / static_cast<double>(a.speed_n);
            s.max_speed_kmh = a.speed_max;
        }
        if (a.rpm_n > 0) {
            s.avg_rpm = a.rpm_sum / static_cast<double>(a.rpm_n);
            s.max_rpm = a.rpm_max;
        }
        s.distance_km = a.distance_km;
        s.sample_count = a.samples;
        s.first_timestamp = a.first_ts;
        s.last_timestamp = a.last_ts;
        out.push_back(std::move(s));
    }
    return out;
}

void StatsSummarizer::discard_source(const std::string& source_id) {
    for (auto it = groups_.begin(); it != groups_.end();) {
        if (it->first.second == source_id) {
            it = groups_.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<VehicleStats> StatsSummarizer::summarize(const std::vector<can::DecodedSignal>& signals,
                                                     StatsConfig cfg) {
    StatsSummarizer s(std::move(cfg));
    for (const auto& sig : signals) {
        s.add(sig);
    }
    return s.snapshot();
}

} // namespace pipeline
