// src/pipeline/signal_aggregator.cpp
#include "pipeline/signal_aggregator.hpp"
#include "pipeline/pipeline_errors.hpp"
#include "utils/time_util.hpp"

#include <algorithm>
#include <stdexcept>

namespace pipeline {

SignalAggregator::SignalAggregator(AggregatorConfig cfg)
    : cfg_(cfg), bucket_us_(cfg.bucket_ms * 1000) {
    if (cfg_.bucket_ms <= 0) {
        throw std::invalid_argument("aggregation bucket must be positive");
    }
}

void SignalAggregator::set_field(AggregatedSample& s, const std::string& name,
                                 const can::FieldValue& v) {
    if (name == "speed_kmh")           s.speed_kmh = v.as_double();
    else if (name == "rpm")            s.rpm = v.as_double();
    else if (name == "throttle_pct")   s.throttle_pct = v.as_double();
    else if (name == "brake_pressure") s.brake_pressure = v.as_double();
    else if (name == "brake_active")   s.brake_active = v.as_bool();
    else if (name == "steering_angle") s.steering_angle = v.as_double();
    else                               s.extra[name] = v;
}

void SignalAggregator::add(const can::DecodedSignal& sig, std::vector<AggregatedSample>& closed) {
    const int64_t start_us = utils::align_down_us(sig.timestamp, bucket_us_);

    auto it = open_.find(sig.source_id);
    if (it == open_.end()) {
        Bucket b;
        b.start_us = start_us;
        b.sample.source_id = sig.source_id;
        it = open_.emplace(sig.source_id, std::move(b)).first;
    } else if (start_us < it->second.start_us) {
        throw UnorderedInputError("aggregate", sig.source_id, sig.timestamp,
                                  utils::us_to_seconds(it->second.start_us), sig.arbitration_id);
    } else if (start_us > it->second.start_us) {
        closed.push_back(emit(it->second));
        Bucket fresh;
        fresh.start_us = start_us;
        fresh.sample.source_id = sig.source_id;
        it->second = std::move(fresh);
    }

    Bucket& b = it->second;
    for (const auto& kv : sig.field_values) {
        auto ts_it = b.field_ts.find(kv.first);
        if (ts_it != b.field_ts.end() && sig.timestamp < ts_it->second) {
            continue;   // an older value than the one held
        }
        b.field_ts[kv.first] = sig.timestamp;
        set_field(b.sample, kv.first, kv.second);
    }
    b.sample.contributing_signals++;
}

AggregatedSample SignalAggregator::emit(const Bucket& b) const {
    AggregatedSample s = b.sample;
    const int64_t label_us = (cfg_.label == BucketLabel::Start) ? b.start_us
                                                                : b.start_us + bucket_us_;
    s.timestamp = utils::us_to_seconds(label_us);
    return s;
}

bool SignalAggregator::flush_source(const std::string& source_id, AggregatedSample& out) {
    auto it = open_.find(source_id);
    if (it == open_.end()) {
        return false;
    }
    out = emit(it->second);
    open_.erase(it);
    return true;
}

std::vector<AggregatedSample> SignalAggregator::flush() {
    std::vector<AggregatedSample> out;
    out.reserve(open_.size());
    for (const auto& kv : open_) {
        out.push_back(emit(kv.second));
    }
    open_.clear();
    return out;
}

std::vector<AggregatedSample> SignalAggregator::aggregate(std::vector<can::DecodedSignal> signals,
                                                          AggregatorConfig cfg) {
    std::stable_sort(signals.begin(), signals.end(),
                     [](const can::DecodedSignal& a, const can::DecodedSignal& b) {
                         return a.timestamp < b.timestamp;
                     });

    SignalAggregator agg(cfg);
    std::vector<AggregatedSample> out;
    for (const auto& s : signals) {
        agg.add(s, out);
    }
    for (auto& s : agg.flush()) {
        out.push_back(std::move(s));
    }

    std::stable_sort(out.begin(), out.end(), [](const AggregatedSample& a, const AggregatedSample& b) {
        if (a.source_id != b.source_id) return a.source_id < b.source_id;
        return a.timestamp < b.timestamp;
    });
    return out;
}

} // namespace pipeline
