// src/pipeline/quality_tracker.cpp
#include "pipeline/quality_tracker.hpp"
#include "utils/logging.hpp"
#include "utils/time_util.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <tuple>

namespace pipeline {

QualityTracker::QualityTracker(const can::SignalDictionary& dict, QualityTrackerConfig cfg,
                               std::string source_id)
    : dict_(dict), cfg_(cfg), source_id_(std::move(source_id)),
      window_us_(cfg.window_ms * 1000) {
    if (cfg_.window_ms <= 0) {
        throw std::invalid_argument("quality window must be positive");
    }
    if (!(cfg_.default_period_ms > 0.0)) {
        throw std::invalid_argument("default period must be positive");
    }
}

int64_t QualityTracker::expected_count(int64_t window_ms, double period_ms) {
    const int64_t n = static_cast<int64_t>(std::llround(static_cast<double>(window_ms) / period_ms));
    return n < 1 ? 1 : n;
}

void QualityTracker::observe(const can::RawFrame& frame, std::vector<QualityWindow>& out) {
    stats_.frames_in++;

    const can::MessageSpec* spec = dict_.find(frame.arbitration_id);
    if (!spec) {
        stats_.unknown_dropped++;
        return;
    }

    const int64_t start_us = utils::align_down_us(frame.timestamp, window_us_);
    Key key{frame.arbitration_id, frame.channel};

    auto it = open_.find(key);
    if (it == open_.end()) {
        OpenWindow w;
        w.spec = spec;
        w.start_us = start_us;
        w.count = 1;
        w.first_ts = frame.timestamp;
        w.last_ts = frame.timestamp;
        open_.emplace(std::move(key), w);
        stats_.counted++;
        return;
    }

    OpenWindow& w = it->second;
    if (start_us < w.start_us) {
        stats_.late_dropped++;
        LOG_DEBUG("[Quality] %s: late frame 0x%03X at %.6f (window already closed)",
                  source_id_.c_str(), frame.arbitration_id, frame.timestamp);
        return;
    }

    if (start_us > w.start_us) {
        out.push_back(close(it->first, w));
        w.start_us = start_us;
        w.count = 0;
        w.first_ts = frame.timestamp;
        w.last_ts = frame.timestamp;
    }

    w.count++;
    w.first_ts = std::min(w.first_ts, frame.timestamp);
    w.last_ts = std::max(w.last_ts, frame.timestamp);
    stats_.counted++;
}

QualityWindow QualityTracker::close(const Key& key, const OpenWindow& w) {
    const double period_ms = w.spec->has_period() ? w.spec->expected_period_ms
                                                  : cfg_.default_period_ms;
    QualityWindow q;
    q.window_start = utils::us_to_seconds(w.start_us);
    q.window_end = utils::us_to_seconds(w.start_us + window_us_);
    q.arbitration_id = key.arbitration_id;
    q.message_name = w.spec->name;
    q.channel = key.channel;
    q.message_count = w.count;
    q.expected_count = expected_count(cfg_.window_ms, period_ms);
    q.expected_period_ms = period_ms;
    q.missing_rate = 1.0 - static_cast<double>(w.count) / static_cast<double>(q.expected_count);
    q.first_ts = w.first_ts;
    q.last_ts = w.last_ts;
    q.source_id = source_id_;
    stats_.windows_emitted++;
    return q;
}

std::vector<QualityWindow> QualityTracker::flush() {
    std::vector<QualityWindow> out;
    out.reserve(open_.size());
    for (const auto& kv : open_) {
        out.push_back(close(kv.first, kv.second));
    }
    open_.clear();

    std::sort(out.begin(), out.end(), [](const QualityWindow& a, const QualityWindow& b) {
        return std::tie(a.window_start, a.arbitration_id, a.channel) <
               std::tie(b.window_start, b.arbitration_id, b.channel);
    });
    return out;
}

} // namespace pipeline
