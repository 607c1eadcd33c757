// src/pipeline/event_detector.cpp
#include "pipeline/event_detector.hpp"
#include "pipeline/pipeline_errors.hpp"

#include <cmath>
#include <stdexcept>

namespace pipeline {

EventDetector::EventDetector(EventDetectorConfig cfg)
    : cfg_(cfg), dt_s_(static_cast<double>(cfg.bucket_ms) / 1000.0) {
    if (cfg_.bucket_ms <= 0) {
        throw std::invalid_argument("event detector bucket must be positive");
    }
}

std::optional<Event> EventDetector::observe(const AggregatedSample& cur) {
    auto it = prev_.find(cur.source_id);
    if (it == prev_.end()) {
        prev_.emplace(cur.source_id, cur);
        return std::nullopt;
    }

    const AggregatedSample& prev = it->second;
    if (cur.timestamp < prev.timestamp) {
        throw UnorderedInputError("events", cur.source_id, cur.timestamp, prev.timestamp, 0);
    }

    std::optional<double> accel;
    if (cur.speed_kmh && prev.speed_kmh) {
        accel = (*cur.speed_kmh - *prev.speed_kmh) / dt_s_;
    }
    std::optional<double> steer_delta;
    if (cur.steering_angle && prev.steering_angle) {
        steer_delta = std::fabs(*cur.steering_angle - *prev.steering_angle);
    }

    std::optional<EventType> type;
    const EventThresholds& th = cfg_.thresholds;
    if (accel && *accel < -th.hard_brake_kmh_s) {
        type = EventType::HardBrake;
    } else if (accel && *accel > th.hard_accel_kmh_s) {
        type = EventType::HardAcceleration;
    } else if (steer_delta && *steer_delta > th.sharp_turn_deg) {
        type = EventType::SharpTurn;
    }

    std::optional<Event> ev;
    if (type) {
        Event e;
        e.timestamp = cur.timestamp;
        e.event_type = *type;
        e.speed_kmh = cur.speed_kmh;
        e.acceleration_kmh_s = accel;
        e.steering_angle = cur.steering_angle;
        e.steering_angle_delta = steer_delta;
        e.brake_pressure = cur.brake_pressure;
        e.source_id = cur.source_id;
        ev = e;
    }

    it->second = cur;
    return ev;
}

std::vector<Event> EventDetector::detect(const std::vector<AggregatedSample>& samples) {
    reset();
    std::vector<Event> out;
    for (const auto& s : samples) {
        auto ev = observe(s);
        if (ev) {
            out.push_back(*ev);
        }
    }
    return out;
}

} // namespace pipeline
