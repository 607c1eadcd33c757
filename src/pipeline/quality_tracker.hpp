// src/pipeline/quality_tracker.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "can/raw_frame.hpp"
#include "can/signal_dictionary.hpp"
#include "pipeline/records.hpp"

namespace pipeline {

struct QualityTrackerConfig {
    int64_t window_ms = 60000;
    double default_period_ms = 100.0;   // used when a message has no period
};

/**
 * QualityTracker - per-message frame-rate health over fixed windows
 *
 * One instance per source. Frames are bucketed into epoch-aligned windows
 * keyed by (arbitration id, channel). A window is emitted once a frame for
 * the same key lands in a later window, or on flush().
 *
 * Frames for a window that was already emitted are late: they are dropped
 * and counted, and never reopen the window.
 */
class QualityTracker {
public:
    struct Stats {
        uint64_t frames_in = 0;
        uint64_t counted = 0;
        uint64_t unknown_dropped = 0;
        uint64_t late_dropped = 0;
        uint64_t windows_emitted = 0;
    };

    QualityTracker(const can::SignalDictionary& dict, QualityTrackerConfig cfg,
                   std::string source_id = "");

    // Closed windows (if any) are appended to out
    void observe(const can::RawFrame& frame, std::vector<QualityWindow>& out);

    // Emit every open window, ordered by (window_start, arbitration_id, channel)
    std::vector<QualityWindow> flush();

    size_t open_windows() const { return open_.size(); }
    const Stats& stats() const { return stats_; }
    const std::string& source_id() const { return source_id_; }

    // round(window / period), at least 1
    static int64_t expected_count(int64_t window_ms, double period_ms);

private:
    struct Key {
        uint32_t arbitration_id;
        std::string channel;
        bool operator==(const Key& o) const {
            return arbitration_id == o.arbitration_id && channel == o.channel;
        }
    };
    struct KeyHash {
        size_t operator()(const Key& k) const {
            return std::hash<uint32_t>()(k.arbitration_id) ^
                   (std::hash<std::string>()(k.channel) << 1);
        }
    };
    struct OpenWindow {
        const can::MessageSpec* spec = nullptr;
        int64_t start_us = 0;
        uint64_t count = 0;
        double first_ts = 0.0;
        double last_ts = 0.0;
    };

    QualityWindow close(const Key& key, const OpenWindow& w);

    const can::SignalDictionary& dict_;
    QualityTrackerConfig cfg_;
    std::string source_id_;
    int64_t window_us_;

    std::unordered_map<Key, OpenWindow, KeyHash> open_;
    Stats stats_;
};

} // namespace pipeline
