// src/pipeline/pipeline.hpp
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "can/frame_codec.hpp"
#include "can/frame_log.hpp"
#include "can/raw_frame.hpp"
#include "can/signal_dictionary.hpp"
#include "pipeline/event_detector.hpp"
#include "pipeline/quality_tracker.hpp"
#include "pipeline/pipeline_errors.hpp"
#include "pipeline/records.hpp"
#include "pipeline/signal_aggregator.hpp"
#include "pipeline/stats_summarizer.hpp"

namespace pipeline {

// Tunables shared by every source
struct PipelineSettings {
    int64_t quality_window_ms = 60000;
    double default_period_ms = 100.0;
    int64_t aggregation_bucket_ms = 100;
    int64_t latest_bucket_ms = 1000;
    EventThresholds thresholds;
    StatsConfig stats;
};

struct PipelineCounters {
    uint64_t frames_in = 0;
    uint64_t decoded = 0;
    uint64_t unknown_dropped = 0;
    uint64_t truncated_dropped = 0;
    uint64_t late_quality_frames = 0;
    uint64_t quality_windows = 0;
    uint64_t aggregated_samples = 0;
    uint64_t latest_samples = 0;
    uint64_t events = 0;
    uint64_t failed_sources = 0;
};

/**
 * Pipeline - raw frames in, the six output relations out
 *
 *   frames -> QualityTracker ----------------------------> quality windows
 *          -> FrameDecoder -> SignalAggregator (100 ms) -> EventDetector
 *                          -> SignalAggregator (1 s, latest view)
 *                          -> StatsSummarizer
 *
 * Each source has its own tracker, aggregators and detector, so sessions
 * never mix. A live feed is a series of push() calls; finish() closes
 * whatever is still open and ends the run.
 */
class Pipeline {
public:
    Pipeline(const can::SignalDictionary& dict, PipelineSettings settings);

    /**
     * Process one batch of frames of one source
     *
     * The batch is checked before anything is processed: timestamps must be
     * non-decreasing and not older than the last frame accepted for this
     * source. On violation nothing is consumed.
     *
     * @throws UnorderedInputError (stage "frames")
     */
    PipelineOutputs push(const std::string& source_id, const std::vector<can::RawFrame>& frames);

    /**
     * Mixed-source batch, e.g. one frame log with a source_id column
     *
     * Frames are split by source and each source is pushed on its own. A
     * source whose frames are out of order is left untouched and its error
     * appended to 'rejected'; the other sources are still processed.
     */
    PipelineOutputs push(const std::vector<can::SourcedFrame>& frames,
                         std::vector<UnorderedInputError>& rejected);

    // Close every open window and bucket; stats carries the final snapshot
    PipelineOutputs finish();

    // Drop all state of a failed source, its stats included
    void discard_source(const std::string& source_id);

    std::vector<VehicleStats> stats_snapshot() const { return stats_.snapshot(); }

    PipelineCounters counters() const;
    void log_counters() const;

    std::vector<std::string> sources() const;
    const PipelineSettings& settings() const { return settings_; }

private:
    struct SourceState {
        QualityTracker quality;
        SignalAggregator aggregated;
        SignalAggregator latest;
        EventDetector detector;
        double last_ts = 0.0;
        bool has_frames = false;

        SourceState(const can::SignalDictionary& dict, const PipelineSettings& s,
                    const std::string& source_id);
    };

    SourceState& state_for(const std::string& source_id);
    void validate(const std::string& source_id, const std::vector<can::RawFrame>& frames) const;
    void process(const std::string& source_id, SourceState& st, const can::RawFrame& frame,
                 PipelineOutputs& out);
    void emit_aggregated(SourceState& st, AggregatedSample&& sample, PipelineOutputs& out);
    void retire(SourceState& st);

    const can::SignalDictionary& dict_;
    PipelineSettings settings_;
    can::FrameDecoder decoder_;
    StatsSummarizer stats_;

    std::map<std::string, std::unique_ptr<SourceState>> sources_;
    PipelineCounters counters_;   // everything except decoder and live tracker totals
};

} // namespace pipeline
