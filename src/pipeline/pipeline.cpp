// src/pipeline/pipeline.cpp
#include "pipeline/pipeline.hpp"
#include "pipeline/pipeline_errors.hpp"
#include "utils/logging.hpp"

#include <iterator>

namespace pipeline {

void PipelineOutputs::append(PipelineOutputs&& o) {
    auto move_into = [](auto& dst, auto& src) {
        dst.insert(dst.end(), std::make_move_iterator(src.begin()), std::make_move_iterator(src.end()));
    };
    move_into(decoded, o.decoded);
    move_into(quality, o.quality);
    move_into(aggregated, o.aggregated);
    move_into(latest, o.latest);
    move_into(events, o.events);
    move_into(stats, o.stats);
}

Pipeline::SourceState::SourceState(const can::SignalDictionary& dict, const PipelineSettings& s,
                                   const std::string& source_id)
    : quality(dict, QualityTrackerConfig{s.quality_window_ms, s.default_period_ms}, source_id),
      aggregated(AggregatorConfig{s.aggregation_bucket_ms, BucketLabel::Start}),
      latest(AggregatorConfig{s.latest_bucket_ms, BucketLabel::End}),
      detector(EventDetectorConfig{s.aggregation_bucket_ms, s.thresholds}) {}

Pipeline::Pipeline(const can::SignalDictionary& dict, PipelineSettings settings)
    : dict_(dict), settings_(std::move(settings)), decoder_(dict), stats_(settings_.stats) {
    LOG_INFO("[Pipeline] %zu messages, quality window %lld ms, buckets %lld/%lld ms",
             dict_.size(), static_cast<long long>(settings_.quality_window_ms),
             static_cast<long long>(settings_.aggregation_bucket_ms),
             static_cast<long long>(settings_.latest_bucket_ms));
}

Pipeline::SourceState& Pipeline::state_for(const std::string& source_id) {
    auto it = sources_.find(source_id);
    if (it == sources_.end()) {
        LOG_DEBUG("[Pipeline] new source '%s'", source_id.c_str());
        it = sources_.emplace(source_id,
                              std::make_unique<SourceState>(dict_, settings_, source_id)).first;
    }
    return *it->second;
}

void Pipeline::validate(const std::string& source_id, const std::vector<can::RawFrame>& frames) const {
    bool has_prev = false;
    double prev = 0.0;

    auto it = sources_.find(source_id);
    if (it != sources_.end() && it->second->has_frames) {
        has_prev = true;
        prev = it->second->last_ts;
    }

    for (const auto& f : frames) {
        if (has_prev && f.timestamp < prev) {
            throw UnorderedInputError("frames", source_id, f.timestamp, prev, f.arbitration_id);
        }
        prev = f.timestamp;
        has_prev = true;
    }
}

PipelineOutputs Pipeline::push(const std::string& source_id, const std::vector<can::RawFrame>& frames) {
    utils::ScopedLogSource tag(source_id);
    validate(source_id, frames);

    PipelineOutputs out;
    if (frames.empty()) {
        return out;
    }

    SourceState& st = state_for(source_id);
    for (const auto& f : frames) {
        process(source_id, st, f, out);
    }
    return out;
}

PipelineOutputs Pipeline::push(const std::vector<can::SourcedFrame>& frames,
                               std::vector<UnorderedInputError>& rejected) {
    // Partition by source, keeping order within each
    std::map<std::string, std::vector<can::RawFrame>> by_source;
    for (const auto& sf : frames) {
        by_source[sf.source_id].push_back(sf.frame);
    }

    PipelineOutputs out;
    for (const auto& kv : by_source) {
        try {
            out.append(push(kv.first, kv.second));
        } catch (const UnorderedInputError& e) {
            LOG_WARN("[Pipeline] batch of source '%s' rejected: %s", kv.first.c_str(), e.what());
            rejected.push_back(e);
        }
    }
    return out;
}

void Pipeline::process(const std::string& source_id, SourceState& st, const can::RawFrame& frame,
                       PipelineOutputs& out) {
    st.last_ts = frame.timestamp;
    st.has_frames = true;
    counters_.frames_in++;

    const size_t q_before = out.quality.size();
    st.quality.observe(frame, out.quality);
    counters_.quality_windows += out.quality.size() - q_before;

    auto sig = decoder_.decode(frame, source_id);
    if (!sig) {
        return;
    }

    stats_.add(*sig);

    std::vector<AggregatedSample> closed;
    st.aggregated.add(*sig, closed);
    for (auto& s : closed) {
        emit_aggregated(st, std::move(s), out);
    }

    const size_t l_before = out.latest.size();
    st.latest.add(*sig, out.latest);
    counters_.latest_samples += out.latest.size() - l_before;

    out.decoded.push_back(std::move(*sig));
}

void Pipeline::emit_aggregated(SourceState& st, AggregatedSample&& sample, PipelineOutputs& out) {
    auto ev = st.detector.observe(sample);
    if (ev) {
        LOG_DEBUG("[Events] %s %s at %.3f", ev->source_id.c_str(),
                  to_string(ev->event_type), ev->timestamp);
        out.events.push_back(*ev);
        counters_.events++;
    }
    out.aggregated.push_back(std::move(sample));
    counters_.aggregated_samples++;
}

void Pipeline::retire(SourceState& st) {
    counters_.late_quality_frames += st.quality.stats().late_dropped;
}

PipelineOutputs Pipeline::finish() {
    PipelineOutputs out;
    for (auto& kv : sources_) {
        SourceState& st = *kv.second;

        auto windows = st.quality.flush();
        counters_.quality_windows += windows.size();
        out.quality.insert(out.quality.end(), windows.begin(), windows.end());

        AggregatedSample last;
        if (st.aggregated.flush_source(kv.first, last)) {
            emit_aggregated(st, std::move(last), out);
        }
        if (st.latest.flush_source(kv.first, last)) {
            out.latest.push_back(std::move(last));
            counters_.latest_samples++;
        }
        retire(st);
    }
    sources_.clear();

    out.stats = stats_.snapshot();
    return out;
}

void Pipeline::discard_source(const std::string& source_id) {
    utils::ScopedLogSource tag(source_id);
    auto it = sources_.find(source_id);
    if (it != sources_.end()) {
        retire(*it->second);
        sources_.erase(it);
    }
    stats_.discard_source(source_id);
    counters_.failed_sources++;
    LOG_WARN("[Pipeline] source '%s' discarded", source_id.c_str());
}

std::vector<std::string> Pipeline::sources() const {
    std::vector<std::string> out;
    out.reserve(sources_.size());
    for (const auto& kv : sources_) {
        out.push_back(kv.first);
    }
    return out;
}

PipelineCounters Pipeline::counters() const {
    PipelineCounters c = counters_;
    const auto& d = decoder_.stats();
    c.decoded = d.decoded;
    c.unknown_dropped = d.unknown_dropped;
    c.truncated_dropped = d.truncated_dropped;
    for (const auto& kv : sources_) {
        c.late_quality_frames += kv.second->quality.stats().late_dropped;
    }
    return c;
}

void Pipeline::log_counters() const {
    const PipelineCounters c = counters();
    LOG_INFO("================================================");
    LOG_INFO("Pipeline counters");
    LOG_INFO("================================================");
    LOG_INFO("  frames in:            %llu", static_cast<unsigned long long>(c.frames_in));
    LOG_INFO("  decoded:              %llu", static_cast<unsigned long long>(c.decoded));
    LOG_INFO("  unknown id dropped:   %llu", static_cast<unsigned long long>(c.unknown_dropped));
    LOG_INFO("  truncated dropped:    %llu", static_cast<unsigned long long>(c.truncated_dropped));
    LOG_INFO("  late quality frames:  %llu", static_cast<unsigned long long>(c.late_quality_frames));
    LOG_INFO("  quality windows:      %llu", static_cast<unsigned long long>(c.quality_windows));
    LOG_INFO("  aggregated samples:   %llu", static_cast<unsigned long long>(c.aggregated_samples));
    LOG_INFO("  latest samples:       %llu", static_cast<unsigned long long>(c.latest_samples));
    LOG_INFO("  events:               %llu", static_cast<unsigned long long>(c.events));
    if (c.failed_sources > 0) {
        LOG_WARN("  failed sources:       %llu", static_cast<unsigned long long>(c.failed_sources));
    }
    LOG_INFO("================================================");
}

} // namespace pipeline
