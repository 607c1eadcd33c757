// src/pipeline/signal_aggregator.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "can/decoded_signal.hpp"
#include "pipeline/records.hpp"

namespace pipeline {

enum class BucketLabel {
    Start,   // sample timestamp = bucket start (per-bucket series)
    End      // sample timestamp = bucket end (latest-value view)
};

struct AggregatorConfig {
    int64_t bucket_ms = 100;
    BucketLabel label = BucketLabel::Start;
};

/**
 * SignalAggregator - fuse decoded signals into one sample per bucket
 *
 * Buckets are fixed, epoch-aligned and per source. Within a bucket the
 * last value by timestamp wins for every field; equal timestamps resolve by
 * arrival order. Buckets with no signals produce no sample.
 *
 * Streaming use: add() signals of each source in non-decreasing time order.
 * A bucket is emitted as soon as a signal of that source falls in a later
 * bucket; flush() emits the rest.
 *
 * Batch use: aggregate() takes signals in any order.
 */
class SignalAggregator {
public:
    explicit SignalAggregator(AggregatorConfig cfg);

    /**
     * @param closed receives samples of buckets this signal closed
     * @throws UnorderedInputError if the signal belongs to a bucket of its
     *         source that was already emitted
     */
    void add(const can::DecodedSignal& sig, std::vector<AggregatedSample>& closed);

    // Emit all open buckets, ordered by (source_id, timestamp)
    std::vector<AggregatedSample> flush();

    // Emit the open bucket of one source, if any
    bool flush_source(const std::string& source_id, AggregatedSample& out);

    void discard_source(const std::string& source_id) { open_.erase(source_id); }

    size_t open_buckets() const { return open_.size(); }
    const AggregatorConfig& config() const { return cfg_; }

    // Stable-sorts by timestamp, then folds
    static std::vector<AggregatedSample> aggregate(std::vector<can::DecodedSignal> signals,
                                                   AggregatorConfig cfg);

    // Apply one field to the sample's slot. Unknown names go to extra.
    static void set_field(AggregatedSample& s, const std::string& name, const can::FieldValue& v);

private:
    struct Bucket {
        int64_t start_us = 0;
        AggregatedSample sample;
        std::map<std::string, double> field_ts;   // timestamp of the value held per field
    };

    AggregatedSample emit(const Bucket& b) const;

    AggregatorConfig cfg_;
    int64_t bucket_us_;
    std::map<std::string, Bucket> open_;   // by source_id
};

} // namespace pipeline
