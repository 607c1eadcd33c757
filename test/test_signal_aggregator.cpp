// test/test_signal_aggregator.cpp
// Unit tests for bucketed signal fusion

#include "pipeline/pipeline_errors.hpp"
#include "pipeline/signal_aggregator.hpp"
#include <cmath>
#include <iostream>
#include <vector>

// Test helper macros
#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "FAILED: " << message << std::endl; \
            std::cerr << "  at " << __FILE__ << ":" << __LINE__ << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_func) \
    do { \
        std::cout << "Running " << #test_func << "... "; \
        if (test_func()) { \
            std::cout << "PASSED" << std::endl; \
            passed++; \
        } else { \
            std::cout << "FAILED" << std::endl; \
            failed++; \
        } \
        total++; \
    } while (0)

static const double T0 = 1700000040.0;

// Helper to build a one-field decoded signal
can::DecodedSignal make_signal(double ts, const std::string& field, double value,
                               const std::string& source = "VH001") {
    can::DecodedSignal s;
    s.timestamp = ts;
    s.message_name = field;
    s.channel = "can0";
    s.source_id = source;
    s.field_values[field] = can::FieldValue::numeric(value);
    return s;
}

bool near(const std::optional<double>& v, double expected) {
    return v && std::abs(*v - expected) < 1e-9;
}

bool test_fusion_across_messages() {
    std::vector<can::DecodedSignal> in = {
        make_signal(T0 + 0.01, "speed_kmh", 80.0),
        make_signal(T0 + 0.05, "rpm", 2500.0),
        make_signal(T0 + 0.15, "steering_angle", 12.5),
    };
    auto out = pipeline::SignalAggregator::aggregate(in, {});

    TEST_ASSERT(out.size() == 2, "two non-empty buckets expected");
    TEST_ASSERT(out[0].timestamp == T0, "first bucket labelled by its start");
    TEST_ASSERT(near(out[0].speed_kmh, 80.0) && near(out[0].rpm, 2500.0),
                "speed and rpm fused into one sample");
    TEST_ASSERT(!out[0].steering_angle, "steering belongs to the next bucket");
    TEST_ASSERT(out[0].contributing_signals == 2, "two signals contributed");
    TEST_ASSERT(std::abs(out[1].timestamp - (T0 + 0.1)) < 1e-6, "second bucket starts at +100 ms");
    TEST_ASSERT(near(out[1].steering_angle, 12.5) && !out[1].speed_kmh,
                "no carry-over between buckets");
    return true;
}

bool test_last_value_wins() {
    // Batch: input order does not matter, later timestamp wins
    std::vector<can::DecodedSignal> in = {
        make_signal(T0 + 0.08, "speed_kmh", 50.0),
        make_signal(T0 + 0.02, "speed_kmh", 60.0),
    };
    auto out = pipeline::SignalAggregator::aggregate(in, {});
    TEST_ASSERT(out.size() == 1 && near(out[0].speed_kmh, 50.0), "batch: value at +80 ms wins");

    // Streaming: an older value inside the open bucket does not replace a newer one
    pipeline::SignalAggregator agg(pipeline::AggregatorConfig{});
    std::vector<pipeline::AggregatedSample> closed;
    agg.add(make_signal(T0 + 0.08, "speed_kmh", 50.0), closed);
    agg.add(make_signal(T0 + 0.02, "speed_kmh", 60.0), closed);
    auto rest = agg.flush();
    TEST_ASSERT(closed.empty() && rest.size() == 1, "one open bucket");
    TEST_ASSERT(near(rest[0].speed_kmh, 50.0), "streaming: value at +80 ms wins");
    return true;
}

bool test_equal_timestamps_arrival_order() {
    std::vector<can::DecodedSignal> in = {
        make_signal(T0 + 0.05, "speed_kmh", 70.0),
        make_signal(T0 + 0.05, "speed_kmh", 71.0),
    };
    auto out = pipeline::SignalAggregator::aggregate(in, {});
    TEST_ASSERT(out.size() == 1 && near(out[0].speed_kmh, 71.0), "later arrival wins a tie");
    return true;
}

bool test_end_label() {
    pipeline::AggregatorConfig cfg;
    cfg.bucket_ms = 1000;
    cfg.label = pipeline::BucketLabel::End;
    auto out = pipeline::SignalAggregator::aggregate({make_signal(T0 + 0.4, "rpm", 900.0)}, cfg);
    TEST_ASSERT(out.size() == 1, "one sample");
    TEST_ASSERT(out[0].timestamp == T0 + 1.0, "end label = bucket start + 1 s");
    return true;
}

bool test_empty_buckets_skipped() {
    std::vector<can::DecodedSignal> in = {
        make_signal(T0 + 0.05, "speed_kmh", 10.0),
        make_signal(T0 + 0.45, "speed_kmh", 20.0),
    };
    auto out = pipeline::SignalAggregator::aggregate(in, {});
    TEST_ASSERT(out.size() == 2, "buckets +100..+400 ms produce nothing");
    TEST_ASSERT(std::abs(out[1].timestamp - (T0 + 0.4)) < 1e-6, "second sample at +400 ms");
    return true;
}

bool test_streaming_emits_on_later_bucket() {
    pipeline::SignalAggregator agg(pipeline::AggregatorConfig{});
    std::vector<pipeline::AggregatedSample> closed;
    agg.add(make_signal(T0 + 0.01, "speed_kmh", 30.0), closed);
    agg.add(make_signal(T0 + 0.09, "rpm", 1500.0), closed);
    TEST_ASSERT(closed.empty(), "bucket still open");
    agg.add(make_signal(T0 + 0.11, "speed_kmh", 31.0), closed);
    TEST_ASSERT(closed.size() == 1 && near(closed[0].speed_kmh, 30.0) && near(closed[0].rpm, 1500.0),
                "first bucket emitted when +110 ms arrives");

    pipeline::AggregatedSample last;
    TEST_ASSERT(agg.flush_source("VH001", last) && near(last.speed_kmh, 31.0), "flush_source emits the rest");
    TEST_ASSERT(!agg.flush_source("VH001", last), "nothing left");
    return true;
}

bool test_streaming_rejects_closed_bucket() {
    pipeline::SignalAggregator agg(pipeline::AggregatorConfig{});
    std::vector<pipeline::AggregatedSample> closed;
    agg.add(make_signal(T0 + 0.25, "speed_kmh", 30.0), closed);
    try {
        agg.add(make_signal(T0 + 0.05, "speed_kmh", 29.0), closed);
    } catch (const pipeline::UnorderedInputError& e) {
        TEST_ASSERT(e.stage() == "aggregate" && e.source_id() == "VH001", "error names stage and source");
        return true;
    }
    TEST_ASSERT(false, "signal for an emitted bucket should throw");
    return false;
}

bool test_sources_independent() {
    std::vector<can::DecodedSignal> in = {
        make_signal(T0 + 0.30, "speed_kmh", 90.0, "VH002"),
        make_signal(T0 + 0.01, "speed_kmh", 10.0, "VH001"),
        make_signal(T0 + 0.02, "speed_kmh", 40.0, "VH002"),
    };
    auto out = pipeline::SignalAggregator::aggregate(in, {});
    TEST_ASSERT(out.size() == 3, "three samples");
    TEST_ASSERT(out[0].source_id == "VH001" && near(out[0].speed_kmh, 10.0), "VH001 first");
    TEST_ASSERT(out[1].source_id == "VH002" && near(out[1].speed_kmh, 40.0), "VH002 +0 ms");
    TEST_ASSERT(out[2].source_id == "VH002" && near(out[2].speed_kmh, 90.0), "VH002 +300 ms");
    return true;
}

bool test_brake_flag_and_extra_fields() {
    can::DecodedSignal s = make_signal(T0, "brake_pressure", 40.0);
    s.field_values["brake_active"] = can::FieldValue::boolean(true);
    s.field_values["odo_km"] = can::FieldValue::numeric(1234.5);
    auto out = pipeline::SignalAggregator::aggregate({s}, {});
    TEST_ASSERT(out.size() == 1, "one sample");
    TEST_ASSERT(out[0].brake_active && *out[0].brake_active, "brake_active carried as bool");
    TEST_ASSERT(out[0].extra.count("odo_km") == 1, "unknown field kept in extra");
    return true;
}

int main() {
    std::cout << "Signal Aggregator Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_fusion_across_messages);
    RUN_TEST(test_last_value_wins);
    RUN_TEST(test_equal_timestamps_arrival_order);
    RUN_TEST(test_end_label);
    RUN_TEST(test_empty_buckets_skipped);
    RUN_TEST(test_streaming_emits_on_later_bucket);
    RUN_TEST(test_streaming_rejects_closed_bucket);
    RUN_TEST(test_sources_independent);
    RUN_TEST(test_brake_flag_and_extra_fields);

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Test Summary" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "========================================" << std::endl;

    if (failed == 0) {
        std::cout << "✓ All tests passed!" << std::endl;
        return 0;
    } else {
        std::cout << "✗ Some tests failed!" << std::endl;
        return 1;
    }
}
