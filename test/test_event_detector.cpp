// test/test_event_detector.cpp
/**
 * Unit Test: Event Detector
 *
 * Tests threshold rules over adjacent 100 ms samples.
 *
 * Test Coverage:
 *   1. Mild deceleration (no event)
 *   2. Hard brake
 *   3. Hard acceleration
 *   4. Sharp turn
 *   5. Rule priority (one event per sample)
 *   6. Missing values skip their rule
 *   7. Ordering: backwards rejected, equal accepted
 *   8. detect() is repeatable, sources are independent
 */

#include "pipeline/event_detector.hpp"
#include "pipeline/pipeline_errors.hpp"
#include <cmath>
#include <iostream>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET  "\033[0m"

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

bool is_close(double actual, double expected, double tolerance = 0.001) {
    if (std::abs(expected) < 1e-9) {
        return std::abs(actual) < tolerance;
    }
    return std::abs(actual - expected) / std::abs(expected) < tolerance;
}

static const double T0 = 1700000040.0;

pipeline::AggregatedSample sample(double ts, std::optional<double> speed,
                                  std::optional<double> steering = std::nullopt,
                                  const std::string& source = "VH001") {
    pipeline::AggregatedSample s;
    s.timestamp = ts;
    s.speed_kmh = speed;
    s.steering_angle = steering;
    s.source_id = source;
    return s;
}

pipeline::EventDetector make_detector() {
    return pipeline::EventDetector(pipeline::EventDetectorConfig{});
}

void test_mild_deceleration(TestResult& result) {
    std::cout << "\n=== Test 1: Mild Deceleration ===\n";

    auto det = make_detector();
    auto events = det.detect({sample(T0, 80.0), sample(T0 + 0.1, 79.0)});
    if (events.empty()) {
        result.pass("80 -> 79 km/h in 100 ms (-10 km/h/s) is not an event");
    } else {
        result.fail("Mild deceleration flagged");
    }
}

void test_hard_brake(TestResult& result) {
    std::cout << "\n=== Test 2: Hard Brake ===\n";

    auto det = make_detector();
    auto events = det.detect({sample(T0, 80.0), sample(T0 + 0.1, 76.0)});
    if (events.size() != 1) {
        result.fail("80 -> 76 km/h should give one event");
        return;
    }
    const auto& e = events[0];
    if (e.event_type == pipeline::EventType::HardBrake &&
        std::string(pipeline::to_string(e.event_type)) == "hard_brake") {
        result.pass("80 -> 76 km/h -> hard_brake");
    } else {
        result.fail("Wrong event type");
    }
    if (e.acceleration_kmh_s && is_close(*e.acceleration_kmh_s, -40.0) &&
        e.speed_kmh && is_close(*e.speed_kmh, 76.0) && e.timestamp == T0 + 0.1) {
        result.pass("acceleration -40 km/h/s, values from the later sample");
    } else {
        result.fail("Event values wrong");
    }

    // Exactly at the threshold is not an event
    auto edge = det.detect({sample(T0, 80.0), sample(T0 + 0.1, 76.5)});
    if (edge.empty()) {
        result.pass("-35 km/h/s is not below -35");
    } else {
        result.fail("Threshold should be strict");
    }
}

void test_hard_acceleration(TestResult& result) {
    std::cout << "\n=== Test 3: Hard Acceleration ===\n";

    auto det = make_detector();
    auto events = det.detect({sample(T0, 50.0), sample(T0 + 0.1, 54.0)});
    if (events.size() == 1 && events[0].event_type == pipeline::EventType::HardAcceleration &&
        is_close(*events[0].acceleration_kmh_s, 40.0)) {
        result.pass("50 -> 54 km/h -> hard_acceleration (+40 km/h/s)");
    } else {
        result.fail("Hard acceleration not detected");
    }
}

void test_sharp_turn(TestResult& result) {
    std::cout << "\n=== Test 4: Sharp Turn ===\n";

    auto det = make_detector();
    auto events = det.detect({sample(T0, 60.0, 10.0), sample(T0 + 0.1, 60.0, 35.0)});
    if (events.size() == 1 && events[0].event_type == pipeline::EventType::SharpTurn &&
        events[0].steering_angle_delta && is_close(*events[0].steering_angle_delta, 25.0)) {
        result.pass("Steering 10 -> 35 deg -> sharp_turn, delta 25");
    } else {
        result.fail("Sharp turn not detected");
    }

    auto left = det.detect({sample(T0, 60.0, 10.0), sample(T0 + 0.1, 60.0, -15.0)});
    if (left.size() == 1 && is_close(*left[0].steering_angle_delta, 25.0)) {
        result.pass("Delta is absolute (10 -> -15 deg)");
    } else {
        result.fail("Negative steering change missed");
    }
}

void test_priority(TestResult& result) {
    std::cout << "\n=== Test 5: Rule Priority ===\n";

    auto det = make_detector();
    auto events = det.detect({sample(T0, 80.0, 0.0), sample(T0 + 0.1, 70.0, 40.0)});
    if (events.size() == 1 && events[0].event_type == pipeline::EventType::HardBrake &&
        events[0].steering_angle_delta && is_close(*events[0].steering_angle_delta, 40.0)) {
        result.pass("Brake and turn together -> one hard_brake event");
    } else {
        result.fail("Priority rule broken");
    }
}

void test_missing_values(TestResult& result) {
    std::cout << "\n=== Test 6: Missing Values ===\n";

    auto det = make_detector();
    auto events = det.detect({sample(T0, std::nullopt, 10.0), sample(T0 + 0.1, 20.0, 11.0),
                              sample(T0 + 0.2, 10.0, std::nullopt)});
    if (events.size() == 1 && events[0].event_type == pipeline::EventType::HardBrake &&
        events[0].timestamp == T0 + 0.2 && !events[0].steering_angle_delta) {
        result.pass("Null speed skips acceleration, null steering skips turn");
    } else {
        result.fail("Null handling wrong");
    }

    auto none = det.detect({sample(T0, std::nullopt), sample(T0 + 0.1, std::nullopt)});
    if (none.empty()) {
        result.pass("All-null samples produce nothing");
    } else {
        result.fail("Event from empty samples");
    }
}

void test_ordering(TestResult& result) {
    std::cout << "\n=== Test 7: Ordering ===\n";

    auto det = make_detector();
    det.observe(sample(T0 + 0.2, 50.0));
    try {
        det.observe(sample(T0 + 0.1, 50.0));
        result.fail("Backwards sample should throw");
    } catch (const pipeline::UnorderedInputError& e) {
        if (e.stage() == "events" && e.previous_timestamp() == T0 + 0.2) {
            result.pass("Backwards sample -> UnorderedInputError");
        } else {
            result.fail("Error context wrong");
        }
    }

    try {
        det.reset();
        det.observe(sample(T0, 50.0));
        det.observe(sample(T0, 50.0));
        result.pass("Equal timestamps accepted");
    } catch (const pipeline::UnorderedInputError&) {
        result.fail("Equal timestamps rejected");
    }
}

void test_repeatable(TestResult& result) {
    std::cout << "\n=== Test 8: Repeatable and Per-Source ===\n";

    auto det = make_detector();
    std::vector<pipeline::AggregatedSample> in = {
        sample(T0, 80.0), sample(T0 + 0.1, 76.0), sample(T0 + 0.2, 72.0)};
    auto a = det.detect(in);
    auto b = det.detect(in);
    if (a.size() == 2 && b.size() == 2) {
        result.pass("detect() twice gives the same events");
    } else {
        result.fail("detect() carries state between calls");
    }

    // Interleaved sources: each compared only with its own previous sample
    auto mixed = det.detect({sample(T0, 80.0, std::nullopt, "A"), sample(T0, 20.0, std::nullopt, "B"),
                             sample(T0 + 0.1, 80.0, std::nullopt, "A"),
                             sample(T0 + 0.1, 20.0, std::nullopt, "B")});
    if (mixed.empty()) {
        result.pass("Sources do not mix");
    } else {
        result.fail("Cross-source comparison");
    }
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║              Event Detector Unit Tests                       ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    test_mild_deceleration(result);
    test_hard_brake(result);
    test_hard_acceleration(result);
    test_sharp_turn(result);
    test_priority(result);
    test_missing_values(result);
    test_ordering(result);
    test_repeatable(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
