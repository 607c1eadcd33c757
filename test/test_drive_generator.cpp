// test/test_drive_generator.cpp
/**
 * Unit Test: Drive Generator
 *
 * Tests the synthetic CAN source used for demos and soak runs.
 *
 * Test Coverage:
 *   1. Frame scheduler periods
 *   2. Frame counts per message over one second
 *   3. Same seed, same frames
 *   4. Built-in drive produces the events the pipeline looks for
 *   5. Lua scenario
 *   6. Invalid configuration
 *   7. Real-time pacing
 */

#include "can/frame_codec.hpp"
#include "can/frame_scheduler.hpp"
#include "pipeline/pipeline.hpp"
#include "sim/drive_generator.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <stdexcept>

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

static const double T0 = 1700000000.0;

sim::DriveGenConfig short_run(double duration_s) {
    sim::DriveGenConfig cfg;
    cfg.duration_s = duration_s;
    cfg.start_ts = T0;
    return cfg;
}

void test_scheduler(TestResult& result) {
    std::cout << "\n=== Test 1: Frame Scheduler ===\n";

    auto dict = can::SignalDictionary::builtin_vehicle();
    can::FrameScheduler sched;
    sched.init(dict, 100.0);

    std::map<uint32_t, int> count;
    for (int64_t t = 0; t < 100; t += 10) {
        for (const can::MessageSpec* spec : sched.due(t)) {
            count[spec->arbitration_id]++;
        }
    }
    if (count[0x100] == 5 && count[0x101] == 10 && count[0x102] == 5 && count[0x103] == 2) {
        result.pass("100 ms: 5x 20 ms, 10x 10 ms, 2x 50 ms");
    } else {
        result.fail("Scheduler periods wrong");
    }

    // A gap skips missed slots instead of bursting
    auto late = sched.due(1000);
    auto next = sched.due(1010);
    bool speed_again = false;
    for (const auto* s : next) {
        if (s->arbitration_id == 0x100) speed_again = true;
    }
    if (late.size() == 4 && !speed_again) {
        result.pass("After a gap each message fires once, then back on period");
    } else {
        result.fail("Gap handling wrong");
    }
}

void test_frame_counts(TestResult& result) {
    std::cout << "\n=== Test 2: Frame Counts ===\n";

    auto dict = can::SignalDictionary::builtin_vehicle();
    sim::DriveGenerator gen(dict, short_run(1.0));

    std::map<uint32_t, int> count;
    bool all_decode = true;
    double last_ts = 0.0;
    bool ordered = true;
    auto stats = gen.run([&](const can::RawFrame& f) {
        count[f.arbitration_id]++;
        if (!can::FrameCodec::decode(f, dict)) all_decode = false;
        if (f.timestamp < last_ts) ordered = false;
        last_ts = f.timestamp;
    });

    if (stats.steps == 100 && stats.frames == 220) {
        result.pass("1 s at 10 ms: 100 steps, 220 frames");
    } else {
        result.fail("Step/frame totals wrong: " + std::to_string(stats.frames));
    }
    if (count[0x100] == 50 && count[0x101] == 100 && count[0x102] == 50 && count[0x103] == 20) {
        result.pass("Per-message counts follow the dictionary periods");
    } else {
        result.fail("Per-message counts wrong");
    }
    if (all_decode && ordered) {
        result.pass("Every frame decodes, timestamps non-decreasing");
    } else {
        result.fail("Undecodable or unordered frames");
    }
}

void test_deterministic(TestResult& result) {
    std::cout << "\n=== Test 3: Determinism ===\n";

    auto dict = can::SignalDictionary::builtin_vehicle();
    std::vector<can::RawFrame> a, b;
    sim::DriveGenerator g1(dict, short_run(30.0));
    sim::DriveGenerator g2(dict, short_run(30.0));
    g1.run([&](const can::RawFrame& f) { a.push_back(f); });
    g2.run([&](const can::RawFrame& f) { b.push_back(f); });

    bool same = a.size() == b.size();
    for (size_t i = 0; same && i < a.size(); ++i) {
        same = a[i].arbitration_id == b[i].arbitration_id && a[i].payload == b[i].payload &&
               a[i].timestamp == b[i].timestamp;
    }
    if (same) {
        result.pass("Same seed -> identical frames");
    } else {
        result.fail("Runs with the same seed differ");
    }

    auto cfg = short_run(30.0);
    cfg.seed = 7;
    std::vector<can::RawFrame> c;
    sim::DriveGenerator g3(dict, cfg);
    g3.run([&](const can::RawFrame& f) { c.push_back(f); });
    bool differs = c.size() != a.size();
    for (size_t i = 0; !differs && i < c.size(); ++i) {
        differs = a[i].payload != c[i].payload;
    }
    if (differs) {
        result.pass("Different seed -> different frames");
    } else {
        result.fail("Seed has no effect");
    }
}

void test_drive_events(TestResult& result) {
    std::cout << "\n=== Test 4: Built-in Drive Through the Pipeline ===\n";

    auto dict = can::SignalDictionary::builtin_vehicle();
    sim::DriveGenerator gen(dict, short_run(600.0));
    pipeline::Pipeline p(dict, pipeline::PipelineSettings{});

    std::vector<can::RawFrame> batch;
    pipeline::PipelineOutputs out;
    gen.run([&](const can::RawFrame& f) {
        batch.push_back(f);
        if (batch.size() >= 5000) {
            out.append(p.push("SIM", batch));
            batch.clear();
        }
    });
    out.append(p.push("SIM", batch));
    out.append(p.finish());

    std::map<pipeline::EventType, int> by_type;
    for (const auto& e : out.events) by_type[e.event_type]++;

    if (by_type[pipeline::EventType::HardBrake] > 0) {
        result.pass("Emergency braking -> hard_brake (" +
                    std::to_string(by_type[pipeline::EventType::HardBrake]) + ")");
    } else {
        result.fail("No hard_brake in the built-in drive");
    }
    if (by_type[pipeline::EventType::SharpTurn] > 0) {
        result.pass("Scripted turns -> sharp_turn (" +
                    std::to_string(by_type[pipeline::EventType::SharpTurn]) + ")");
    } else {
        result.fail("No sharp_turn in the built-in drive");
    }
    if (out.stats.size() == 1 && out.stats[0].distance_km > 1.0) {
        result.pass("Distance over 10 minutes: " + std::to_string(out.stats[0].distance_km) + " km");
    } else {
        result.fail("Implausible distance");
    }
}

void test_lua_scenario(TestResult& result) {
    std::cout << "\n=== Test 5: Lua Scenario ===\n";

    auto dict = can::SignalDictionary::builtin_vehicle();
    auto cfg = short_run(10.0);
    cfg.lua_script_path = "config/lua/scenario.lua";
    sim::DriveGenerator gen(dict, cfg);

    if (!gen.using_lua()) {
        result.fail("scenario.lua did not load");
        return;
    }
    result.pass("scenario.lua loaded");

    double first_speed = -1.0;
    double max_speed = -1.0;
    auto stats = gen.run([&](const can::RawFrame& f) {
        if (f.arbitration_id != 0x100) return;
        auto sig = can::FrameCodec::decode(f, dict);
        if (!sig) return;
        const double v = sig->find("speed_kmh")->as_double();
        if (first_speed < 0.0) first_speed = v;
        max_speed = std::max(max_speed, v);
    });
    if (stats.lua_errors == 0 && stats.frames == 2200) {
        result.pass("10 s scenario: 2200 frames, no Lua errors");
    } else {
        result.fail("Lua run stats wrong");
    }
    if (max_speed > first_speed + 5.0) {
        result.pass("Vehicle pulls away");
    } else {
        result.fail("Speed did not increase");
    }

    auto missing = short_run(1.0);
    missing.lua_script_path = "/nonexistent/scenario.lua";
    sim::DriveGenerator fallback(dict, missing);
    if (!fallback.using_lua()) {
        result.pass("Missing script falls back to the built-in profile");
    } else {
        result.fail("Missing script reported as loaded");
    }
}

void test_invalid_config(TestResult& result) {
    std::cout << "\n=== Test 6: Invalid Configuration ===\n";

    auto dict = can::SignalDictionary::builtin_vehicle();
    auto cfg = short_run(1.0);
    cfg.step_ms = 0;
    try {
        sim::DriveGenerator gen(dict, cfg);
        result.fail("Zero step should throw");
    } catch (const std::invalid_argument&) {
        result.pass("Zero step rejected");
    }
}

void test_real_time(TestResult& result) {
    std::cout << "\n=== Test 7: Real-time Pacing ===\n";

    auto dict = can::SignalDictionary::builtin_vehicle();
    auto cfg = short_run(0.3);
    cfg.real_time = true;
    sim::DriveGenerator gen(dict, cfg);

    const auto t0 = std::chrono::steady_clock::now();
    auto stats = gen.run([](const can::RawFrame&) {});
    const double wall = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    if (stats.frames == 66 && wall >= 0.29) {
        result.pass("0.3 s of frames took " + std::to_string(wall) + " s of wall time");
    } else {
        result.fail("Real-time run too fast or wrong frame count: " + std::to_string(wall));
    }
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║              Drive Generator Unit Tests                      ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    test_scheduler(result);
    test_frame_counts(result);
    test_deterministic(result);
    test_drive_events(result);
    test_lua_scenario(result);
    test_invalid_config(result);
    test_real_time(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
