// test/test_influx_client.cpp
// Unit tests for InfluxDB client integration

#include "utils/influx.hpp"
#include <iostream>
#include <string>

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

// Whole second so the nanosecond timestamp is exact
static const double T0 = 1700000000.0;

// Helper to create a decoded speed record
can::DecodedSignal create_test_signal() {
    can::DecodedSignal s;
    s.timestamp = T0;
    s.arbitration_id = 256;
    s.message_name = "VehicleSpeed";
    s.channel = "can0";
    s.source_id = "VH001";
    s.field_values["speed_kmh"] = can::FieldValue::numeric(80.0);
    return s;
}

// Test 1: Disabled client never sends
bool test_client_creation_disabled() {
    utils::InfluxClient::Config config;
    config.enabled = false;

    utils::InfluxClient client(config);
    TEST_ASSERT(!client.is_enabled(), "Client should be disabled");

    pipeline::PipelineOutputs out;
    out.decoded.push_back(create_test_signal());
    TEST_ASSERT(!client.write(out), "Disabled client write should return false");
    TEST_ASSERT(client.flush(), "Flush on disabled client is a no-op");
    TEST_ASSERT(client.lines_sent() == 0, "Nothing sent");
    return true;
}

// Test 2: Config defaults
bool test_config_defaults() {
    utils::InfluxClient::Config config;
    TEST_ASSERT(config.url == "http://localhost:8086", "Default URL");
    TEST_ASSERT(config.org == "telemetry", "Default org");
    TEST_ASSERT(config.bucket == "can-pipeline", "Default bucket");
    TEST_ASSERT(config.batch_lines == 5000, "Default batch size");
    TEST_ASSERT(!config.enabled, "Disabled by default");
    return true;
}

// Test 3: Tag escaping
bool test_escape_tag() {
    TEST_ASSERT(utils::InfluxClient::escape_tag("can0") == "can0", "Plain value unchanged");
    TEST_ASSERT(utils::InfluxClient::escape_tag("front axle,1=x") == "front\\ axle\\,1\\=x",
                "Space, comma and equals escaped");
    TEST_ASSERT(utils::InfluxClient::to_ns(T0) == 1700000000000000000LL, "Seconds to ns");
    return true;
}

// Test 4: Decoded signal line
bool test_decoded_line() {
    const std::string line = utils::InfluxClient::decoded_line(create_test_signal());
    TEST_ASSERT(line ==
                "can_signals,source_id=VH001,message_name=VehicleSpeed,channel=can0 "
                "speed_kmh=80,arbitration_id=256i 1700000000000000000",
                "Decoded line: " << line);

    can::DecodedSignal brake = create_test_signal();
    brake.field_values.clear();
    brake.field_values["brake_active"] = can::FieldValue::boolean(true);
    const std::string b = utils::InfluxClient::decoded_line(brake);
    TEST_ASSERT(b.find("brake_active=true") != std::string::npos, "Boolean written as true");
    return true;
}

// Test 5: Quality and event lines
bool test_quality_and_event_lines() {
    pipeline::QualityWindow q;
    q.window_start = T0;
    q.window_end = T0 + 60.0;
    q.arbitration_id = 0x100;
    q.message_name = "VehicleSpeed";
    q.channel = "can0";
    q.message_count = 1500;
    q.expected_count = 3000;
    q.expected_period_ms = 20.0;
    q.missing_rate = 0.5;
    q.source_id = "VH001";
    TEST_ASSERT(utils::InfluxClient::quality_line(q) ==
                "can_quality,source_id=VH001,arbitration_id=0x100,message_name=VehicleSpeed,channel=can0 "
                "message_count=1500i,expected_count=3000i,expected_period_ms=20,missing_rate=0.5 "
                "1700000000000000000",
                "Quality line");

    pipeline::Event e;
    e.timestamp = T0;
    e.event_type = pipeline::EventType::HardBrake;
    e.speed_kmh = 76.0;
    e.acceleration_kmh_s = -40.0;
    e.source_id = "VH001";
    TEST_ASSERT(utils::InfluxClient::event_line(e) ==
                "driving_events,source_id=VH001,event_type=hard_brake "
                "speed_kmh=76,acceleration_kmh_s=-40 1700000000000000000",
                "Event line");
    return true;
}

// Test 6: Aggregated and stats lines
bool test_aggregated_and_stats_lines() {
    pipeline::AggregatedSample empty;
    empty.timestamp = T0;
    empty.source_id = "VH001";
    TEST_ASSERT(utils::InfluxClient::aggregated_line(empty).empty(), "Sample without fields is skipped");

    pipeline::AggregatedSample s = empty;
    s.rpm = 2500.0;
    s.brake_active = false;
    TEST_ASSERT(utils::InfluxClient::aggregated_line(s) ==
                "signals_aggregated,source_id=VH001 rpm=2500,brake_active=false 1700000000000000000",
                "Aggregated line");

    pipeline::VehicleStats st;
    st.date = "2023-11-14";
    st.source_id = "VH001";
    st.distance_km = 1.5;
    st.sample_count = 10;
    st.first_timestamp = T0 - 5.0;
    st.last_timestamp = T0;
    TEST_ASSERT(utils::InfluxClient::stats_line(st) ==
                "vehicle_stats,source_id=VH001,date=2023-11-14 distance_km=1.5,sample_count=10i "
                "1700000000000000000",
                "Stats line stamped with last_timestamp");
    return true;
}

// Test 7: Unreachable server is counted, not thrown
bool test_unreachable_server() {
    utils::InfluxClient::Config config;
    config.enabled = true;
    config.url = "http://127.0.0.1:9";
    config.batch_lines = 1;

    utils::InfluxClient client(config);
    pipeline::PipelineOutputs out;
    out.decoded.push_back(create_test_signal());

    TEST_ASSERT(!client.write(out), "Write should report failure");
    TEST_ASSERT(client.failed_writes() == 1, "One failed request");
    TEST_ASSERT(client.lines_sent() == 0, "Nothing counted as sent");
    return true;
}

int main() {
    std::cout << "InfluxDB Client Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    // Run all tests
    RUN_TEST(test_client_creation_disabled);
    RUN_TEST(test_config_defaults);
    RUN_TEST(test_escape_tag);
    RUN_TEST(test_decoded_line);
    RUN_TEST(test_quality_and_event_lines);
    RUN_TEST(test_aggregated_and_stats_lines);
    RUN_TEST(test_unreachable_server);

    // Print summary
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
