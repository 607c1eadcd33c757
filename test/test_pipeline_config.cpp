// test/test_pipeline_config.cpp
/**
 * Unit Test: PipelineConfig
 *
 * Tests YAML loading, validation, and default configuration.
 *
 * Test Coverage:
 *   1. Default configuration
 *   2. Shipped config/pipeline.yaml
 *   3. Partial YAML keeps defaults for absent keys
 *   4. Missing file fallback to defaults
 *   5. Parameter validation (windows, thresholds, log level)
 *   6. Malformed YAML
 */

#include "config/pipeline_config.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
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

// Helper: Check if value is close to expected
bool is_close(double actual, double expected, double tolerance = 0.0001) {
    if (std::abs(expected) < 1e-9) {
        return std::abs(actual) < tolerance;
    }
    return std::abs(actual - expected) / std::abs(expected) < tolerance;
}

// Helper: expect from_string to reject the text with a message mentioning 'key'
void expect_rejected(TestResult& result, const std::string& yaml, const std::string& key) {
    try {
        config::PipelineConfig::from_string(yaml);
        result.fail("Should have rejected " + key);
    } catch (const std::exception& e) {
        std::string msg = e.what();
        if (msg.find(key) != std::string::npos) {
            result.pass("Rejected " + key + ": " + msg);
        } else {
            result.fail("Exception thrown but wrong message: " + msg);
        }
    }
}

// Test 1: Default configuration
void test_default_config(TestResult& result) {
    std::cout << "\n=== Test 1: Default Configuration ===\n";

    auto cfg = config::PipelineConfig::get_default();
    const auto& s = cfg.settings;

    if (s.quality_window_ms == 60000 && s.aggregation_bucket_ms == 100 && s.latest_bucket_ms == 1000) {
        result.pass("Windows: 60 s quality, 100 ms aggregation, 1 s latest");
    } else {
        result.fail("Window defaults wrong");
    }
    if (is_close(s.thresholds.hard_brake_kmh_s, 35.0) && is_close(s.thresholds.hard_accel_kmh_s, 35.0) &&
        is_close(s.thresholds.sharp_turn_deg, 20.0)) {
        result.pass("Thresholds: 35 / 35 km/h/s, 20 deg");
    } else {
        result.fail("Threshold defaults wrong");
    }
    if (cfg.dictionary_path.empty() && !cfg.influx.enabled && cfg.log_level == "info") {
        result.pass("Built-in dictionary, InfluxDB off, level info");
    } else {
        result.fail("Output defaults wrong");
    }

    try {
        cfg.validate();
        result.pass("Defaults validate");
    } catch (const std::exception& e) {
        result.fail(std::string("Defaults rejected: ") + e.what());
    }
}

// Test 2: Shipped config file
void test_shipped_yaml(TestResult& result) {
    std::cout << "\n=== Test 2: Shipped pipeline.yaml ===\n";

    try {
        auto cfg = config::PipelineConfig::load("config/pipeline.yaml");
        if (cfg.dictionary_path == "config/vehicle.dbc") {
            result.pass("Dictionary path: " + cfg.dictionary_path);
        } else {
            result.fail("Dictionary path mismatch: " + cfg.dictionary_path);
        }
        if (cfg.influx.bucket == "can-pipeline" && cfg.influx.batch_lines == 5000) {
            result.pass("InfluxDB section loaded");
        } else {
            result.fail("InfluxDB section mismatch");
        }
    } catch (const std::exception& e) {
        result.fail(std::string("Exception during load: ") + e.what());
    }
}

// Test 3: Partial YAML
void test_partial_yaml(TestResult& result) {
    std::cout << "\n=== Test 3: Partial YAML ===\n";

    try {
        auto cfg = config::PipelineConfig::from_string(R"(
pipeline:
  quality_window_ms: 10000
events:
  sharp_turn_deg: 15.5
output:
  dir: /tmp/canpipe_out
  influx:
    enabled: true
    token: abc
logging:
  level: debug
)");
        if (cfg.settings.quality_window_ms == 10000 && cfg.settings.aggregation_bucket_ms == 100) {
            result.pass("quality_window_ms overridden, aggregation default kept");
        } else {
            result.fail("Window merge wrong");
        }
        if (is_close(cfg.settings.thresholds.sharp_turn_deg, 15.5) &&
            is_close(cfg.settings.thresholds.hard_brake_kmh_s, 35.0)) {
            result.pass("sharp_turn_deg 15.5, hard_brake default kept");
        } else {
            result.fail("Threshold merge wrong");
        }
        if (cfg.output_dir == "/tmp/canpipe_out" && cfg.influx.enabled && cfg.influx.token == "abc" &&
            cfg.influx.url == "http://localhost:8086" && cfg.log_level == "debug") {
            result.pass("Output and logging sections merged");
        } else {
            result.fail("Output/logging merge wrong");
        }
    } catch (const std::exception& e) {
        result.fail(std::string("Exception during parse: ") + e.what());
    }
}

// Test 4: Missing file fallback
void test_missing_file(TestResult& result) {
    std::cout << "\n=== Test 4: Missing File Fallback ===\n";

    try {
        auto cfg = config::PipelineConfig::load("/tmp/nonexistent_pipeline_config.yaml");
        if (cfg.settings.quality_window_ms == 60000 && cfg.output_dir == "out") {
            result.pass("Missing file correctly fell back to defaults");
        } else {
            result.fail("Fallback defaults are invalid");
        }
    } catch (const std::exception& e) {
        result.fail(std::string("Unexpected exception: ") + e.what());
    }
}

// Test 5: Validation
void test_validation(TestResult& result) {
    std::cout << "\n=== Test 5: Validation ===\n";

    expect_rejected(result, "pipeline:\n  quality_window_ms: 0\n", "quality_window_ms");
    expect_rejected(result, "pipeline:\n  aggregation_bucket_ms: -100\n", "aggregation_bucket_ms");
    expect_rejected(result, "events:\n  hard_brake_kmh_s: 0\n", "hard_brake_kmh_s");
    expect_rejected(result, "stats:\n  speed_period_ms: 0\n", "speed_period_ms");
    expect_rejected(result, "logging:\n  level: loud\n", "logging.level");
    expect_rejected(result, "output:\n  influx:\n    enabled: true\n    url: \"\"\n", "influx.url");

    // Same check applies to files
    const char* temp_yaml = "/tmp/test_pipeline_invalid.yaml";
    std::ofstream yaml_file(temp_yaml);
    yaml_file << "pipeline:\n  default_period_ms: -5\n";
    yaml_file.close();
    try {
        config::PipelineConfig::load(temp_yaml);
        result.fail("Should have thrown for negative default_period_ms");
    } catch (const std::exception& e) {
        std::string msg = e.what();
        if (msg.find("default_period_ms") != std::string::npos) {
            result.pass("File with negative default_period_ms rejected");
        } else {
            result.fail("Exception thrown but wrong message: " + msg);
        }
    }
    std::remove(temp_yaml);
}

// Test 6: Malformed YAML
void test_malformed(TestResult& result) {
    std::cout << "\n=== Test 6: Malformed YAML ===\n";

    expect_rejected(result, "pipeline: [unclosed\n", "YAML");
    expect_rejected(result, "pipeline:\n  quality_window_ms: sixty\n", "YAML");
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            PipelineConfig Unit Tests                         ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    test_default_config(result);
    test_shipped_yaml(result);
    test_partial_yaml(result);
    test_missing_file(result);
    test_validation(result);
    test_malformed(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
