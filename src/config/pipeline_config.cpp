// src/config/pipeline_config.cpp
#include "config/pipeline_config.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>

namespace config {

namespace {

PipelineConfig parse(const YAML::Node& root) {
    PipelineConfig cfg = PipelineConfig::get_default();

    if (root["pipeline"]) {
        auto p = root["pipeline"];
        cfg.dictionary_path = p["dictionary"].as<std::string>(cfg.dictionary_path);
        cfg.settings.quality_window_ms = p["quality_window_ms"].as<int64_t>(cfg.settings.quality_window_ms);
        cfg.settings.default_period_ms = p["default_period_ms"].as<double>(cfg.settings.default_period_ms);
        cfg.settings.aggregation_bucket_ms = p["aggregation_bucket_ms"].as<int64_t>(cfg.settings.aggregation_bucket_ms);
        cfg.settings.latest_bucket_ms = p["latest_bucket_ms"].as<int64_t>(cfg.settings.latest_bucket_ms);
    }

    if (root["events"]) {
        auto e = root["events"];
        auto& th = cfg.settings.thresholds;
        th.hard_brake_kmh_s = e["hard_brake_kmh_s"].as<double>(th.hard_brake_kmh_s);
        th.hard_accel_kmh_s = e["hard_accel_kmh_s"].as<double>(th.hard_accel_kmh_s);
        th.sharp_turn_deg = e["sharp_turn_deg"].as<double>(th.sharp_turn_deg);
    }

    if (root["stats"]) {
        auto s = root["stats"];
        cfg.settings.stats.speed_field = s["speed_field"].as<std::string>(cfg.settings.stats.speed_field);
        cfg.settings.stats.rpm_field = s["rpm_field"].as<std::string>(cfg.settings.stats.rpm_field);
        cfg.settings.stats.speed_period_ms = s["speed_period_ms"].as<double>(cfg.settings.stats.speed_period_ms);
    }

    if (root["output"]) {
        auto o = root["output"];
        cfg.output_dir = o["dir"].as<std::string>(cfg.output_dir);
        if (o["influx"]) {
            auto i = o["influx"];
            cfg.influx.enabled = i["enabled"].as<bool>(cfg.influx.enabled);
            cfg.influx.url = i["url"].as<std::string>(cfg.influx.url);
            cfg.influx.token = i["token"].as<std::string>(cfg.influx.token);
            cfg.influx.org = i["org"].as<std::string>(cfg.influx.org);
            cfg.influx.bucket = i["bucket"].as<std::string>(cfg.influx.bucket);
            cfg.influx.batch_lines = i["batch_lines"].as<size_t>(cfg.influx.batch_lines);
        }
    }

    if (root["logging"]) {
        auto l = root["logging"];
        cfg.log_level = l["level"].as<std::string>(cfg.log_level);
        cfg.log_file = l["file"].as<std::string>(cfg.log_file);
    }

    cfg.validate();
    return cfg;
}

} // namespace

PipelineConfig PipelineConfig::load(const std::string& yaml_path) {
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[PipelineConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[PipelineConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[PipelineConfig] Loading pipeline config from: %s", yaml_path.c_str());

    try {
        return parse(YAML::LoadFile(yaml_path));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(
            std::string("[PipelineConfig] YAML parse error: ") + e.what()
        );
    } catch (const std::exception& e) {
        throw std::runtime_error(
            std::string("[PipelineConfig] Load error: ") + e.what()
        );
    }
}

PipelineConfig PipelineConfig::from_string(const std::string& yaml_text) {
    try {
        return parse(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(
            std::string("[PipelineConfig] YAML parse error: ") + e.what()
        );
    }
}

PipelineConfig PipelineConfig::get_default() {
    PipelineConfig cfg;

    cfg.dictionary_path = "";

    cfg.settings.quality_window_ms = 60000;
    cfg.settings.default_period_ms = 100.0;
    cfg.settings.aggregation_bucket_ms = 100;
    cfg.settings.latest_bucket_ms = 1000;

    cfg.settings.thresholds.hard_brake_kmh_s = 35.0;
    cfg.settings.thresholds.hard_accel_kmh_s = 35.0;
    cfg.settings.thresholds.sharp_turn_deg = 20.0;

    cfg.settings.stats.speed_field = "speed_kmh";
    cfg.settings.stats.rpm_field = "rpm";
    cfg.settings.stats.speed_period_ms = 20.0;

    cfg.output_dir = "out";
    cfg.log_level = "info";
    cfg.log_file = "";

    return cfg;
}

void PipelineConfig::validate() const {
    const auto& s = settings;

    // Windows and buckets
    if (s.quality_window_ms <= 0) {
        throw std::runtime_error("Invalid quality_window_ms: must be > 0");
    }
    if (s.default_period_ms <= 0.0) {
        throw std::runtime_error("Invalid default_period_ms: must be > 0");
    }
    if (s.aggregation_bucket_ms <= 0) {
        throw std::runtime_error("Invalid aggregation_bucket_ms: must be > 0");
    }
    if (s.latest_bucket_ms <= 0) {
        throw std::runtime_error("Invalid latest_bucket_ms: must be > 0");
    }

    // Event thresholds
    if (s.thresholds.hard_brake_kmh_s <= 0.0) {
        throw std::runtime_error("Invalid hard_brake_kmh_s: must be > 0");
    }
    if (s.thresholds.hard_accel_kmh_s <= 0.0) {
        throw std::runtime_error("Invalid hard_accel_kmh_s: must be > 0");
    }
    if (s.thresholds.sharp_turn_deg <= 0.0) {
        throw std::runtime_error("Invalid sharp_turn_deg: must be > 0");
    }

    // Stats
    if (s.stats.speed_field.empty()) {
        throw std::runtime_error("Invalid speed_field: must not be empty");
    }
    if (s.stats.speed_period_ms <= 0.0) {
        throw std::runtime_error("Invalid speed_period_ms: must be > 0");
    }

    if (output_dir.empty()) {
        throw std::runtime_error("Invalid output.dir: must not be empty");
    }
    if (influx.enabled && influx.url.empty()) {
        throw std::runtime_error("Invalid influx.url: required when influx is enabled");
    }

    utils::LogLevel lvl;
    if (!utils::parse_level(log_level, lvl)) {
        throw std::runtime_error("Invalid logging.level: " + log_level);
    }
}

void PipelineConfig::print_summary() const {
    const auto& s = settings;
    LOG_INFO("================================================");
    LOG_INFO("Pipeline Configuration");
    LOG_INFO("================================================");
    LOG_INFO("Dictionary: %s", dictionary_path.empty() ? "(built-in vehicle)" : dictionary_path.c_str());
    LOG_INFO("");
    LOG_INFO("Windows:");
    LOG_INFO("  Quality window:  %lld ms", static_cast<long long>(s.quality_window_ms));
    LOG_INFO("  Default period:  %.1f ms", s.default_period_ms);
    LOG_INFO("  Aggregation:     %lld ms", static_cast<long long>(s.aggregation_bucket_ms));
    LOG_INFO("  Latest view:     %lld ms", static_cast<long long>(s.latest_bucket_ms));
    LOG_INFO("");
    LOG_INFO("Events:");
    LOG_INFO("  Hard brake:      %.1f km/h/s", s.thresholds.hard_brake_kmh_s);
    LOG_INFO("  Hard accel:      %.1f km/h/s", s.thresholds.hard_accel_kmh_s);
    LOG_INFO("  Sharp turn:      %.1f deg", s.thresholds.sharp_turn_deg);
    LOG_INFO("");
    LOG_INFO("Stats:");
    LOG_INFO("  Speed field:     %s (period %.1f ms)", s.stats.speed_field.c_str(), s.stats.speed_period_ms);
    LOG_INFO("");
    LOG_INFO("Output:");
    LOG_INFO("  CSV dir:         %s", output_dir.c_str());
    LOG_INFO("  InfluxDB:        %s", influx.enabled ? influx.url.c_str() : "disabled");
    LOG_INFO("================================================");
}

} // namespace config
