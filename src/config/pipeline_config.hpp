// src/config/pipeline_config.hpp
#pragma once

#include <string>
#include "pipeline/pipeline.hpp"
#include "utils/influx.hpp"

namespace config {

/**
 * PipelineConfig - Loads pipeline settings from YAML
 *
 * Usage:
 *   auto cfg = PipelineConfig::load("config/pipeline.yaml");
 *   auto dict = can::SignalDictionary::load(cfg.dictionary_path);
 *   pipeline::Pipeline p(dict, cfg.settings);
 *
 * Falls back to defaults if the file is not found. Command line flags are
 * applied on top by the caller.
 */
class PipelineConfig {
public:
    // Signal dictionary (.dbc or .csv); empty = built-in vehicle table
    std::string dictionary_path;

    pipeline::PipelineSettings settings;

    std::string output_dir = "out";
    utils::InfluxClient::Config influx;

    std::string log_level = "info";
    std::string log_file;

    /**
     * Load config from YAML file
     * @throws std::runtime_error if file exists but is invalid
     *
     * If the file doesn't exist, returns the default configuration with a warning.
     */
    static PipelineConfig load(const std::string& yaml_path);

    // Parse YAML text (used by load and by tests)
    static PipelineConfig from_string(const std::string& yaml_text);

    static PipelineConfig get_default();

    /**
     * Validate settings
     * @throws std::runtime_error if any parameter is invalid
     */
    void validate() const;

    void print_summary() const;

    PipelineConfig() = default;
};

} // namespace config
