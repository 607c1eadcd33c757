// utils/influx.hpp
#pragma once

#include "pipeline/records.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace utils {

/**
 * InfluxDB v2 sink for pipeline outputs (line protocol over HTTP, libcurl)
 *
 * Writes the same relations as the CSV sink so dashboards can read them
 * live. Lines are buffered and posted once batch_lines is reached, on
 * flush() and on destruction.
 *
 * Measurement schema (tag source_id on every line, timestamps from the
 * data in ns):
 *   - can_signals:        one line per decoded frame, one field per signal
 *   - can_quality:        one line per quality window
 *   - signals_aggregated: one line per 100 ms sample
 *   - driving_events:     one line per event, tag event_type
 *   - vehicle_stats:      one line per (date, source), tag date
 */
class InfluxClient {
public:
    struct Config {
        std::string url = "http://localhost:8086";  // InfluxDB server URL
        std::string token = "";                      // Authentication token (optional for local)
        std::string org = "telemetry";               // Organization name
        std::string bucket = "can-pipeline";         // Bucket name
        size_t batch_lines = 5000;                   // Lines per HTTP request
        bool enabled = false;                        // Only enabled with --influx flag
    };

    /**
     * @param config InfluxDB configuration
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    explicit InfluxClient(const Config& config);

    // Flushes pending lines
    ~InfluxClient();

    /**
     * Queue every record of one pipeline batch
     * @return false if a send triggered by this call failed
     */
    bool write(const pipeline::PipelineOutputs& out);

    // Send whatever is buffered
    bool flush();

    bool is_enabled() const { return config_.enabled; }
    const Config& get_config() const { return config_; }

    uint64_t lines_sent() const { return lines_sent_; }
    uint64_t failed_writes() const { return failed_writes_; }

    // ---- Line protocol builders (empty string if the record has no fields) ----

    static std::string decoded_line(const can::DecodedSignal& sig);
    static std::string quality_line(const pipeline::QualityWindow& q);
    static std::string aggregated_line(const pipeline::AggregatedSample& s);
    static std::string event_line(const pipeline::Event& e);
    static std::string stats_line(const pipeline::VehicleStats& s);

    // Escape commas, spaces and '=' in tag keys/values
    static std::string escape_tag(const std::string& s);

    // Seconds since epoch -> ns
    static int64_t to_ns(double ts_s);

private:
    Config config_;

    // Implementation details hidden (pimpl pattern)
    struct Impl;
    std::unique_ptr<Impl> impl_;

    std::string pending_;
    size_t pending_lines_ = 0;
    uint64_t lines_sent_ = 0;
    uint64_t failed_writes_ = 0;

    void queue(const std::string& line);
    bool send_to_influx(const std::string& line_protocol);
};

} // namespace utils
