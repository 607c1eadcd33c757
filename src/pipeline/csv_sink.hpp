// src/pipeline/csv_sink.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "pipeline/records.hpp"
#include "utils/csv.hpp"

namespace pipeline {

/**
 * CsvSink - one CSV file per relation in an output directory
 *
 *   decoded_signals.csv  can_quality.csv  signals_aggregated.csv
 *   latest_signals.csv   event_history.csv  vehicle_stats.csv
 *
 * Unset values are written as empty cells. Decoded field values go into a
 * single "fields" cell as name=value pairs separated by ';'.
 * vehicle_stats.csv holds a snapshot and is rewritten by write_stats().
 */
class CsvSink {
public:
    // Creates the directory if needed
    bool open(const std::string& dir);

    void write(const PipelineOutputs& out);
    bool write_stats(const std::vector<VehicleStats>& stats);
    void flush();

    const std::string& dir() const { return dir_; }

    static std::string format_number(double v);
    static std::string format_timestamp(double ts);   // seconds, microsecond resolution
    static std::string format_optional(const std::optional<double>& v);
    static std::string format_optional(const std::optional<bool>& v);
    static std::string format_fields(const can::FieldMap& fields);

private:
    std::string path(const char* name) const { return dir_ + "/" + name; }

    std::string dir_;
    utils::CsvWriter decoded_;
    utils::CsvWriter quality_;
    utils::CsvWriter aggregated_;
    utils::CsvWriter latest_;
    utils::CsvWriter events_;
};

} // namespace pipeline
