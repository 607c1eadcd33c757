// src/pipeline/csv_sink.cpp
#include "pipeline/csv_sink.hpp"
#include "utils/logging.hpp"

#include <cstdio>
#include <filesystem>
#include <system_error>

namespace pipeline {

namespace {

const std::vector<std::string> kSampleHeader = {
    "timestamp", "source_id", "speed_kmh", "rpm", "throttle_pct",
    "brake_pressure", "brake_active", "steering_angle"};

std::vector<std::string> sample_row(const AggregatedSample& s) {
    return {CsvSink::format_timestamp(s.timestamp), s.source_id,
            CsvSink::format_optional(s.speed_kmh), CsvSink::format_optional(s.rpm),
            CsvSink::format_optional(s.throttle_pct), CsvSink::format_optional(s.brake_pressure),
            CsvSink::format_optional(s.brake_active), CsvSink::format_optional(s.steering_angle)};
}

} // namespace

std::string CsvSink::format_number(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.10g", v);
    return buf;
}

std::string CsvSink::format_timestamp(double ts) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6f", ts);
    return buf;
}

std::string CsvSink::format_optional(const std::optional<double>& v) {
    return v ? format_number(*v) : std::string();
}

std::string CsvSink::format_optional(const std::optional<bool>& v) {
    if (!v) return "";
    return *v ? "true" : "false";
}

std::string CsvSink::format_fields(const can::FieldMap& fields) {
    std::string out;
    for (const auto& kv : fields) {
        if (!out.empty()) out += ';';
        out += kv.first;
        out += '=';
        if (kv.second.is_bool) {
            out += kv.second.as_bool() ? "true" : "false";
        } else {
            out += format_number(kv.second.as_double());
        }
    }
    return out;
}

bool CsvSink::open(const std::string& dir) {
    dir_ = dir;
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        LOG_ERROR("[CsvSink] cannot create %s: %s", dir_.c_str(), ec.message().c_str());
        return false;
    }

    bool ok = decoded_.open(path("decoded_signals.csv"),
                            {"timestamp", "source_id", "arbitration_id", "message_name",
                             "channel", "fields"});
    ok = ok && quality_.open(path("can_quality.csv"),
                             {"window_start", "window_end", "source_id", "arbitration_id",
                              "message_name", "channel", "message_count", "expected_count",
                              "expected_period_ms", "missing_rate", "first_ts", "last_ts"});
    ok = ok && aggregated_.open(path("signals_aggregated.csv"), kSampleHeader);
    ok = ok && latest_.open(path("latest_signals.csv"), kSampleHeader);
    ok = ok && events_.open(path("event_history.csv"),
                            {"timestamp", "source_id", "event_type", "speed_kmh",
                             "acceleration_kmh_s", "steering_angle", "steering_angle_delta",
                             "brake_pressure"});
    if (!ok) {
        LOG_ERROR("[CsvSink] cannot open output files in %s", dir_.c_str());
        return false;
    }
    LOG_INFO("[CsvSink] writing to %s/", dir_.c_str());
    return true;
}

void CsvSink::write(const PipelineOutputs& out) {
    for (const auto& d : out.decoded) {
        decoded_.write_row({format_timestamp(d.timestamp), d.source_id,
                            std::to_string(d.arbitration_id), d.message_name, d.channel,
                            format_fields(d.field_values)});
    }
    for (const auto& q : out.quality) {
        quality_.write_row({format_timestamp(q.window_start), format_timestamp(q.window_end),
                            q.source_id, std::to_string(q.arbitration_id), q.message_name,
                            q.channel, std::to_string(q.message_count),
                            std::to_string(q.expected_count), format_number(q.expected_period_ms),
                            format_number(q.missing_rate), format_timestamp(q.first_ts),
                            format_timestamp(q.last_ts)});
    }
    for (const auto& s : out.aggregated) {
        aggregated_.write_row(sample_row(s));
    }
    for (const auto& s : out.latest) {
        latest_.write_row(sample_row(s));
    }
    for (const auto& e : out.events) {
        events_.write_row({format_timestamp(e.timestamp), e.source_id, to_string(e.event_type),
                           format_optional(e.speed_kmh), format_optional(e.acceleration_kmh_s),
                           format_optional(e.steering_angle),
                           format_optional(e.steering_angle_delta),
                           format_optional(e.brake_pressure)});
    }
}

bool CsvSink::write_stats(const std::vector<VehicleStats>& stats) {
    utils::CsvWriter w;
    if (!w.open(path("vehicle_stats.csv"),
                {"date", "source_id", "avg_speed_kmh", "max_speed_kmh", "avg_rpm", "max_rpm",
                 "distance_km", "sample_count", "first_timestamp", "last_timestamp"})) {
        LOG_ERROR("[CsvSink] cannot write %s", path("vehicle_stats.csv").c_str());
        return false;
    }
    for (const auto& s : stats) {
        w.write_row({s.date, s.source_id, format_optional(s.avg_speed_kmh),
                     format_optional(s.max_speed_kmh), format_optional(s.avg_rpm),
                     format_optional(s.max_rpm), format_number(s.distance_km),
                     std::to_string(s.sample_count), format_timestamp(s.first_timestamp),
                     format_timestamp(s.last_timestamp)});
    }
    w.flush();
    return true;
}

void CsvSink::flush() {
    decoded_.flush();
    quality_.flush();
    aggregated_.flush();
    latest_.flush();
    events_.flush();
}

} // namespace pipeline
