// utils/influx.cpp
#include "influx.hpp"
#include "logging.hpp"
#include <curl/curl.h>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace utils {

// ============================================================================
// Private Implementation (Pimpl)
// ============================================================================

struct InfluxClient::Impl {
    CURL* curl = nullptr;
    struct curl_slist* headers = nullptr;
    std::string write_url;
    std::string auth_header;

    Impl() {
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }

    ~Impl() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

// Discard response body (only the HTTP status matters)
static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    (void)contents;
    (void)userp;
    return size * nmemb;
}

namespace {

std::string num(double v) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%.10g", v);
    return buf;
}

// Appends "key=value" to a field set, comma separated
void field(std::string& fields, const std::string& key, const std::string& value) {
    if (!fields.empty()) fields += ',';
    fields += InfluxClient::escape_tag(key);
    fields += '=';
    fields += value;
}

void opt_field(std::string& fields, const char* key, const std::optional<double>& v) {
    if (v && std::isfinite(*v)) field(fields, key, num(*v));
}

std::string assemble(const std::string& measurement, const std::string& tags,
                     const std::string& fields, double ts_s) {
    if (fields.empty()) {
        return "";
    }
    std::ostringstream line;
    line << measurement << tags << " " << fields << " " << InfluxClient::to_ns(ts_s);
    return line.str();
}

std::string tag(const char* key, const std::string& value) {
    if (value.empty()) return "";
    return std::string(",") + key + "=" + InfluxClient::escape_tag(value);
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

InfluxClient::InfluxClient(const Config& config)
    : config_(config)
    , impl_(std::make_unique<Impl>())
{
    if (!config_.enabled) {
        LOG_INFO("[InfluxDB] Client created but disabled (use --influx flag to enable)");
        return;
    }
    if (config_.batch_lines == 0) {
        config_.batch_lines = 1;
    }

    // http://localhost:8086/api/v2/write?org=...&bucket=...&precision=ns
    std::ostringstream url_builder;
    url_builder << config_.url << "/api/v2/write"
                << "?org=" << config_.org
                << "&bucket=" << config_.bucket
                << "&precision=ns";
    impl_->write_url = url_builder.str();

    impl_->headers = curl_slist_append(impl_->headers, "Content-Type: text/plain; charset=utf-8");

    if (!config_.token.empty()) {
        impl_->auth_header = "Authorization: Token " + config_.token;
        impl_->headers = curl_slist_append(impl_->headers, impl_->auth_header.c_str());
        LOG_INFO("[InfluxDB] Authentication enabled (token configured)");
    } else {
        LOG_WARN("[InfluxDB] No authentication token provided - writes may fail!");
    }

    curl_easy_setopt(impl_->curl, CURLOPT_URL, impl_->write_url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, impl_->headers);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT, 5L);

    LOG_INFO("[InfluxDB] Client initialized: url=%s org=%s bucket=%s batch=%zu lines",
             config_.url.c_str(), config_.org.c_str(), config_.bucket.c_str(),
             config_.batch_lines);
}

InfluxClient::~InfluxClient() {
    if (config_.enabled) {
        flush();
        LOG_INFO("[InfluxDB] Client shutdown (%llu lines sent, %llu failed writes)",
                 static_cast<unsigned long long>(lines_sent_),
                 static_cast<unsigned long long>(failed_writes_));
    }
}

// ============================================================================
// Public Interface
// ============================================================================

bool InfluxClient::write(const pipeline::PipelineOutputs& out) {
    if (!config_.enabled) {
        return false;
    }

    const uint64_t failed_before = failed_writes_;
    for (const auto& d : out.decoded) queue(decoded_line(d));
    for (const auto& q : out.quality) queue(quality_line(q));
    for (const auto& s : out.aggregated) queue(aggregated_line(s));
    for (const auto& e : out.events) queue(event_line(e));
    for (const auto& s : out.stats) queue(stats_line(s));
    return failed_writes_ == failed_before;
}

void InfluxClient::queue(const std::string& line) {
    if (line.empty()) {
        return;
    }
    pending_ += line;
    pending_ += '\n';
    if (++pending_lines_ >= config_.batch_lines) {
        flush();
    }
}

bool InfluxClient::flush() {
    if (!config_.enabled || pending_lines_ == 0) {
        return true;
    }
    const bool ok = send_to_influx(pending_);
    if (ok) {
        lines_sent_ += pending_lines_;
    } else {
        failed_writes_++;
    }
    pending_.clear();
    pending_lines_ = 0;
    return ok;
}

// ============================================================================
// Line Protocol Builders (field names match the CSV columns)
// ============================================================================

std::string InfluxClient::escape_tag(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == ',' || c == ' ' || c == '=') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

int64_t InfluxClient::to_ns(double ts_s) {
    return static_cast<int64_t>(std::llround(ts_s * 1e9));
}

std::string InfluxClient::decoded_line(const can::DecodedSignal& sig) {
    std::string fields;
    for (const auto& kv : sig.field_values) {
        if (kv.second.is_bool) {
            field(fields, kv.first, kv.second.as_bool() ? "true" : "false");
        } else if (std::isfinite(kv.second.as_double())) {
            field(fields, kv.first, num(kv.second.as_double()));
        }
    }
    if (!fields.empty()) {
        field(fields, "arbitration_id", std::to_string(sig.arbitration_id) + "i");
    }
    return assemble("can_signals",
                    tag("source_id", sig.source_id) + tag("message_name", sig.message_name) +
                        tag("channel", sig.channel),
                    fields, sig.timestamp);
}

std::string InfluxClient::quality_line(const pipeline::QualityWindow& q) {
    char id[16];
    std::snprintf(id, sizeof(id), "0x%03X", q.arbitration_id);

    std::string fields;
    field(fields, "message_count", std::to_string(q.message_count) + "i");
    field(fields, "expected_count", std::to_string(q.expected_count) + "i");
    field(fields, "expected_period_ms", num(q.expected_period_ms));
    field(fields, "missing_rate", num(q.missing_rate));
    return assemble("can_quality",
                    tag("source_id", q.source_id) + tag("arbitration_id", id) +
                        tag("message_name", q.message_name) + tag("channel", q.channel),
                    fields, q.window_start);
}

std::string InfluxClient::aggregated_line(const pipeline::AggregatedSample& s) {
    std::string fields;
    opt_field(fields, "speed_kmh", s.speed_kmh);
    opt_field(fields, "rpm", s.rpm);
    opt_field(fields, "throttle_pct", s.throttle_pct);
    opt_field(fields, "brake_pressure", s.brake_pressure);
    if (s.brake_active) field(fields, "brake_active", *s.brake_active ? "true" : "false");
    opt_field(fields, "steering_angle", s.steering_angle);
    return assemble("signals_aggregated", tag("source_id", s.source_id), fields, s.timestamp);
}

std::string InfluxClient::event_line(const pipeline::Event& e) {
    std::string fields;
    opt_field(fields, "speed_kmh", e.speed_kmh);
    opt_field(fields, "acceleration_kmh_s", e.acceleration_kmh_s);
    opt_field(fields, "steering_angle", e.steering_angle);
    opt_field(fields, "steering_angle_delta", e.steering_angle_delta);
    opt_field(fields, "brake_pressure", e.brake_pressure);
    return assemble("driving_events",
                    tag("source_id", e.source_id) + tag("event_type", pipeline::to_string(e.event_type)),
                    fields, e.timestamp);
}

std::string InfluxClient::stats_line(const pipeline::VehicleStats& s) {
    std::string fields;
    opt_field(fields, "avg_speed_kmh", s.avg_speed_kmh);
    opt_field(fields, "max_speed_kmh", s.max_speed_kmh);
    opt_field(fields, "avg_rpm", s.avg_rpm);
    opt_field(fields, "max_rpm", s.max_rpm);
    field(fields, "distance_km", num(s.distance_km));
    field(fields, "sample_count", std::to_string(s.sample_count) + "i");
    return assemble("vehicle_stats", tag("source_id", s.source_id) + tag("date", s.date),
                    fields, s.last_timestamp);
}

// ============================================================================
// HTTP Communication
// ============================================================================

bool InfluxClient::send_to_influx(const std::string& line_protocol) {
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, line_protocol.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(line_protocol.size()));

    CURLcode res = curl_easy_perform(impl_->curl);

    if (res != CURLE_OK) {
        LOG_ERROR("[InfluxDB] Write failed: CURL error: %s", curl_easy_strerror(res));
        return false;
    }

    long http_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code != 204) {  // InfluxDB returns 204 No Content on success
        LOG_ERROR("[InfluxDB] Write failed: HTTP %ld (expected 204)", http_code);
        return false;
    }

    if (lines_sent_ == 0) {
        LOG_INFO("[InfluxDB] First write successful");
    } else {
        LOG_DEBUG("[InfluxDB] %llu lines sent so far", static_cast<unsigned long long>(lines_sent_));
    }
    return true;
}

} // namespace utils
