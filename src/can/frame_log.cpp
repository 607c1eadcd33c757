// src/can/frame_log.cpp
#include "can/frame_log.hpp"
#include "utils/bytepack.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cstdio>
#include <vector>

namespace can {

bool FrameLogReader::open(const std::string& path, const std::string& default_source) {
    path_ = path;
    default_source_ = default_source.empty() ? source_from_path(path) : default_source;
    rows_read_ = 0;
    bad_rows_ = 0;

    if (!csv_.open(path)) {
        LOG_ERROR("[FrameLog] Cannot open %s", path.c_str());
        return false;
    }
    for (const char* required : {"ts", "arb_id", "data"}) {
        if (!csv_.has_column(required)) {
            LOG_ERROR("[FrameLog] %s: missing column '%s'", path.c_str(), required);
            return false;
        }
    }
    has_source_col_ = csv_.has_column("source_id");
    return true;
}

bool FrameLogReader::next(SourcedFrame& out) {
    std::vector<std::string> row;
    while (csv_.read_row(row)) {
        ++rows_read_;
        try {
            RawFrame f;
            f.timestamp = utils::CsvReader::to_double(csv_.get(row, "ts"));
            f.channel = csv_.get(row, "channel");
            f.arbitration_id = utils::CsvReader::to_uint32(csv_.get(row, "arb_id"));

            std::vector<uint8_t> bytes;
            if (!utils::parse_hex_bytes(csv_.get(row, "data"), bytes) || bytes.size() > f.payload.size()) {
                ++bad_rows_;
                LOG_WARN("[FrameLog] %s:%zu: bad data field", path_.c_str(), csv_.line_no());
                continue;
            }
            std::copy(bytes.begin(), bytes.end(), f.payload.begin());

            const int dlc = utils::CsvReader::to_int(csv_.get(row, "dlc"), static_cast<int>(bytes.size()));
            if (dlc < 0 || dlc > 8) {
                ++bad_rows_;
                LOG_WARN("[FrameLog] %s:%zu: dlc %d out of range", path_.c_str(), csv_.line_no(), dlc);
                continue;
            }
            // A short capture cannot claim bytes it does not carry
            f.length = static_cast<uint8_t>(static_cast<size_t>(dlc) < bytes.size() ? dlc : bytes.size());

            out.frame = f;
            out.source_id = has_source_col_ ? csv_.get(row, "source_id") : std::string();
            if (out.source_id.empty()) out.source_id = default_source_;
            return true;
        } catch (const std::exception& e) {
            ++bad_rows_;
            LOG_WARN("[FrameLog] %s:%zu: %s", path_.c_str(), csv_.line_no(), e.what());
        }
    }
    return false;
}

std::string FrameLogReader::source_from_path(const std::string& path) {
    size_t slash = path.find_last_of('/');
    std::string base = (slash == std::string::npos) ? path : path.substr(slash + 1);
    size_t dot = base.find_last_of('.');
    if (dot != std::string::npos && dot > 0) base = base.substr(0, dot);
    return base;
}

bool FrameLogWriter::open(const std::string& path, bool with_source) {
    with_source_ = with_source;
    std::vector<std::string> header = {"ts", "channel", "arb_id", "dlc", "data"};
    if (with_source) header.push_back("source_id");
    if (!csv_.open(path, header)) {
        LOG_ERROR("[FrameLog] Cannot write %s", path.c_str());
        return false;
    }
    return true;
}

void FrameLogWriter::write(const RawFrame& frame, const std::string& source_id) {
    char ts[32];
    std::snprintf(ts, sizeof(ts), "%.6f", frame.timestamp);

    std::vector<std::string> row = {
        ts,
        frame.channel,
        std::to_string(frame.arbitration_id),
        std::to_string(static_cast<int>(frame.length)),
        utils::to_hex(frame.payload.data(), frame.size()),
    };
    if (with_source_) row.push_back(source_id);
    csv_.write_row(row);
}

} // namespace can
