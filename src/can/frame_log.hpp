// src/can/frame_log.hpp
#pragma once

#include <cstdint>
#include <string>

#include "can/raw_frame.hpp"
#include "utils/csv.hpp"

namespace can {

// Frame plus the data source / run it belongs to
struct SourcedFrame {
    std::string source_id;
    RawFrame frame;
};

/**
 * FrameLogReader - CSV frame log
 *
 *   ts,channel,arb_id,dlc,data[,source_id]
 *   1700000000.020,can0,256,8,1F40000000000000
 *
 * arb_id accepts decimal or 0x-prefixed hex; data is hex. Rows without a
 * source_id column (or with an empty cell) use the default source.
 * Malformed rows are skipped and counted.
 */
class FrameLogReader {
public:
    bool open(const std::string& path, const std::string& default_source);

    // false at end of file
    bool next(SourcedFrame& out);

    uint64_t rows_read() const { return rows_read_; }
    uint64_t bad_rows() const { return bad_rows_; }

    // "logs/VH001_run1.csv" -> "VH001_run1"
    static std::string source_from_path(const std::string& path);

private:
    utils::CsvReader csv_;
    std::string path_;
    std::string default_source_;
    bool has_source_col_ = false;
    uint64_t rows_read_ = 0;
    uint64_t bad_rows_ = 0;
};

class FrameLogWriter {
public:
    bool open(const std::string& path, bool with_source);
    void write(const RawFrame& frame, const std::string& source_id = "");
    void flush() { csv_.flush(); }

private:
    utils::CsvWriter csv_;
    bool with_source_ = false;
};

} // namespace can
