// src/pipeline/pipeline_errors.hpp
#pragma once

#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace pipeline {

// Timestamps went backwards within one source. Fatal to that source's
// processing; carries enough context to diagnose without a re-run.
class UnorderedInputError : public std::runtime_error {
public:
    UnorderedInputError(const std::string& stage, const std::string& source_id,
                        double timestamp, double previous_timestamp,
                        uint32_t arbitration_id)
        : std::runtime_error(format(stage, source_id, timestamp, previous_timestamp, arbitration_id)),
          stage_(stage), source_id_(source_id), timestamp_(timestamp),
          previous_timestamp_(previous_timestamp), arbitration_id_(arbitration_id) {}

    const std::string& stage() const { return stage_; }
    const std::string& source_id() const { return source_id_; }
    double timestamp() const { return timestamp_; }
    double previous_timestamp() const { return previous_timestamp_; }
    uint32_t arbitration_id() const { return arbitration_id_; }

private:
    static std::string format(const std::string& stage, const std::string& source,
                              double ts, double prev, uint32_t id) {
        char buf[320];
        std::snprintf(buf, sizeof(buf),
                      "unordered input in %s: source '%s' timestamp %.6f after %.6f (arbitration id 0x%03X)",
                      stage.c_str(), source.c_str(), ts, prev, id);
        return buf;
    }

    std::string stage_;
    std::string source_id_;
    double timestamp_;
    double previous_timestamp_;
    uint32_t arbitration_id_;
};

} // namespace pipeline
