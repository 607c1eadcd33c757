// src/can/frame_codec.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "can/decoded_signal.hpp"
#include "can/raw_frame.hpp"
#include "can/signal_dictionary.hpp"

namespace can {

class FrameCodec {
public:
    /**
     * Decode one frame against the dictionary
     *
     * @return std::nullopt if the arbitration id is unknown (not an error)
     * @throws TruncatedFrameError if any signal lies beyond frame.length;
     *         the whole frame is invalid in that case
     */
    static std::optional<DecodedSignal> decode(const RawFrame& frame,
                                               const SignalDictionary& dict,
                                               const std::string& source_id = "");

    // Decode with a known MessageSpec (no lookup)
    static DecodedSignal decode_message(const MessageSpec& spec, const RawFrame& frame,
                                        const std::string& source_id = "");

    /**
     * Inverse transform: physical values -> payload bytes
     * - raw = round((value - offset) / scale), clamped to the field width
     * - booleans are written as 0 / 1
     * - missing fields are written as raw 0
     */
    static RawFrame encode(const MessageSpec& spec, const FieldMap& values,
                           double timestamp, const std::string& channel);

    // Convenience
    static bool has(const FieldMap& m, const std::string& key);
    static double get_or(const FieldMap& m, const std::string& key, double fallback);

private:
    static uint64_t to_raw(const SignalSpec& sig, const FieldValue& v);
};

/**
 * FrameDecoder - FrameCodec::decode with per-frame error recovery
 *
 * Unknown ids and truncated frames are dropped and counted; decode() never
 * throws for per-frame problems.
 */
class FrameDecoder {
public:
    struct Stats {
        uint64_t frames_in = 0;
        uint64_t decoded = 0;
        uint64_t unknown_dropped = 0;
        uint64_t truncated_dropped = 0;
    };

    explicit FrameDecoder(const SignalDictionary& dict) : dict_(dict) {}

    std::optional<DecodedSignal> decode(const RawFrame& frame, const std::string& source_id = "");

    const Stats& stats() const { return stats_; }
    void reset_stats() { stats_ = Stats{}; }

private:
    const SignalDictionary& dict_;
    Stats stats_;
};

} // namespace can
