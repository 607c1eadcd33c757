// src/can/frame_codec.cpp
#include "can/frame_codec.hpp"
#include "can/can_errors.hpp"
#include "utils/bytepack.hpp"
#include "utils/logging.hpp"

#include <cmath>

namespace can {

bool FrameCodec::has(const FieldMap& m, const std::string& key) {
    return m.find(key) != m.end();
}

double FrameCodec::get_or(const FieldMap& m, const std::string& key, double fallback) {
    auto it = m.find(key);
    return (it == m.end()) ? fallback : it->second.as_double();
}

std::optional<DecodedSignal> FrameCodec::decode(const RawFrame& frame,
                                                const SignalDictionary& dict,
                                                const std::string& source_id) {
    const MessageSpec* spec = dict.find(frame.arbitration_id);
    if (!spec) {
        return std::nullopt;
    }
    return decode_message(*spec, frame, source_id);
}

DecodedSignal FrameCodec::decode_message(const MessageSpec& spec, const RawFrame& frame,
                                         const std::string& source_id) {
    DecodedSignal out;
    out.timestamp = frame.timestamp;
    out.arbitration_id = frame.arbitration_id;
    out.message_name = spec.name;
    out.channel = frame.channel;
    out.source_id = source_id;

    const size_t len = frame.size();
    for (const auto& sig : spec.signals) {
        uint64_t raw = 0;
        if (!utils::get_bytes(frame.payload.data(), len,
                              sig.byte_offset, sig.byte_width, sig.byte_order, raw)) {
            throw TruncatedFrameError(frame.arbitration_id, sig.field_name,
                                      sig.byte_offset, sig.byte_width, len);
        }

        if (sig.kind == SignalKind::Boolean) {
            out.field_values[sig.field_name] = FieldValue::boolean(raw != 0);
        } else {
            out.field_values[sig.field_name] =
                FieldValue::numeric(static_cast<double>(raw) * sig.scale + sig.offset);
        }
    }
    return out;
}

uint64_t FrameCodec::to_raw(const SignalSpec& sig, const FieldValue& v) {
    if (sig.kind == SignalKind::Boolean) {
        return v.as_bool() ? 1u : 0u;
    }

    const double raw_f = (v.as_double() - sig.offset) / sig.scale;
    if (!(raw_f > 0.0)) {
        return 0;   // also catches NaN
    }
    const uint64_t limit = utils::max_unsigned(sig.byte_width);
    if (raw_f >= static_cast<double>(limit)) {
        return limit;
    }
    return static_cast<uint64_t>(std::llround(raw_f));
}

RawFrame FrameCodec::encode(const MessageSpec& spec, const FieldMap& values,
                            double timestamp, const std::string& channel) {
    RawFrame out;
    out.timestamp = timestamp;
    out.channel = channel;
    out.arbitration_id = spec.arbitration_id;
    out.length = static_cast<uint8_t>(spec.dlc < 0 ? 0 : (spec.dlc > 8 ? 8 : spec.dlc));
    out.payload.fill(0);

    for (const auto& sig : spec.signals) {
        auto it = values.find(sig.field_name);
        if (it == values.end()) continue;

        utils::set_bytes(out.payload.data(), out.payload.size(),
                         sig.byte_offset, sig.byte_width, sig.byte_order,
                         to_raw(sig, it->second));
    }
    return out;
}

// ============================================================================
// FrameDecoder
// ============================================================================

std::optional<DecodedSignal> FrameDecoder::decode(const RawFrame& frame, const std::string& source_id) {
    ++stats_.frames_in;

    const MessageSpec* spec = dict_.find(frame.arbitration_id);
    if (!spec) {
        ++stats_.unknown_dropped;
        LOG_TRACE("[Decoder] drop unknown id 0x%03X at %.6f", frame.arbitration_id, frame.timestamp);
        return std::nullopt;
    }

    try {
        DecodedSignal sig = FrameCodec::decode_message(*spec, frame, source_id);
        ++stats_.decoded;
        return sig;
    } catch (const TruncatedFrameError& e) {
        ++stats_.truncated_dropped;
        LOG_DEBUG("[Decoder] drop frame at %.6f: %s", frame.timestamp, e.what());
        return std::nullopt;
    }
}

} // namespace can
