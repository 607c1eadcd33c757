// src/can/signal_dictionary.hpp
#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

#include "utils/bytepack.hpp"

namespace can {

enum class SignalKind {
    Numeric,   // raw * scale + offset
    Boolean    // raw != 0
};

// One field inside a CAN message, byte aligned
struct SignalSpec {
    std::string field_name;

    size_t byte_offset = 0;
    size_t byte_width = 1;
    utils::ByteOrder byte_order = utils::ByteOrder::Big;
    SignalKind kind = SignalKind::Numeric;

    double scale = 1.0;
    double offset = 0.0;

    std::string unit;
};

// One message type
struct MessageSpec {
    uint32_t arbitration_id = 0;
    std::string name;
    double expected_period_ms = 0.0;   // 0 = not specified in the source
    int dlc = 8;

    std::vector<SignalSpec> signals;

    bool has_period() const { return expected_period_ms > 0.0; }
    const SignalSpec* find_signal(const std::string& field_name) const;
};

/**
 * SignalDictionary - arbitration id -> MessageSpec table
 *
 * Loaded once at startup and shared read-only by the decoder, the quality
 * tracker and the frame generator. Lookups are O(1).
 *
 *   auto dict = can::SignalDictionary::load("config/vehicle.dbc");
 *   const can::MessageSpec* spec = dict.find(0x100);
 */
class SignalDictionary {
public:
    SignalDictionary() = default;

    /**
     * Load from file, format picked by extension (.dbc, otherwise CSV)
     * @throws MissingDictionaryError if the file is absent, empty or invalid
     */
    static SignalDictionary load(const std::string& path);

    static SignalDictionary load_dbc(const std::string& path);
    static SignalDictionary load_dbc(std::istream& is, const std::string& origin);
    static SignalDictionary load_csv(const std::string& path);

    // The four demo messages (VehicleSpeed, EngineData, BrakeData, SteeringData)
    static SignalDictionary builtin_vehicle();

    /**
     * Add or replace a message definition
     * @throws std::invalid_argument if a signal does not fit in 8 bytes
     */
    void add(MessageSpec spec);

    const MessageSpec* find(uint32_t arbitration_id) const;

    // @throws UnknownMessageError
    const MessageSpec& at(uint32_t arbitration_id) const;

    // First message that defines a field with this name, or nullptr
    const MessageSpec* find_by_field(const std::string& field_name) const;

    bool empty() const { return messages_.empty(); }
    size_t size() const { return messages_.size(); }

    // Arbitration ids in ascending order
    std::vector<uint32_t> ids() const;

    // Log every message and signal at INFO
    void print_summary() const;

private:
    std::unordered_map<uint32_t, MessageSpec> messages_;

    static void validate_signal(const MessageSpec& msg, const SignalSpec& sig);
};

} // namespace can
