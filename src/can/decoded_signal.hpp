// src/can/decoded_signal.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace can {

// A decoded field value: physical number or flag.
// Zero is a valid value; absence is expressed by the field not being present.
struct FieldValue {
    double number = 0.0;
    bool is_bool = false;

    static FieldValue numeric(double v) { return FieldValue{v, false}; }
    static FieldValue boolean(bool b) { return FieldValue{b ? 1.0 : 0.0, true}; }

    double as_double() const { return number; }
    bool as_bool() const { return number != 0.0; }

    bool operator==(const FieldValue& o) const { return number == o.number && is_bool == o.is_bool; }
    bool operator!=(const FieldValue& o) const { return !(*this == o); }
};

using FieldMap = std::map<std::string, FieldValue>;

// One record per successfully decoded frame. field_values holds exactly the
// signals of the matching MessageSpec.
struct DecodedSignal {
    double timestamp = 0.0;
    uint32_t arbitration_id = 0;
    std::string message_name;
    std::string channel;
    FieldMap field_values;
    std::string source_id;

    const FieldValue* find(const std::string& field) const {
        auto it = field_values.find(field);
        return it == field_values.end() ? nullptr : &it->second;
    }
};

} // namespace can
