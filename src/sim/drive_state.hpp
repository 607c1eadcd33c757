// src/sim/drive_state.hpp
#pragma once

#include "can/decoded_signal.hpp"

namespace sim {

// Driver/vehicle state sampled by the generator every step
struct DriveState {
    double speed_kmh = 0.0;
    double rpm = 800.0;
    double throttle_pct = 0.0;
    double brake_pressure = 0.0;
    bool brake_active = false;
    double steering_angle = 0.0;   // deg, -1080..1080

    // Field values keyed by the dictionary's signal names
    can::FieldMap to_fields() const {
        can::FieldMap m;
        m["speed_kmh"] = can::FieldValue::numeric(speed_kmh);
        m["rpm"] = can::FieldValue::numeric(rpm);
        m["throttle_pct"] = can::FieldValue::numeric(throttle_pct);
        m["brake_pressure"] = can::FieldValue::numeric(brake_pressure);
        m["brake_active"] = can::FieldValue::boolean(brake_active);
        m["steering_angle"] = can::FieldValue::numeric(steering_angle);
        return m;
    }
};

} // namespace sim
