// src/sim/drive_profile.hpp
#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "sim/drive_state.hpp"

namespace sim {

/**
 * DriveProfile - built-in ten minute drive, scaled to the requested length
 *
 * Phases: departure, city driving, highway merge, cruise, overtaking,
 * emergency braking, highway exit, city return, parking. Scripted actions
 * (traffic stops, turns, hard acceleration, emergency brake) are applied at
 * fixed offsets and held for 2-4 s. Between actions a cruise-control loop
 * tracks the phase's target speed.
 *
 * Deterministic for a given seed.
 */
class DriveProfile {
public:
    enum class Action {
        StartEngine,
        TrafficStop,
        Turn,
        HardAcceleration,
        EmergencyBrake,
        Deceleration,
        FullStop
    };

    struct ScheduledAction {
        int64_t t_ms = 0;
        Action action = Action::StartEngine;
        double value = 0.0;          // steering deg, throttle %, or brake %
        std::string name;
    };

    struct Phase {
        std::string name;
        double start_s = 0.0;
        double end_s = 0.0;
        double target_speed_kmh = 0.0;
    };

    explicit DriveProfile(double duration_s, uint32_t seed = 42);

    // Advance by dt_ms. t_ms must grow by dt_ms on every call.
    const DriveState& step(int64_t t_ms, int dt_ms);

    const DriveState& state() const { return state_; }
    const std::vector<Phase>& phases() const { return phases_; }
    const std::vector<ScheduledAction>& schedule() const { return schedule_; }
    const Phase& phase_at(double t_s) const;

private:
    void apply(const ScheduledAction& a);
    void update_physics(double dt_s, double target_speed_kmh);

    double duration_s_;
    std::mt19937 rng_;
    DriveState state_;
    std::vector<Phase> phases_;
    std::vector<ScheduledAction> schedule_;
    size_t next_action_ = 0;
    int active_ms_ = 0;
};

} // namespace sim
