// src/sim/drive_profile.cpp
#include "sim/drive_profile.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>

namespace sim {

namespace {

struct PhaseDef {
    const char* name;
    double start_s;
    double end_s;
    double target_kmh;
};

struct ActionDef {
    size_t phase;
    double offset_s;
    DriveProfile::Action action;
    double value;
    const char* name;
};

// Reference timeline for a 600 s drive
const PhaseDef kPhases[] = {
    {"departure",          0.0,  60.0,  40.0},
    {"city_driving",      60.0, 180.0,  50.0},
    {"highway_merge",    180.0, 240.0, 100.0},
    {"highway_cruise",   240.0, 360.0, 100.0},
    {"overtaking",       360.0, 390.0, 120.0},
    {"emergency_braking",390.0, 420.0,  60.0},
    {"highway_exit",     420.0, 480.0,  50.0},
    {"city_return",      480.0, 570.0,  40.0},
    {"parking",          570.0, 600.0,   0.0},
};

using A = DriveProfile::Action;
const ActionDef kActions[] = {
    {0,  5.0, A::StartEngine,       0.0, "start_engine"},
    {1, 20.0, A::TrafficStop,      50.0, "traffic_stop"},
    {1, 50.0, A::Turn,            450.0, "right_turn"},
    {1, 80.0, A::TrafficStop,      50.0, "traffic_stop"},
    {1,100.0, A::Turn,           -400.0, "left_turn"},
    {2, 10.0, A::HardAcceleration, 95.0, "hard_acceleration"},
    {2, 40.0, A::Turn,            180.0, "lane_change_right"},
    {3, 30.0, A::Turn,             80.0, "slight_curve_right"},
    {3, 70.0, A::Turn,            -90.0, "slight_curve_left"},
    {4,  5.0, A::HardAcceleration, 90.0, "hard_acceleration"},
    {4, 10.0, A::Turn,           -200.0, "lane_change_left"},
    {4, 20.0, A::Turn,            190.0, "lane_change_right"},
    {5,  5.0, A::EmergencyBrake,  100.0, "emergency_brake"},
    {5,  8.0, A::Turn,           -350.0, "evasive_steering"},
    {6, 10.0, A::Deceleration,      0.0, "deceleration"},
    {6, 30.0, A::Turn,            300.0, "exit_curve"},
    {7, 20.0, A::TrafficStop,      50.0, "traffic_stop"},
    {7, 40.0, A::EmergencyBrake,   70.0, "pedestrian_stop"},
    {7, 60.0, A::Turn,            380.0, "right_turn"},
    {8, 10.0, A::Turn,           -500.0, "parking_maneuver"},
    {8, 25.0, A::FullStop,         30.0, "full_stop"},
};

} // namespace

DriveProfile::DriveProfile(double duration_s, uint32_t seed)
    : duration_s_(duration_s), rng_(seed) {
    const double scale = duration_s_ / 600.0;

    for (const auto& p : kPhases) {
        phases_.push_back(Phase{p.name, p.start_s * scale, p.end_s * scale, p.target_kmh});
    }
    for (const auto& a : kActions) {
        ScheduledAction sa;
        sa.t_ms = static_cast<int64_t>((phases_[a.phase].start_s + a.offset_s * scale) * 1000.0);
        sa.action = a.action;
        sa.value = a.value;
        sa.name = a.name;
        schedule_.push_back(sa);
    }
    std::stable_sort(schedule_.begin(), schedule_.end(),
                     [](const ScheduledAction& x, const ScheduledAction& y) { return x.t_ms < y.t_ms; });
}

const DriveProfile::Phase& DriveProfile::phase_at(double t_s) const {
    for (const auto& p : phases_) {
        if (t_s >= p.start_s && t_s < p.end_s) {
            return p;
        }
    }
    return phases_.back();
}

void DriveProfile::apply(const ScheduledAction& a) {
    switch (a.action) {
        case Action::EmergencyBrake:
            state_.brake_pressure = a.value;
            state_.brake_active = true;
            state_.throttle_pct = 0.0;
            break;
        case Action::TrafficStop:
            state_.brake_pressure = a.value;
            state_.brake_active = true;
            state_.throttle_pct = 0.0;
            break;
        case Action::HardAcceleration:
            state_.throttle_pct = a.value;
            state_.brake_pressure = 0.0;
            state_.brake_active = false;
            break;
        case Action::Turn:
            state_.steering_angle = a.value;
            break;
        case Action::Deceleration:
            state_.throttle_pct = 10.0;
            state_.brake_pressure = 20.0;
            state_.brake_active = true;
            break;
        case Action::FullStop:
            state_.brake_pressure = a.value;
            state_.brake_active = true;
            state_.throttle_pct = 0.0;
            break;
        case Action::StartEngine:
            break;
    }
    LOG_DEBUG("[Profile] %s at %.1f km/h", a.name.c_str(), state_.speed_kmh);
}

const DriveState& DriveProfile::step(int64_t t_ms, int dt_ms) {
    const double t_s = static_cast<double>(t_ms) / 1000.0;

    // Actions whose time has come; one at a time, none while another is held
    while (next_action_ < schedule_.size() && schedule_[next_action_].t_ms <= t_ms) {
        const ScheduledAction& a = schedule_[next_action_++];
        if (active_ms_ <= 0) {
            apply(a);
            active_ms_ = std::uniform_int_distribution<int>(2000, 4000)(rng_);
        }
    }

    update_physics(dt_ms / 1000.0, phase_at(t_s).target_speed_kmh);

    if (active_ms_ > 0) {
        active_ms_ -= dt_ms;
        if (active_ms_ <= 0) {
            state_.brake_pressure = 0.0;
            state_.brake_active = false;
            state_.throttle_pct = 30.0;
        }
    }
    return state_;
}

void DriveProfile::update_physics(double dt_s, double target_speed_kmh) {
    std::uniform_real_distribution<double> jitter(-1.0, 1.0);
    DriveState& s = state_;
    const double speed_diff = target_speed_kmh - s.speed_kmh;

    // Cruise control toward the phase target
    if (!s.brake_active && s.throttle_pct < 50.0) {
        if (speed_diff > 5.0) {
            s.throttle_pct = std::min(60.0, 30.0 + speed_diff);
        } else if (speed_diff < -5.0) {
            s.throttle_pct = 10.0;
            s.brake_pressure = std::min(30.0, -speed_diff);
            s.brake_active = s.brake_pressure > 10.0;
        } else {
            s.throttle_pct = 25.0 + 5.0 * jitter(rng_);
        }
    }

    if (s.throttle_pct > 0.0 && !s.brake_active) {
        s.speed_kmh = std::min(140.0, s.speed_kmh + s.throttle_pct * 0.12 * dt_s);
    }
    if (s.brake_active) {
        s.speed_kmh = std::max(0.0, s.speed_kmh - s.brake_pressure * 0.4 * dt_s);
    }
    if (s.throttle_pct == 0.0 && !s.brake_active) {
        s.speed_kmh = std::max(0.0, s.speed_kmh - 3.0 * dt_s);
    }

    // Six-speed automatic
    const int gear = std::min(6, std::max(1, static_cast<int>(s.speed_kmh / 25.0) + 1));
    const double base_rpm = 800.0 + (s.speed_kmh / gear) * 80.0;
    s.rpm = std::min(6500.0, std::max(800.0, base_rpm + s.throttle_pct * 15.0 + 30.0 * jitter(rng_)));

    // Self-centering with road noise
    s.steering_angle *= (1.0 - 2.0 * dt_s);
    s.steering_angle += 3.0 * jitter(rng_);
    s.steering_angle = std::max(-1080.0, std::min(1080.0, s.steering_angle));

    if (!s.brake_active) {
        s.brake_pressure = std::max(0.0, s.brake_pressure - 100.0 * dt_s);
    }
}

} // namespace sim
