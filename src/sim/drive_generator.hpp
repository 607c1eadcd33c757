// src/sim/drive_generator.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "can/frame_scheduler.hpp"
#include "can/raw_frame.hpp"
#include "can/signal_dictionary.hpp"
#include "sim/drive_profile.hpp"
#include "sim/lua_runtime.hpp"

namespace sim {

struct DriveGenConfig {
    double duration_s = 600.0;
    int step_ms = 10;
    double start_ts = 0.0;              // epoch seconds of t=0; 0 = now
    std::string channel = "can0";
    std::string lua_script_path;        // empty = built-in profile
    double default_period_ms = 100.0;   // for messages without a period
    uint32_t seed = 42;
    bool real_time = false;             // pace steps to wall-clock time
};

/**
 * DriveGenerator - scenario state -> periodic CAN frames
 *
 * Every step_ms the scenario (Lua script, or the built-in profile) yields a
 * DriveState; each dictionary message whose period has elapsed is encoded
 * from it and handed to the sink in message-id order.
 */
class DriveGenerator {
public:
    using FrameSink = std::function<void(const can::RawFrame&)>;

    struct Stats {
        uint64_t steps = 0;
        uint64_t frames = 0;
        uint64_t lua_errors = 0;
        size_t deadline_misses = 0;
    };

    DriveGenerator(const can::SignalDictionary& dict, DriveGenConfig cfg);

    // Runs the whole scenario; stop() may be called from a signal handler path
    Stats run(const FrameSink& sink);

    void stop() { stop_requested_ = true; }

    bool using_lua() const { return lua_ != nullptr; }
    const DriveGenConfig& config() const { return cfg_; }

private:
    DriveState next_state(int64_t t_ms);

    const can::SignalDictionary& dict_;
    DriveGenConfig cfg_;
    can::FrameScheduler scheduler_;
    DriveProfile profile_;
    std::unique_ptr<LuaRuntime> lua_;
    DriveState state_;
    Stats stats_;
    std::atomic<bool> stop_requested_{false};
};

} // namespace sim
