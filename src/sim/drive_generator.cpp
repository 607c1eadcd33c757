// src/sim/drive_generator.cpp
#include "sim/drive_generator.hpp"
#include "sim/timing_controller.hpp"
#include "can/frame_codec.hpp"
#include "utils/logging.hpp"

#include <chrono>
#include <cmath>
#include <stdexcept>

namespace sim {

DriveGenerator::DriveGenerator(const can::SignalDictionary& dict, DriveGenConfig cfg)
    : dict_(dict), cfg_(std::move(cfg)), profile_(cfg_.duration_s, cfg_.seed) {
    if (cfg_.step_ms <= 0) {
        throw std::invalid_argument("generator step must be positive");
    }
    if (cfg_.duration_s <= 0.0) {
        throw std::invalid_argument("generator duration must be positive");
    }

    scheduler_.init(dict_, cfg_.default_period_ms);

    if (!cfg_.lua_script_path.empty()) {
        lua_ = std::make_unique<LuaRuntime>();
        if (!lua_->init(cfg_.lua_script_path, cfg_.duration_s)) {
            LOG_WARN("[Generator] Lua scenario unavailable, using built-in profile");
            lua_.reset();
        }
    }

    if (cfg_.start_ts <= 0.0) {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        cfg_.start_ts = std::floor(std::chrono::duration<double>(now).count());
    }

    LOG_INFO("[Generator] %.1f s at %d ms steps, %zu messages, scenario: %s",
             cfg_.duration_s, cfg_.step_ms, scheduler_.size(),
             lua_ ? cfg_.lua_script_path.c_str() : "built-in");
}

DriveState DriveGenerator::next_state(int64_t t_ms) {
    if (lua_) {
        DriveState out;
        if (lua_->get_state(static_cast<double>(t_ms) / 1000.0, state_, out)) {
            return out;
        }
        stats_.lua_errors++;
        return state_;   // hold the last good state
    }
    return profile_.step(t_ms, cfg_.step_ms);
}

DriveGenerator::Stats DriveGenerator::run(const FrameSink& sink) {
    stats_ = Stats{};
    stop_requested_ = false;

    std::unique_ptr<TimingController> timer;
    if (cfg_.real_time) {
        timer = std::make_unique<TimingController>();
    }

    const int64_t end_ms = static_cast<int64_t>(std::llround(cfg_.duration_s * 1000.0));
    for (int64_t t_ms = 0; t_ms < end_ms && !stop_requested_; t_ms += cfg_.step_ms) {
        state_ = next_state(t_ms);
        stats_.steps++;

        const double ts = cfg_.start_ts + static_cast<double>(t_ms) / 1000.0;
        const can::FieldMap fields = state_.to_fields();
        for (const can::MessageSpec* spec : scheduler_.due(t_ms)) {
            sink(can::FrameCodec::encode(*spec, fields, ts, cfg_.channel));
            stats_.frames++;
        }

        if (timer) {
            timer->pace_to(t_ms + cfg_.step_ms);
        }
    }

    if (timer) {
        stats_.deadline_misses = timer->stats().late_steps;
        LOG_INFO("[Generator] Timing: %zu late steps, max lateness %lld us, drift %.3f s",
                 timer->stats().late_steps, static_cast<long long>(timer->stats().max_late_us),
                 timer->drift_s());
    }
    LOG_INFO("[Generator] %llu steps, %llu frames",
             static_cast<unsigned long long>(stats_.steps),
             static_cast<unsigned long long>(stats_.frames));
    return stats_;
}

} // namespace sim
