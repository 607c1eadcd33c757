// src/sim/timing_controller.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <thread>

namespace sim {

/**
 * TimingController - holds the generator to wall-clock rate
 *
 * The caller passes the simulated time (integer ms since start) it has just
 * finished producing; the controller blocks until that much wall time has
 * elapsed since start(). Deadlines are measured from a fixed origin, so a
 * late step is not carried into the next one.
 */
class TimingController {
public:
    struct Stats {
        size_t paced_steps = 0;
        size_t late_steps = 0;
        int64_t max_late_us = 0;
    };

    TimingController() { start(); }

    void start() {
        origin_ = Clock::now();
        last_sim_ms_ = 0;
        stats_ = Stats{};
    }

    // Returns false when sim_ms was already behind wall time on entry
    bool pace_to(int64_t sim_ms) {
        last_sim_ms_ = sim_ms;
        stats_.paced_steps++;

        const auto deadline = origin_ + std::chrono::milliseconds(sim_ms);
        const auto now = Clock::now();
        if (now > deadline) {
            const int64_t late_us =
                std::chrono::duration_cast<std::chrono::microseconds>(now - deadline).count();
            stats_.late_steps++;
            if (late_us > stats_.max_late_us) stats_.max_late_us = late_us;
            return false;
        }

        // Coarse sleep, then yield through the last fraction of a millisecond
        const auto coarse = deadline - std::chrono::microseconds(kYieldWindowUs);
        if (now < coarse) {
            std::this_thread::sleep_until(coarse);
        }
        while (Clock::now() < deadline) {
            std::this_thread::yield();
        }
        return true;
    }

    // Wall seconds minus simulated seconds; positive means falling behind
    double drift_s() const {
        const double wall = std::chrono::duration<double>(Clock::now() - origin_).count();
        return wall - static_cast<double>(last_sim_ms_) / 1000.0;
    }

    const Stats& stats() const { return stats_; }

private:
    using Clock = std::chrono::steady_clock;
    static constexpr int64_t kYieldWindowUs = 200;

    Clock::time_point origin_;
    int64_t last_sim_ms_ = 0;
    Stats stats_;
};

} // namespace sim
