// src/can/frame_scheduler.hpp
#pragma once

#include <cstdint>
#include <vector>

#include "can/signal_dictionary.hpp"

namespace can {

// Periodic transmit schedule on simulated time: tells you which messages
// are due at time t_ms. Messages without a period use default_period_ms.
class FrameScheduler {
public:
    FrameScheduler() = default;

    // Call once after loading the dictionary
    void init(const SignalDictionary& dict, double default_period_ms);

    // Messages due at t_ms (non-decreasing across calls)
    std::vector<const MessageSpec*> due(int64_t t_ms);

    // Force all messages due on the next call
    void force_all_due();

    size_t size() const { return slots_.size(); }

private:
    struct Slot {
        const MessageSpec* spec = nullptr;
        int64_t period_ms = 0;
        int64_t next_ms = 0;
    };
    std::vector<Slot> slots_;
};

} // namespace can
