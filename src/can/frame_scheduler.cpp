// src/can/frame_scheduler.cpp
#include "can/frame_scheduler.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace can {

void FrameScheduler::init(const SignalDictionary& dict, double default_period_ms) {
    slots_.clear();
    for (uint32_t id : dict.ids()) {
        const MessageSpec* spec = dict.find(id);
        Slot s;
        s.spec = spec;
        const double p = spec->has_period() ? spec->expected_period_ms : default_period_ms;
        s.period_ms = std::max<int64_t>(1, static_cast<int64_t>(std::llround(p)));
        s.next_ms = 0;
        slots_.push_back(s);
    }
}

void FrameScheduler::force_all_due() {
    for (auto& s : slots_) s.next_ms = INT64_MIN;
}

std::vector<const MessageSpec*> FrameScheduler::due(int64_t t_ms) {
    std::vector<const MessageSpec*> out;
    for (auto& s : slots_) {
        if (t_ms >= s.next_ms) {
            out.push_back(s.spec);
            // Stay on the period grid; skip missed slots instead of bursting
            if (s.next_ms == INT64_MIN || t_ms - s.next_ms >= s.period_ms) {
                s.next_ms = t_ms + s.period_ms;
            } else {
                s.next_ms += s.period_ms;
            }
        }
    }
    return out;
}

} // namespace can
