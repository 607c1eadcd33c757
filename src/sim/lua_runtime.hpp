// src/sim/lua_runtime.hpp
#pragma once

#include <string>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

#include "sim/drive_state.hpp"

namespace sim {

/**
 * LuaRuntime - drive scenario written in Lua
 *
 * The script defines:
 *   scenario_init(duration_s)      optional, returns true/false
 *   scenario_state(t_s, prev)      returns a table with any of speed_kmh,
 *                                  rpm, throttle_pct, brake_pressure,
 *                                  brake_active, steering_angle
 * Keys missing from the returned table keep their previous value.
 */
class LuaRuntime {
public:
    LuaRuntime() = default;
    ~LuaRuntime();

    LuaRuntime(const LuaRuntime&) = delete;
    LuaRuntime& operator=(const LuaRuntime&) = delete;

    bool init(const std::string& lua_script_path, double duration_s);

    bool is_loaded() const { return L_ != nullptr; }

    bool get_state(double t_s, const DriveState& prev, DriveState& out);

private:
    lua_State* L_{nullptr};

    void push_state_table_(const DriveState& s);
    bool read_state_table_(int idx, DriveState& out);
};

} // namespace sim
