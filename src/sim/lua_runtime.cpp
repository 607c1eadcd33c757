// src/sim/lua_runtime.cpp
#include "lua_runtime.hpp"
#include "utils/logging.hpp"

namespace sim {

LuaRuntime::~LuaRuntime() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
}

bool LuaRuntime::init(const std::string& lua_script_path, double duration_s) {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }

    L_ = luaL_newstate();
    if (!L_) return false;

    luaL_openlibs(L_);

    if (luaL_dofile(L_, lua_script_path.c_str()) != LUA_OK) {
        LOG_ERROR("[Lua] Failed to load script: %s", lua_tostring(L_, -1));
        lua_close(L_);
        L_ = nullptr;
        return false;
    }

    lua_getglobal(L_, "scenario_state");
    const bool has_state_fn = lua_isfunction(L_, -1);
    lua_pop(L_, 1);
    if (!has_state_fn) {
        LOG_ERROR("[Lua] %s does not define scenario_state()", lua_script_path.c_str());
        lua_close(L_);
        L_ = nullptr;
        return false;
    }

    // Optional scenario_init(duration_s)
    lua_getglobal(L_, "scenario_init");
    if (lua_isfunction(L_, -1)) {
        lua_pushnumber(L_, duration_s);
        if (lua_pcall(L_, 1, 1, 0) != LUA_OK) {
            LOG_ERROR("[Lua] scenario_init failed: %s", lua_tostring(L_, -1));
            lua_pop(L_, 1);
            lua_close(L_);
            L_ = nullptr;
            return false;
        }
        if (!lua_toboolean(L_, -1)) {
            LOG_WARN("[Lua] scenario_init returned false");
        }
        lua_pop(L_, 1);
    } else {
        lua_pop(L_, 1);
    }

    LOG_INFO("[Lua] Loaded scenario %s", lua_script_path.c_str());
    return true;
}

void LuaRuntime::push_state_table_(const DriveState& s) {
    lua_newtable(L_);

    auto set_num = [&](const char* k, double v) {
        lua_pushnumber(L_, v);
        lua_setfield(L_, -2, k);
    };

    set_num("speed_kmh", s.speed_kmh);
    set_num("rpm", s.rpm);
    set_num("throttle_pct", s.throttle_pct);
    set_num("brake_pressure", s.brake_pressure);
    lua_pushboolean(L_, s.brake_active ? 1 : 0);
    lua_setfield(L_, -2, "brake_active");
    set_num("steering_angle", s.steering_angle);
}

bool LuaRuntime::read_state_table_(int idx, DriveState& out) {
    if (!lua_istable(L_, idx)) return false;

    auto get_num = [&](const char* k, double def) -> double {
        lua_getfield(L_, idx, k);
        double v = def;
        if (lua_isnumber(L_, -1)) v = lua_tonumber(L_, -1);
        lua_pop(L_, 1);
        return v;
    };

    auto get_bool = [&](const char* k, bool def) -> bool {
        lua_getfield(L_, idx, k);
        bool v = def;
        if (lua_isboolean(L_, -1)) v = lua_toboolean(L_, -1);
        lua_pop(L_, 1);
        return v;
    };

    out.speed_kmh = get_num("speed_kmh", out.speed_kmh);
    out.rpm = get_num("rpm", out.rpm);
    out.throttle_pct = get_num("throttle_pct", out.throttle_pct);
    out.brake_pressure = get_num("brake_pressure", out.brake_pressure);
    out.brake_active = get_bool("brake_active", out.brake_active);
    out.steering_angle = get_num("steering_angle", out.steering_angle);
    return true;
}

bool LuaRuntime::get_state(double t_s, const DriveState& prev, DriveState& out) {
    if (!L_) return false;

    lua_getglobal(L_, "scenario_state");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        LOG_ERROR("[Lua] scenario_state() missing");
        return false;
    }

    lua_pushnumber(L_, t_s);
    push_state_table_(prev);

    if (lua_pcall(L_, 2, 1, 0) != LUA_OK) {
        LOG_ERROR("[Lua] scenario_state failed: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }

    out = prev;
    const bool ok = read_state_table_(-1, out);
    lua_pop(L_, 1);
    return ok;
}

} // namespace sim
