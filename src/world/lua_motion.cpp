// src/world/lua_motion.cpp
#include "world/lua_motion.hpp"
#include "utils/logging.hpp"

namespace world {

LuaMotion::~LuaMotion() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
}

bool LuaMotion::init(const std::string& lua_script_path) {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }

    L_ = luaL_newstate();
    if (!L_) return false;

    luaL_openlibs(L_);
    script_path_ = lua_script_path;

    if (luaL_dofile(L_, lua_script_path.c_str()) != LUA_OK) {
        LOG_ERROR("[Lua] Failed to load script: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }

    lua_getglobal(L_, "motion_cmd");
    const bool has_cmd = lua_isfunction(L_, -1);
    lua_pop(L_, 1);
    if (!has_cmd) {
        LOG_ERROR("[Lua] %s does not define motion_cmd(t, state)", lua_script_path.c_str());
        return false;
    }

    LOG_INFO("[Lua] Motion script loaded: %s", lua_script_path.c_str());
    return true;
}

void LuaMotion::reset(const Pose& spawn) {
    if (!L_) return;

    lua_getglobal(L_, "motion_reset");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        return;
    }

    lua_newtable(L_);
    auto set_num = [&](const char* k, double v) {
        lua_pushnumber(L_, v);
        lua_setfield(L_, -2, k);
    };
    set_num("x", spawn.position.x);
    set_num("y", spawn.position.y);
    set_num("z", spawn.position.z);
    set_num("yaw", spawn.orientation.yaw());

    if (lua_pcall(L_, 1, 0, 0) != LUA_OK) {
        LOG_WARN("[Lua] motion_reset failed: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
    }
}

void LuaMotion::push_state_table_(const BodyState& s) {
    lua_newtable(L_);

    auto set_num = [&](const char* k, double v) {
        lua_pushstring(L_, k);
        lua_pushnumber(L_, v);
        lua_settable(L_, -3);
    };

    set_num("t_s", s.t_s);
    set_num("x", s.position_m.x);
    set_num("y", s.position_m.y);
    set_num("z", s.position_m.z);
    set_num("vx", s.velocity_mps.x);
    set_num("vy", s.velocity_mps.y);
    set_num("vz", s.velocity_mps.z);
    set_num("yaw", s.yaw_rad);
    set_num("yaw_rate", s.angular_velocity_rps.z);
}

bool LuaMotion::read_cmd_table_(int idx, MotionCmd& out) {
    if (!lua_istable(L_, idx)) return false;

    auto get_num = [&](const char* k, double def) -> double {
        lua_getfield(L_, idx, k);
        double v = def;
        if (lua_isnumber(L_, -1)) v = lua_tonumber(L_, -1);
        lua_pop(L_, 1);
        return v;
    };

    out.velocity_mps.x = get_num("vx", 0.0);
    out.velocity_mps.y = get_num("vy", 0.0);
    out.velocity_mps.z = get_num("vz", 0.0);
    out.yaw_rate_rps = get_num("yaw_rate", 0.0);
    return true;
}

bool LuaMotion::command(double t, const BodyState& state, MotionCmd& out) {
    if (!L_) return false;

    lua_getglobal(L_, "motion_cmd");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        LOG_ERROR("[Lua] motion_cmd() missing");
        return false;
    }

    lua_pushnumber(L_, t);
    push_state_table_(state);

    if (lua_pcall(L_, 2, 1, 0) != LUA_OK) {
        LOG_ERROR("[Lua] motion_cmd failed: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }

    const bool ok = read_cmd_table_(-1, out);
    lua_pop(L_, 1);
    return ok;
}

} // namespace world
