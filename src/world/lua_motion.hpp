// src/world/lua_motion.hpp
#pragma once

#include <string>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

#include "world/motion_source.hpp"

namespace world {

/**
 * LuaMotion - Motion setpoints from a Lua script
 *
 * The script defines:
 *   motion_cmd(t, state) -> { vx=, vy=, vz=, yaw_rate= }
 * and optionally:
 *   motion_reset(spawn)  -- spawn = { x=, y=, z=, yaw= }
 *
 * Missing fields in the returned table default to 0.
 */
class LuaMotion : public MotionSource {
public:
    LuaMotion() = default;
    ~LuaMotion() override;

    LuaMotion(const LuaMotion&) = delete;
    LuaMotion& operator=(const LuaMotion&) = delete;

    bool init(const std::string& lua_script_path);

    void reset(const Pose& spawn) override;
    bool command(double t, const BodyState& state, MotionCmd& out) override;
    std::string name() const override { return "lua:" + script_path_; }

private:
    lua_State* L_{nullptr};
    std::string script_path_;

    void push_state_table_(const BodyState& s);
    bool read_cmd_table_(int idx, MotionCmd& out);
};

} // namespace world
