// src/world/motion_source.cpp
#include "world/motion_source.hpp"

#include <cmath>

namespace world {

void OrbitMotion::reset(const Pose& spawn) {
    (void)spawn;
}

bool OrbitMotion::command(double t, const BodyState& state, MotionCmd& out) {
    (void)t;
    const double yaw = state.yaw_rad;
    out.velocity_mps = {params_.speed_mps * std::cos(yaw),
                        params_.speed_mps * std::sin(yaw),
                        0.0};
    out.yaw_rate_rps = (params_.radius_m > 0.0) ? params_.speed_mps / params_.radius_m : 0.0;
    return true;
}

} // namespace world
