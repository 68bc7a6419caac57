// src/world/body_state.hpp
#pragma once

#include "world/geometry.hpp"

namespace world {

/**
 * BodyState - Ground truth of the sensor carrier (drone body)
 *
 * World frame: ENU-like, z up, gravity along -z.
 */
struct BodyState {
    double t_s = 0.0;

    // World frame
    Vec3 position_m;
    Vec3 velocity_mps;
    Vec3 accel_mps2;           // Kinematic acceleration (no gravity)
    Quat orientation;          // Body -> world

    // Body frame
    Vec3 angular_velocity_rps;

    double yaw_rad = 0.0;

    Pose pose() const { return {position_m, orientation}; }
};

} // namespace world
