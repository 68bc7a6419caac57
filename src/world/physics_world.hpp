// src/world/physics_world.hpp
#pragma once

#include "world/body_state.hpp"
#include "world/motion_source.hpp"
#include "world/scene.hpp"

#include <cstdint>
#include <memory>

namespace world {

struct PhysicsWorldParams {
    // Spawn randomization on reset
    double spawn_xy_range_m = 2.0;     // x, y ~ U[-r, r]
    double spawn_z_min_m = 1.0;
    double spawn_z_max_m = 3.0;

    // Velocity tracking response
    double velocity_tau_s = 0.25;
    double max_accel_mps2 = 4.0;
    double max_yaw_rate_rps = 2.0;

    double min_clearance_m = 0.2;      // Body never goes below ground + clearance
};

/**
 * PhysicsWorld - Ground truth integration of the carrier body
 *
 * Kinematic drone model: first-order tracking of the motion source's
 * velocity setpoint (accel limited), yaw from the commanded yaw rate,
 * level attitude. Semi-implicit Euler at the physics step.
 *
 * Does not own the scene; holds a shared read-only handle for the
 * duration of one episode.
 */
class PhysicsWorld {
public:
    PhysicsWorld(const PhysicsWorldParams& params, MotionSource* motion);

    /**
     * Start a new episode in `scene`, drawing the spawn pose from `seed`.
     */
    void reset(std::shared_ptr<const Scene> scene, uint64_t seed);

    /**
     * Advance ground truth by dt to simulation time t.
     */
    void step(double t, double dt);

    const BodyState& truth() const { return state_; }
    const Pose& spawn() const { return spawn_; }
    const Scene* scene() const { return scene_.get(); }
    bool has_scene() const { return static_cast<bool>(scene_); }

    /**
     * Drop the scene handle and zero the state.
     */
    void teardown();

private:
    Pose draw_spawn(uint64_t seed) const;

    PhysicsWorldParams params_;
    MotionSource* motion_;

    std::shared_ptr<const Scene> scene_;
    BodyState state_;
    Pose spawn_;
    bool motion_warned_ = false;
};

} // namespace world
