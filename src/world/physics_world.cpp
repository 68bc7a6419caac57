// src/world/physics_world.cpp
#include "world/physics_world.hpp"
#include "sim/errors.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <utility>

namespace world {

namespace {
constexpr int kSpawnAttempts = 32;
}

PhysicsWorld::PhysicsWorld(const PhysicsWorldParams& params, MotionSource* motion)
    : params_(params),
      motion_(motion)
{
    if (params_.spawn_xy_range_m < 0.0) {
        throw sim::ConfigurationError("body.spawn_xy_range_m must be >= 0");
    }
    if (params_.spawn_z_min_m > params_.spawn_z_max_m) {
        throw sim::ConfigurationError("body.spawn_z_min_m must be <= spawn_z_max_m");
    }
    if (params_.velocity_tau_s <= 0.0 || params_.max_accel_mps2 <= 0.0) {
        throw sim::ConfigurationError("body velocity_tau_s and max_accel_mps2 must be > 0");
    }
}

Pose PhysicsWorld::draw_spawn(uint64_t seed) const {
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> xy(-params_.spawn_xy_range_m, params_.spawn_xy_range_m);
    std::uniform_real_distribution<double> z(params_.spawn_z_min_m, params_.spawn_z_max_m);
    std::uniform_real_distribution<double> yaw(-M_PI, M_PI);

    Pose pose;
    for (int attempt = 0; attempt < kSpawnAttempts; ++attempt) {
        pose.position = {xy(rng), xy(rng), z(rng)};
        pose.orientation = Quat::from_yaw(yaw(rng));
        if (!scene_ || !scene_->occupied(pose.position)) {
            return pose;
        }
    }

    LOG_WARN("[Physics] No free spawn pose after %d draws, using last draw", kSpawnAttempts);
    return pose;
}

void PhysicsWorld::reset(std::shared_ptr<const Scene> scene, uint64_t seed) {
    scene_ = std::move(scene);
    spawn_ = draw_spawn(seed);

    const double ground = scene_ ? scene_->ground_z() : 0.0;
    spawn_.position.z = std::max(spawn_.position.z, ground + params_.min_clearance_m);

    state_ = BodyState{};
    state_.position_m = spawn_.position;
    state_.orientation = spawn_.orientation;
    state_.yaw_rad = spawn_.orientation.yaw();
    motion_warned_ = false;

    if (motion_) {
        motion_->reset(spawn_);
    }

    LOG_DEBUG("[Physics] Spawn at (%.3f, %.3f, %.3f) yaw=%.3f rad",
              spawn_.position.x, spawn_.position.y, spawn_.position.z, state_.yaw_rad);
}

void PhysicsWorld::step(double t, double dt) {
    MotionCmd cmd;
    bool have_cmd = false;
    if (motion_) {
        have_cmd = motion_->command(t, state_, cmd);
        if (!have_cmd && !motion_warned_) {
            LOG_WARN("[Physics] Motion source '%s' produced no command at t=%.3f, holding position",
                     motion_->name().c_str(), t);
            motion_warned_ = true;
        }
    }
    if (!have_cmd) {
        cmd = MotionCmd{};
    }

    // ========================================================================
    // Translational: first-order velocity tracking, accel limited
    // ========================================================================
    Vec3 accel = (cmd.velocity_mps - state_.velocity_mps) / params_.velocity_tau_s;
    const double a_norm = accel.norm();
    if (a_norm > params_.max_accel_mps2) {
        accel = accel * (params_.max_accel_mps2 / a_norm);
    }

    state_.velocity_mps += accel * dt;
    state_.position_m += state_.velocity_mps * dt;

    // Ground contact
    const double floor_z = (scene_ ? scene_->ground_z() : 0.0) + params_.min_clearance_m;
    if (state_.position_m.z < floor_z) {
        state_.position_m.z = floor_z;
        if (state_.velocity_mps.z < 0.0) state_.velocity_mps.z = 0.0;
        if (accel.z < 0.0) accel.z = 0.0;
    }
    state_.accel_mps2 = accel;

    // ========================================================================
    // Rotational: yaw only, level attitude
    // ========================================================================
    const double yaw_rate = std::max(-params_.max_yaw_rate_rps,
                                     std::min(params_.max_yaw_rate_rps, cmd.yaw_rate_rps));
    state_.yaw_rad = std::remainder(state_.yaw_rad + yaw_rate * dt, 2.0 * M_PI);
    state_.orientation = Quat::from_yaw(state_.yaw_rad);
    state_.angular_velocity_rps = {0.0, 0.0, yaw_rate};

    state_.t_s = t;
}

void PhysicsWorld::teardown() {
    scene_.reset();
    state_ = BodyState{};
    spawn_ = Pose{};
}

} // namespace world
