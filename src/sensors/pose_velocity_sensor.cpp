// src/sensors/pose_velocity_sensor.cpp
#include "sensors/pose_velocity_sensor.hpp"

#include <cmath>

namespace sensors {

PoseVelocitySensor::PoseVelocitySensor(const SensorSpec& spec, size_t index)
    : SensorBase(spec, index),
      odom_frame_(std::get<PoseVelocityParams>(spec.params).reference_frame == "odom"),
      position_noise_(spec.noise, derive_seed(0, index)),
      velocity_noise_(std::get<PoseVelocityParams>(spec.params).velocity_noise, derive_seed(0, index) + 16)
{}

void PoseVelocitySensor::reset_state(uint64_t seed) {
    position_noise_.reseed(seed);
    velocity_noise_.reseed(seed + 16);
}

bool PoseVelocitySensor::measure(double t, const GroundTruth& truth, SamplePayload& payload) {
    (void)t;
    auto& out = std::get<PoseVelocityReading>(payload);

    const world::Pose pose = sensor_pose(truth);
    const world::Vec3 r_body = spec_.mount ? spec_.mount->position_m : world::Vec3{};
    const world::Vec3 lever = truth.body.orientation.rotate(truth.body.angular_velocity_rps.cross(r_body));
    world::Vec3 position = pose.position;
    world::Vec3 velocity = truth.body.velocity_mps + lever;
    world::Quat orientation = pose.orientation;

    if (odom_frame_) {
        const world::Quat q0_inv = truth.spawn.orientation.conjugate();
        position = q0_inv.rotate(position - truth.spawn.position);
        velocity = q0_inv.rotate(velocity);
        orientation = (q0_inv * orientation).normalized();
    }

    position_noise_.step(due_period_s());
    velocity_noise_.step(due_period_s());

    out.position_m = position_noise_.apply(position);
    out.velocity_mps = velocity_noise_.apply(velocity);
    out.orientation = orientation;

    const double speed = out.velocity_mps.norm();
    if (!std::isfinite(speed) || !std::isfinite(out.position_m.norm())) {
        return false;
    }
    return speed >= spec_.bounds.min && speed <= spec_.bounds.max;
}

} // namespace sensors
