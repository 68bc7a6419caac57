// src/sensors/inertial_sensor.cpp
#include "sensors/inertial_sensor.hpp"

#include <cmath>

namespace sensors {

namespace {
constexpr double kNativeEpsilon = 1e-9;
}

InertialSensor::InertialSensor(const SensorSpec& spec, size_t index)
    : SensorBase(spec, index),
      params_(std::get<InertialParams>(spec.params)),
      native_period_(spec.period_s()),
      accel_noise_(spec.noise, derive_seed(0, index)),
      gyro_noise_(std::get<InertialParams>(spec.params).gyro_noise, derive_seed(0, index) + 16)
{}

void InertialSensor::reset_state(uint64_t seed) {
    accel_noise_.reseed(seed);
    gyro_noise_.reseed(seed + 16);
    accel_sum_ = {};
    gyro_sum_ = {};
    count_ = 0;
    last_native_t_ = 0.0;
}

void InertialSensor::native_update(const GroundTruth& truth, double dt) {
    const world::Quat q_mount = spec_.mount ? spec_.mount->orientation : world::Quat{};
    const world::Quat q_body_inv = truth.body.orientation.conjugate();
    const world::Quat q_mount_inv = q_mount.conjugate();

    // Specific force: kinematic accel minus gravity (gravity along -z)
    const world::Vec3 f_world = truth.body.accel_mps2 + world::Vec3{0.0, 0.0, kGravity};
    const world::Vec3 f_sensor = q_mount_inv.rotate(q_body_inv.rotate(f_world));
    const world::Vec3 w_sensor = q_mount_inv.rotate(truth.body.angular_velocity_rps);

    accel_noise_.step(dt);
    gyro_noise_.step(dt);

    accel_sum_ += accel_noise_.apply(f_sensor);
    gyro_sum_ += gyro_noise_.apply(w_sensor);
    ++count_;
}

void InertialSensor::integrate(double t, const GroundTruth& truth, double dt) {
    (void)dt;
    if (t - last_native_t_ < native_period_ - kNativeEpsilon) {
        return;
    }
    native_update(truth, t - last_native_t_);
    last_native_t_ = t;
}

bool InertialSensor::measure(double t, const GroundTruth& truth, SamplePayload& payload) {
    auto& reading = std::get<InertialReading>(payload);

    // Sampled without any internal update (e.g. publish rate above the
    // physics rate): take one instantaneous reading
    if (count_ == 0) {
        native_update(truth, native_period_);
        last_native_t_ = t;
    }

    reading.accel_mps2 = accel_sum_ / static_cast<double>(count_);
    reading.gyro_rps = gyro_sum_ / static_cast<double>(count_);
    reading.integrated_updates = count_;

    accel_sum_ = {};
    gyro_sum_ = {};
    count_ = 0;

    const auto& a = reading.accel_mps2;
    const auto& g = reading.gyro_rps;
    const auto in_bounds = [&](double v) {
        return v >= spec_.bounds.min && v <= spec_.bounds.max;
    };
    if (!in_bounds(a.x) || !in_bounds(a.y) || !in_bounds(a.z)) {
        return false;
    }
    if (std::abs(g.x) > params_.gyro_max_rps ||
        std::abs(g.y) > params_.gyro_max_rps ||
        std::abs(g.z) > params_.gyro_max_rps) {
        return false;
    }
    return std::isfinite(a.norm()) && std::isfinite(g.norm());
}

} // namespace sensors
