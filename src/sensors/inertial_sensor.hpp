// src/sensors/inertial_sensor.hpp
#pragma once

#include "sensors/noise_channel.hpp"
#include "sensors/sensor_base.hpp"

namespace sensors {

/**
 * InertialSensor - 6-DOF IMU with two rates
 *
 * Native rate (spec.rate_hz): internal integration on physics ticks. Each
 * native update evaluates specific force and angular rate in the sensor
 * frame, advances the bias walks and adds the noisy reading to an
 * accumulator.
 *
 * Publish rate (params.publish_rate_hz): sample() emits the mean of the
 * accumulated readings and how many were collapsed, then clears them.
 *
 * Any accel component outside [bounds.min, bounds.max] or any gyro
 * component beyond gyro_max_rps marks the sample invalid.
 */
class InertialSensor : public SensorBase {
public:
    static constexpr double kGravity = 9.81;

    InertialSensor(const SensorSpec& spec, size_t index);

    void integrate(double t, const GroundTruth& truth, double dt) override;

    uint32_t pending_updates() const { return count_; }

protected:
    bool measure(double t, const GroundTruth& truth, SamplePayload& payload) override;
    void reset_state(uint64_t seed) override;

private:
    void native_update(const GroundTruth& truth, double dt);

    InertialParams params_;
    double native_period_;
    double last_native_t_ = 0.0;

    NoiseTriad accel_noise_;
    NoiseTriad gyro_noise_;

    world::Vec3 accel_sum_;
    world::Vec3 gyro_sum_;
    uint32_t count_ = 0;
};

} // namespace sensors
