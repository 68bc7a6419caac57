// src/sensors/pose_velocity_sensor.hpp
#pragma once

#include "sensors/noise_channel.hpp"
#include "sensors/sensor_base.hpp"

namespace sensors {

/**
 * PoseVelocitySensor - Odometry of the mount point
 *
 * reference_frame "world": world-frame pose and velocity.
 * reference_frame "odom":  relative to the episode spawn pose.
 *
 * Velocity includes the lever-arm term omega x r_mount. Speed outside
 * [bounds.min, bounds.max] marks the sample invalid.
 */
class PoseVelocitySensor : public SensorBase {
public:
    PoseVelocitySensor(const SensorSpec& spec, size_t index);

protected:
    bool measure(double t, const GroundTruth& truth, SamplePayload& payload) override;
    void reset_state(uint64_t seed) override;

private:
    bool odom_frame_;
    NoiseTriad position_noise_;
    NoiseTriad velocity_noise_;
};

} // namespace sensors
