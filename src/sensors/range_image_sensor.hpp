// src/sensors/range_image_sensor.hpp
#pragma once

#include "sensors/noise_channel.hpp"
#include "sensors/sensor_base.hpp"

namespace sensors {

/**
 * RangeImageSensor - Pinhole depth camera
 *
 * Optical axis along the mount's +x, image u to the right (-y), v down
 * (-z). One ray per pixel through the pixel centre is cast into the scene;
 * the hit distance is projected onto the optical axis.
 *
 * Per pixel: depth outside [bounds.min, bounds.max] or no hit → invalid,
 * depth 0. The sample is valid when at least one pixel is valid.
 */
class RangeImageSensor : public SensorBase {
public:
    RangeImageSensor(const SensorSpec& spec, size_t index);

    double fx() const { return fx_; }
    double fy() const { return fy_; }
    double cx() const { return cx_; }
    double cy() const { return cy_; }

protected:
    bool measure(double t, const GroundTruth& truth, SamplePayload& payload) override;
    void reset_state(uint64_t seed) override;

private:
    RangeImageParams params_;
    double fx_;
    double fy_;
    double cx_;
    double cy_;
    NoiseChannel depth_noise_;
};

} // namespace sensors
