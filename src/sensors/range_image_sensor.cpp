// src/sensors/range_image_sensor.cpp
#include "sensors/range_image_sensor.hpp"

#include <cmath>

namespace sensors {

RangeImageSensor::RangeImageSensor(const SensorSpec& spec, size_t index)
    : SensorBase(spec, index),
      params_(std::get<RangeImageParams>(spec.params)),
      depth_noise_(spec.noise, derive_seed(0, index))
{
    // Square pixels, principal point at the image centre
    fx_ = 0.5 * params_.width / std::tan(0.5 * params_.hfov_rad);
    fy_ = fx_;
    cx_ = 0.5 * params_.width;
    cy_ = 0.5 * params_.height;
}

void RangeImageSensor::reset_state(uint64_t seed) {
    depth_noise_.reseed(seed);
}

bool RangeImageSensor::measure(double t, const GroundTruth& truth, SamplePayload& payload) {
    (void)t;
    auto& img = std::get<RangeImage>(payload);

    const uint32_t w = params_.width;
    const uint32_t h = params_.height;
    img.width = w;
    img.height = h;
    img.fx = fx_;
    img.fy = fy_;
    img.cx = cx_;
    img.cy = cy_;
    img.depth_m.assign(static_cast<size_t>(w) * h, 0.0f);
    img.valid_mask.assign(static_cast<size_t>(w) * h, 0);

    if (!truth.scene) {
        return false;
    }

    depth_noise_.step(due_period_s());

    const world::Pose cam = sensor_pose(truth);
    const double max_depth = spec_.bounds.max;
    bool any_valid = false;

    for (uint32_t v = 0; v < h; ++v) {
        for (uint32_t u = 0; u < w; ++u) {
            // Unnormalized ray with unit optical-axis component
            const world::Vec3 ray_cam{1.0,
                                      -((u + 0.5) - cx_) / fx_,
                                      -((v + 0.5) - cy_) / fy_};
            const double ray_len = ray_cam.norm();
            const world::Vec3 dir = cam.orientation.rotate(ray_cam / ray_len);

            // Search slightly past max so a noisy in-range reading still hits
            const double range = truth.scene->raycast(cam.position, dir, 1.5 * max_depth * ray_len);
            if (range < 0.0) continue;

            const double depth = depth_noise_.apply(range / ray_len);
            if (depth < spec_.bounds.min || depth > spec_.bounds.max) continue;

            const size_t i = static_cast<size_t>(v) * w + u;
            img.depth_m[i] = static_cast<float>(depth);
            img.valid_mask[i] = 1;
            any_valid = true;
        }
    }

    return any_valid;
}

} // namespace sensors
