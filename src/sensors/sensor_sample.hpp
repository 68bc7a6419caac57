// src/sensors/sensor_sample.hpp
#pragma once

#include "sensors/sensor_spec.hpp"
#include "world/geometry.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace sensors {

/**
 * RangeImage - Depth image, row-major
 *
 * depth_m is the distance to the image plane (optical axis component),
 * 0 where valid_mask is 0.
 */
struct RangeImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<float> depth_m;
    std::vector<uint8_t> valid_mask;

    // Pinhole intrinsics (pixels)
    double fx = 0.0;
    double fy = 0.0;
    double cx = 0.0;
    double cy = 0.0;

    size_t valid_pixels() const {
        size_t n = 0;
        for (uint8_t v : valid_mask) n += v ? 1 : 0;
        return n;
    }

    bool operator==(const RangeImage& o) const {
        return width == o.width && height == o.height && depth_m == o.depth_m &&
               valid_mask == o.valid_mask && fx == o.fx && fy == o.fy &&
               cx == o.cx && cy == o.cy;
    }
};

// Specific force and angular rate, sensor frame
struct InertialReading {
    world::Vec3 accel_mps2;
    world::Vec3 gyro_rps;
    uint32_t integrated_updates = 0;   // Native-rate updates collapsed into this sample

    bool operator==(const InertialReading& o) const {
        return accel_mps2 == o.accel_mps2 && gyro_rps == o.gyro_rps &&
               integrated_updates == o.integrated_updates;
    }
};

// Sensor pose and velocity in the configured reference frame
struct PoseVelocityReading {
    world::Vec3 position_m;
    world::Vec3 velocity_mps;
    world::Quat orientation;

    bool operator==(const PoseVelocityReading& o) const {
        return position_m == o.position_m && velocity_mps == o.velocity_mps &&
               orientation == o.orientation;
    }
};

using SamplePayload = std::variant<RangeImage, InertialReading, PoseVelocityReading>;

/**
 * SensorSample - Latest output of one sensor
 *
 * Created invalid, overwritten in place on every due update, cleared on
 * reset. Observations hold copies.
 */
struct SensorSample {
    std::string name;
    SensorKind kind = SensorKind::RangeImage;
    double t_s = 0.0;                  // Sim time of the last update
    bool valid = false;
    uint64_t update_count = 0;         // Due updates since reset
    bool valid_since_reset = false;    // At least one valid update since reset
    SamplePayload payload;

    bool operator==(const SensorSample& o) const {
        return name == o.name && kind == o.kind && t_s == o.t_s && valid == o.valid &&
               update_count == o.update_count && valid_since_reset == o.valid_since_reset &&
               payload == o.payload;
    }
    bool operator!=(const SensorSample& o) const { return !(*this == o); }
};

} // namespace sensors
