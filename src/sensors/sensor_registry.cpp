// src/sensors/sensor_registry.cpp
#include "sensors/sensor_registry.hpp"
#include "sensors/inertial_sensor.hpp"
#include "sensors/pose_velocity_sensor.hpp"
#include "sensors/range_image_sensor.hpp"
#include "sim/errors.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace sensors {

namespace {

[[noreturn]] void fail(const SensorSpec& spec, const std::string& why) {
    throw sim::ConfigurationError("Sensor '" + spec.name + "': " + why);
}

} // namespace

std::unique_ptr<SensorBase> make_sensor(const SensorSpec& spec, size_t index) {
    switch (spec.kind()) {
        case SensorKind::RangeImage:
            return std::make_unique<RangeImageSensor>(spec, index);
        case SensorKind::Inertial:
            return std::make_unique<InertialSensor>(spec, index);
        case SensorKind::PoseVelocity:
            return std::make_unique<PoseVelocitySensor>(spec, index);
    }
    throw sim::ConfigurationError("Sensor '" + spec.name + "': unsupported kind");
}

void SensorRegistry::validate(const std::vector<SensorSpec>& specs) {
    std::set<std::string> seen;

    for (const auto& spec : specs) {
        if (spec.name.empty()) {
            throw sim::ConfigurationError("Sensor name must not be empty");
        }
        if (!seen.insert(spec.name).second) {
            fail(spec, "duplicate sensor name");
        }
        if (!(spec.rate_hz > 0.0) || !std::isfinite(spec.rate_hz)) {
            fail(spec, "rate_hz must be > 0");
        }
        if (!spec.mount) {
            fail(spec, "mount pose is required");
        }
        if (!spec.mount->orientation.is_unit()) {
            fail(spec, "mount orientation must be a unit quaternion");
        }
        if (!(spec.bounds.min < spec.bounds.max)) {
            fail(spec, "range bounds require min < max");
        }

        if (const auto* p = std::get_if<RangeImageParams>(&spec.params)) {
            if (p->width == 0 || p->height == 0) {
                fail(spec, "image width and height must be > 0");
            }
            if (!(p->hfov_rad > 0.0 && p->hfov_rad < M_PI)) {
                fail(spec, "horizontal field of view must be in (0, 180) deg");
            }
        } else if (const auto* p = std::get_if<InertialParams>(&spec.params)) {
            if (!(p->publish_rate_hz > 0.0)) {
                fail(spec, "publish_rate_hz must be > 0");
            }
            if (p->publish_rate_hz > spec.rate_hz) {
                fail(spec, "publish_rate_hz exceeds the native rate");
            }
            if (!(p->gyro_max_rps > 0.0)) {
                fail(spec, "gyro_max_rps must be > 0");
            }
        } else if (const auto* p = std::get_if<PoseVelocityParams>(&spec.params)) {
            if (p->reference_frame != "world" && p->reference_frame != "odom") {
                fail(spec, "reference_frame must be 'world' or 'odom'");
            }
        }
    }
}

SensorRegistry::SensorRegistry(const std::vector<SensorSpec>& specs) {
    validate(specs);

    for (size_t i = 0; i < specs.size(); ++i) {
        const auto& spec = specs[i];
        if (!spec.enabled) {
            LOG_INFO("[SensorRegistry] Sensor '%s' disabled", spec.name.c_str());
            continue;
        }
        sensors_.push_back(make_sensor(spec, i));
        LOG_INFO("[SensorRegistry] Added %s '%s' @ %.1f Hz (noise=%s)",
                 to_string(spec.kind()), spec.name.c_str(), spec.rate_hz,
                 to_string(spec.noise.model));
    }
}

void SensorRegistry::integrate_all(double t, const GroundTruth& truth, double dt) {
    for (auto& sensor : sensors_) {
        sensor->integrate(t, truth, dt);
    }
}

size_t SensorRegistry::update_due(double t, const GroundTruth& truth) {
    size_t updated = 0;
    for (auto& sensor : sensors_) {
        if (!sensor->is_due(t)) continue;
        const auto& s = sensor->sample(t, truth);
        if (!s.valid) {
            LOG_DEBUG("[SensorRegistry] '%s' invalid at t=%.3f", s.name.c_str(), t);
        }
        ++updated;
    }
    return updated;
}

void SensorRegistry::reset(uint64_t episode_seed) {
    for (auto& sensor : sensors_) {
        sensor->reset(episode_seed);
    }
}

void SensorRegistry::release() {
    sensors_.clear();
}

SensorBase* SensorRegistry::find(const std::string& name) {
    for (auto& sensor : sensors_) {
        if (sensor->name() == name) {
            return sensor.get();
        }
    }
    return nullptr;
}

const SensorBase* SensorRegistry::find(const std::string& name) const {
    for (const auto& sensor : sensors_) {
        if (sensor->name() == name) {
            return sensor.get();
        }
    }
    return nullptr;
}

std::vector<std::string> SensorRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(sensors_.size());
    for (const auto& sensor : sensors_) {
        out.push_back(sensor->name());
    }
    return out;
}

double SensorRegistry::min_rate_hz() const {
    double lowest = 0.0;
    for (const auto& sensor : sensors_) {
        const double period = sensor->due_period_s();
        if (period <= 0.0) continue;
        const double rate = 1.0 / period;
        if (lowest == 0.0 || rate < lowest) lowest = rate;
    }
    return lowest;
}

std::map<std::string, uint64_t> SensorRegistry::update_counts() const {
    std::map<std::string, uint64_t> out;
    for (const auto& sensor : sensors_) {
        out[sensor->name()] = sensor->latest().update_count;
    }
    return out;
}

} // namespace sensors
