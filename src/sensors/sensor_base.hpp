// src/sensors/sensor_base.hpp
#pragma once

#include "sensors/sensor_sample.hpp"
#include "sensors/sensor_spec.hpp"
#include "world/body_state.hpp"
#include "world/scene.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace sensors {

/**
 * GroundTruth - Everything a sensor may observe in one physics step
 */
struct GroundTruth {
    world::BodyState body;
    const world::Scene* scene = nullptr;   // nullptr before the first scene load
    world::Pose spawn;                     // Episode origin for odom-frame outputs
};

/**
 * SensorBase - Abstract interface for all sensors
 *
 * All sensors follow this lifecycle:
 * 1. Construction from an immutable SensorSpec
 * 2. integrate(t, truth, dt) on every physics tick (high-rate internal state)
 * 3. sample(t, truth) when is_due(t) on a render tick
 * 4. reset(seed) at every episode start
 *
 * The latest sample is created invalid and stays invalid until the first
 * due update after reset.
 */
class SensorBase {
public:
    SensorBase(const SensorSpec& spec, size_t index);
    virtual ~SensorBase() = default;

    SensorBase(const SensorBase&) = delete;
    SensorBase& operator=(const SensorBase&) = delete;

    /**
     * True once the due period has elapsed since the last sample (or reset)
     */
    bool is_due(double t) const;

    /**
     * High-rate update, called on every physics tick
     *
     * @param t Current simulation time (seconds)
     * @param truth Ground truth at t
     * @param dt Physics timestep (seconds)
     */
    virtual void integrate(double t, const GroundTruth& truth, double dt);

    /**
     * Produce a new sample from ground truth and store it as latest()
     */
    const SensorSample& sample(double t, const GroundTruth& truth);

    /**
     * Clear validity and internal state, reseed noise from the episode seed
     */
    void reset(uint64_t episode_seed);

    const SensorSample& latest() const { return sample_; }
    const SensorSpec& spec() const { return spec_; }
    const std::string& name() const { return spec_.name; }
    SensorKind kind() const { return spec_.kind(); }
    size_t index() const { return index_; }
    double due_period_s() const { return due_period_; }

    /**
     * Noise seed for sensor `index` in the episode seeded with `episode_seed`
     */
    static uint64_t derive_seed(uint64_t episode_seed, size_t index);

protected:
    /**
     * Write the measurement into `payload` (same alternative as kind()).
     * @return sample validity
     */
    virtual bool measure(double t, const GroundTruth& truth, SamplePayload& payload) = 0;

    /**
     * Zero bias/walk/accumulator state and reseed generators
     */
    virtual void reset_state(uint64_t seed) = 0;

    // Sensor frame pose in the world
    world::Pose sensor_pose(const GroundTruth& truth) const;

    SensorSpec spec_;

private:
    SamplePayload empty_payload() const;

    size_t index_;
    double due_period_;
    double ref_t_ = 0.0;
    SensorSample sample_;
};

} // namespace sensors
