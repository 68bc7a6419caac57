// src/sensors/noise_channel.hpp
#pragma once

#include "sensors/sensor_spec.hpp"
#include "utils/noise.hpp"
#include "world/geometry.hpp"

#include <cstdint>

namespace sensors {

/**
 * NoiseChannel - One scalar axis of a configured noise model
 *
 *   none:             y = x
 *   gaussian:         y = x + N(0, sigma)
 *   bias_random_walk: y = x + bias + b(t) + N(0, sigma)
 *
 * b(t) is advanced by step(dt) (called at the sensor's native rate) and
 * only applied by apply(). Seeded generators make the stream reproducible.
 */
class NoiseChannel {
public:
    explicit NoiseChannel(const NoiseParams& p = {}, uint64_t seed = 1)
        : p_(p),
          white_(seed),
          walk_(p.bias_tau_s, p.random_walk_sigma, p.bias_bound, seed ^ 0x5DEECE66DULL)
    {}

    void reseed(uint64_t seed) {
        white_.reseed(seed);
        walk_.reseed(seed ^ 0x5DEECE66DULL);
        walk_.reset();
    }

    void step(double dt) {
        if (p_.model == NoiseModelKind::BiasRandomWalk) {
            walk_.step(dt);
        }
    }

    double apply(double truth) {
        switch (p_.model) {
            case NoiseModelKind::None:
                return truth;
            case NoiseModelKind::Gaussian:
                return truth + white_.gaussian(p_.sigma);
            case NoiseModelKind::BiasRandomWalk:
                return truth + p_.bias + walk_.get() + white_.gaussian(p_.sigma);
        }
        return truth;
    }

    double walk() const { return walk_.get(); }
    NoiseModelKind model() const { return p_.model; }

private:
    NoiseParams p_;
    utils::NoiseGenerator white_;
    utils::BiasModel walk_;
};

// Three independent channels for a vector quantity
class NoiseTriad {
public:
    explicit NoiseTriad(const NoiseParams& p = {}, uint64_t seed = 1)
        : x_(p, seed), y_(p, seed + 1), z_(p, seed + 2) {}

    void reseed(uint64_t seed) {
        x_.reseed(seed);
        y_.reseed(seed + 1);
        z_.reseed(seed + 2);
    }

    void step(double dt) {
        x_.step(dt);
        y_.step(dt);
        z_.step(dt);
    }

    world::Vec3 apply(const world::Vec3& v) {
        return {x_.apply(v.x), y_.apply(v.y), z_.apply(v.z)};
    }

private:
    NoiseChannel x_;
    NoiseChannel y_;
    NoiseChannel z_;
};

} // namespace sensors
