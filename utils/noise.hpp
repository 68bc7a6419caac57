// utils/noise.hpp
#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>

namespace utils {

/**
 * NoiseGenerator - Seeded random source for sensor noise
 *
 * The same seed replays the same stream.
 * One instance per noise channel; not shared between threads.
 */
class NoiseGenerator {
public:
    explicit NoiseGenerator(uint64_t seed = 1)
        : gen_(seed),
          dist_(0.0, 1.0)
    {}

    void reseed(uint64_t seed) {
        gen_.seed(seed);
        dist_.reset();
    }

    /**
     * Gaussian white noise: N(0, stddev)
     */
    double gaussian(double stddev) {
        if (stddev <= 0.0) return 0.0;
        return dist_(gen_) * stddev;
    }

    /**
     * Random walk increment over dt (integrated white noise).
     * Caller accumulates.
     */
    double random_walk(double sigma, double dt) {
        if (dt <= 0.0) return 0.0;
        return gaussian(sigma * std::sqrt(dt));
    }

    /**
     * Exponential decay with time constant tau
     */
    static double decay(double current_value, double tau, double dt) {
        if (tau <= 0.0) return current_value;
        return current_value * std::exp(-dt / tau);
    }

private:
    std::mt19937_64 gen_;
    std::normal_distribution<double> dist_;
};

/**
 * BiasModel - Bounded first-order Gauss-Markov bias drift
 *
 *   db/dt = -b/tau + w(sigma),   |b| <= bound
 *
 * tau <= 0 gives a pure random walk; bound <= 0 leaves it unbounded.
 */
class BiasModel {
public:
    BiasModel(double tau_s = 0.0, double sigma = 0.0, double bound = 0.0, uint64_t seed = 1)
        : tau_(tau_s),
          sigma_(sigma),
          bound_(bound),
          bias_(0.0),
          noise_(seed)
    {}

    double step(double dt) {
        bias_ = NoiseGenerator::decay(bias_, tau_, dt);
        bias_ += noise_.random_walk(sigma_, dt);
        if (bound_ > 0.0) {
            bias_ = std::max(-bound_, std::min(bound_, bias_));
        }
        return bias_;
    }

    double get() const { return bias_; }
    void reset() { bias_ = 0.0; }
    void reseed(uint64_t seed) { noise_.reseed(seed); }

private:
    double tau_;    // Time constant (seconds)
    double sigma_;  // Walk strength (units/sqrt(s))
    double bound_;  // Magnitude clamp
    double bias_;
    NoiseGenerator noise_;
};

} // namespace utils
