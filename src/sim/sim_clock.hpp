// src/sim/sim_clock.hpp
#pragma once

#include <cstdint>

namespace sim {

/**
 * SimClock - Timestep authority
 *
 * Owns simulation time for one environment. Time is derived from an
 * integer physics-step counter (t = steps * dt_physics), never accumulated
 * in floating point, so render ticks land exactly on multiples of k.
 *
 *   dt_render = k * dt_physics,  k >= 1 integer
 *
 * Only EnvironmentController mutates the clock; everyone else gets a
 * const reference or a copy of time().
 */
class SimClock {
public:
    /**
     * @throws ConfigurationError if dt_physics <= 0, dt_render <= 0 or
     *         dt_render is not an integer multiple of dt_physics
     */
    SimClock(double dt_physics_s, double dt_render_s);

    /**
     * Advance by one physics step. Returns the new simulation time.
     */
    double advance();

    /**
     * True when the most recent advance() landed on a render tick.
     * Pure query: may be called any number of times per advance.
     */
    bool due_render_tick() const;

    void reset();

    double time() const;
    double physics_dt() const { return dt_physics_; }
    double render_dt() const { return dt_render_; }
    uint64_t render_interval() const { return k_; }
    uint64_t physics_steps() const { return steps_; }
    uint64_t render_ticks() const { return k_ ? steps_ / k_ : 0; }

private:
    double dt_physics_;
    double dt_render_;
    uint64_t k_ = 1;
    uint64_t steps_ = 0;
};

} // namespace sim
