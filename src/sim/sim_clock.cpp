// src/sim/sim_clock.cpp
#include "sim/sim_clock.hpp"
#include "sim/errors.hpp"
#include "utils/logging.hpp"

#include <cmath>
#include <string>

namespace sim {

namespace {
constexpr double kMultipleTolerance = 1e-9;
}

SimClock::SimClock(double dt_physics_s, double dt_render_s)
    : dt_physics_(dt_physics_s),
      dt_render_(dt_render_s)
{
    if (!(dt_physics_ > 0.0) || !std::isfinite(dt_physics_)) {
        throw ConfigurationError("physics_dt must be > 0 (got " +
                                 std::to_string(dt_physics_) + ")");
    }
    if (!(dt_render_ > 0.0) || !std::isfinite(dt_render_)) {
        throw ConfigurationError("rendering_dt must be > 0 (got " +
                                 std::to_string(dt_render_) + ")");
    }

    const double ratio = dt_render_ / dt_physics_;
    const double k = std::round(ratio);
    if (k < 1.0 || std::abs(ratio - k) > kMultipleTolerance * ratio) {
        throw ConfigurationError("rendering_dt (" + std::to_string(dt_render_) +
                                 ") must be an integer multiple of physics_dt (" +
                                 std::to_string(dt_physics_) + ")");
    }
    k_ = static_cast<uint64_t>(k);

    LOG_DEBUG("[SimClock] dt_physics=%.6fs dt_render=%.6fs render_interval=%llu",
              dt_physics_, dt_render_, static_cast<unsigned long long>(k_));
}

double SimClock::advance() {
    ++steps_;
    return time();
}

bool SimClock::due_render_tick() const {
    return steps_ > 0 && (steps_ % k_) == 0;
}

void SimClock::reset() {
    steps_ = 0;
}

double SimClock::time() const {
    return static_cast<double>(steps_) * dt_physics_;
}

} // namespace sim
