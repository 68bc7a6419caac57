// src/sim/observation.hpp
#pragma once

#include "sensors/sensor_registry.hpp"
#include "sensors/sensor_sample.hpp"

#include <map>
#include <string>

namespace sim {

/**
 * ObservationSnapshot - Per-step view of all enabled sensors
 *
 * Exactly one entry per enabled sensor, keyed by sensor name. Entries are
 * copies; later sensor updates never alter an existing snapshot.
 */
struct ObservationSnapshot {
    double t_s = 0.0;
    std::map<std::string, sensors::SensorSample> samples;

    /**
     * True once every sensor has produced a valid sample since reset
     */
    bool complete() const {
        if (samples.empty()) return false;
        for (const auto& [name, s] : samples) {
            (void)name;
            if (!s.valid_since_reset) return false;
        }
        return true;
    }

    const sensors::SensorSample* find(const std::string& name) const {
        auto it = samples.find(name);
        return it == samples.end() ? nullptr : &it->second;
    }

    size_t valid_count() const {
        size_t n = 0;
        for (const auto& [name, s] : samples) {
            (void)name;
            n += s.valid ? 1 : 0;
        }
        return n;
    }
};

class ObservationAssembler {
public:
    /**
     * Copy every sensor's latest sample into a snapshot stamped clock_time.
     * Never throws for sensor state.
     */
    ObservationSnapshot assemble(double clock_time, const sensors::SensorRegistry& registry) const;
};

} // namespace sim
