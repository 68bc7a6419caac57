// src/sim/observation.cpp
#include "sim/observation.hpp"

namespace sim {

ObservationSnapshot ObservationAssembler::assemble(double clock_time,
                                                   const sensors::SensorRegistry& registry) const {
    ObservationSnapshot snap;
    snap.t_s = clock_time;
    for (const auto& sensor : registry.sensors()) {
        snap.samples.emplace(sensor->name(), sensor->latest());
    }
    return snap;
}

} // namespace sim
