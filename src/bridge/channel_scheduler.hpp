// src/bridge/channel_scheduler.hpp
#pragma once

#include <cstddef>
#include <vector>

#include "bridge/channel_spec.hpp"

namespace bridge {

// Tells you which channels are due at a given simulation time
class ChannelScheduler {
public:
    ChannelScheduler() = default;

    // Call once with the bridge's channel list
    void init(const std::vector<ChannelSpec>& channels);

    // Indices (into channels passed to init) due at simulation time t_s
    std::vector<size_t> due(double t_s);

    // Every channel due on the next call (after a reset)
    void reset();

    // Override a channel's period (seconds, 0 = every call)
    void set_period(size_t idx, double period_s);

    double period(size_t idx) const { return idx < period_.size() ? period_[idx] : 0.0; }
    size_t size() const { return period_.size(); }

private:
    std::vector<double> period_;
    std::vector<double> next_;
    bool armed_ = false;
};

} // namespace bridge
