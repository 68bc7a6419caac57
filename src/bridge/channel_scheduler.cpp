// src/bridge/channel_scheduler.cpp
#include "bridge/channel_scheduler.hpp"

namespace bridge {

namespace {
constexpr double kEps = 1e-9;
}

void ChannelScheduler::init(const std::vector<ChannelSpec>& channels) {
    period_.clear();
    period_.reserve(channels.size());
    for (const auto& c : channels) {
        period_.push_back(c.rate_hz > 0.0 ? 1.0 / c.rate_hz : 0.0);
    }
    next_.assign(channels.size(), 0.0);
    armed_ = false;
}

void ChannelScheduler::reset() {
    armed_ = false;
}

void ChannelScheduler::set_period(size_t idx, double period_s) {
    if (idx < period_.size()) {
        period_[idx] = period_s > 0.0 ? period_s : 0.0;
    }
}

std::vector<size_t> ChannelScheduler::due(double t_s) {
    std::vector<size_t> out;

    if (!armed_) {
        // First call after init/reset: everything fires, cadence starts here
        for (size_t i = 0; i < period_.size(); ++i) {
            out.push_back(i);
            next_[i] = t_s + period_[i];
        }
        armed_ = true;
        return out;
    }

    for (size_t i = 0; i < period_.size(); ++i) {
        if (period_[i] <= 0.0) {
            out.push_back(i);
            continue;
        }
        if (t_s + kEps >= next_[i]) {
            out.push_back(i);
            // Stay on the grid; skip whole periods if the caller fell behind
            while (next_[i] <= t_s + kEps) {
                next_[i] += period_[i];
            }
        }
    }
    return out;
}

} // namespace bridge
