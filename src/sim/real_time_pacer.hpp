// src/sim/real_time_pacer.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <thread>

namespace sim {

/**
 * RealTimePacer - Hold simulation time to the wall clock
 *
 * Simulation time is authoritative; the pacer only sleeps. After
 * restart(t0) the wall deadline for simulation time t is
 *
 *   anchor + (t - t0) / real_time_factor
 *
 * Late steps are never caught up by skipping; they are counted.
 * Coarse sleep, then yield-spin for the last spin_threshold.
 */
class RealTimePacer {
public:
    struct Stats {
        size_t paced_steps = 0;
        size_t deadline_misses = 0;
        double max_lateness_ms = 0.0;
        double avg_lateness_ms = 0.0;
    };

    explicit RealTimePacer(double real_time_factor = 1.0)
        : factor_(real_time_factor > 0.0 ? real_time_factor : 1.0),
          spin_threshold_ns_(50000)
    {
        restart(0.0);
    }

    // Anchor the wall clock at simulation time sim_t (episode reset)
    void restart(double sim_t) {
        anchor_ = std::chrono::steady_clock::now();
        anchor_sim_s_ = sim_t;
    }

    void clear_stats() {
        stats_ = Stats{};
        total_lateness_ms_ = 0.0;
    }

    /**
     * Sleep until the wall deadline of sim_t
     *
     * Returns false if the deadline had already passed
     */
    bool pace(double sim_t) {
        using namespace std::chrono;

        const auto deadline = deadline_for(sim_t);
        const int64_t remaining_ns = duration_cast<nanoseconds>(deadline - steady_clock::now()).count();
        stats_.paced_steps++;

        if (remaining_ns < 0) {
            const double late_ms = -remaining_ns / 1e6;
            stats_.deadline_misses++;
            stats_.max_lateness_ms = std::max(stats_.max_lateness_ms, late_ms);
            total_lateness_ms_ += late_ms;
            stats_.avg_lateness_ms = total_lateness_ms_ / stats_.deadline_misses;
            return false;
        }

        if (remaining_ns > spin_threshold_ns_) {
            std::this_thread::sleep_until(deadline - nanoseconds(spin_threshold_ns_));
        }
        while (steady_clock::now() < deadline) {
            std::this_thread::yield();
        }
        return true;
    }

    /**
     * Wall time elapsed minus scaled simulation time (positive = behind)
     */
    double drift_s(double sim_t) const {
        const double wall = std::chrono::duration<double>(std::chrono::steady_clock::now() - anchor_).count();
        return wall - (sim_t - anchor_sim_s_) / factor_;
    }

    double real_time_factor() const { return factor_; }
    const Stats& stats() const { return stats_; }

    void set_spin_threshold_us(double us) {
        spin_threshold_ns_ = static_cast<int64_t>(us * 1000.0);
    }

private:
    std::chrono::steady_clock::time_point deadline_for(double sim_t) const {
        const double offset_s = (sim_t - anchor_sim_s_) / factor_;
        return anchor_ + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                             std::chrono::duration<double>(offset_s));
    }

    double factor_;
    int64_t spin_threshold_ns_;

    std::chrono::steady_clock::time_point anchor_;
    double anchor_sim_s_ = 0.0;

    double total_lateness_ms_ = 0.0;
    Stats stats_;
};

} // namespace sim
