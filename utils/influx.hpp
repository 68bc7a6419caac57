// utils/influx.hpp
#pragma once

#include "bridge/transport_bridge.hpp"
#include "sensors/sensor_sample.hpp"
#include "sim/observation.hpp"
#include <cstdint>
#include <string>
#include <memory>

namespace utils {

/**
 * InfluxDB client for environment telemetry
 *
 * Only enabled when telemetry.enabled is set in the config (or --influx).
 * Writes are rate limited in simulation time.
 *
 * Measurement schema:
 *   - sensor_samples: one line per sensor, tagged name/kind
 *   - bridge_stats:   transport degradation counters
 *   - environment:    sim time and observation completeness
 */
class InfluxClient {
public:
    struct Config {
        std::string url = "http://localhost:8086";  // InfluxDB server URL
        std::string token = "";                      // Authentication token (optional for local)
        std::string org = "rapid";
        std::string bucket = "rapid_sim";
        double write_interval_s = 0.25;              // Simulation seconds between writes
        bool enabled = false;
    };

    /**
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    explicit InfluxClient(const Config& config);

    ~InfluxClient();

    /**
     * Write one snapshot plus bridge counters
     *
     * Skipped (returns false) when disabled or when less than
     * write_interval_s of simulation time has passed since the last write.
     * A sim_time earlier than the last write (episode reset) restarts the
     * rate limiter.
     */
    bool write_snapshot(const sim::ObservationSnapshot& snapshot,
                        const bridge::BridgeStats& stats,
                        double sim_time);

    bool is_enabled() const { return config_.enabled; }

    const Config& get_config() const { return config_; }

    size_t writes_ok() const { return writes_ok_; }

    // ========================================================================
    // Line protocol builders
    // ========================================================================

    static std::string build_sensor_line(const sensors::SensorSample& sample, int64_t timestamp_ns);
    static std::string build_bridge_line(const bridge::BridgeStats& stats, int64_t timestamp_ns);
    static std::string build_environment_line(const sim::ObservationSnapshot& snapshot, int64_t timestamp_ns);

    // Escape ',', '=' and ' ' in tag keys/values
    static std::string escape_tag(const std::string& v);

private:
    Config config_;
    double last_write_time_;
    size_t writes_ok_ = 0;

    // Implementation details hidden (pimpl pattern)
    struct Impl;
    std::unique_ptr<Impl> impl_;

    bool send_to_influx(const std::string& line_protocol);

    // Data is stamped with wall time so it shows up as "now" in the UI
    static int64_t wall_clock_time_ns();
};

} // namespace utils
