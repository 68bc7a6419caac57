// src/sensors/sensor_registry.hpp
#pragma once

#include "sensors/sensor_base.hpp"
#include "sensors/sensor_spec.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sensors {

/**
 * SensorRegistry - Owns all configured sensors
 *
 * Responsibilities:
 * - Validate specs and create the enabled sensors
 * - integrate_all() on every physics tick
 * - update_due() on render ticks: sample only sensors that are due
 * - Reseed every sensor on episode reset
 *
 * Sensor order (and therefore seed derivation) follows the configured list.
 */
class SensorRegistry {
public:
    /**
     * @throws sim::ConfigurationError on any invalid spec
     */
    explicit SensorRegistry(const std::vector<SensorSpec>& specs);

    /**
     * Check a spec list without building anything
     *
     * @throws sim::ConfigurationError naming the offending sensor
     */
    static void validate(const std::vector<SensorSpec>& specs);

    void integrate_all(double t, const GroundTruth& truth, double dt);

    /**
     * Sample every sensor whose due period has elapsed.
     * @return number of sensors updated
     */
    size_t update_due(double t, const GroundTruth& truth);

    void reset(uint64_t episode_seed);

    /**
     * Destroy all sensors. The registry is empty afterwards.
     */
    void release();

    SensorBase* find(const std::string& name);
    const SensorBase* find(const std::string& name) const;

    std::vector<std::string> names() const;
    size_t size() const { return sensors_.size(); }

    /**
     * Lowest observation rate among enabled sensors (publish rate for
     * inertial sensors), 0 if empty
     */
    double min_rate_hz() const;

    std::map<std::string, uint64_t> update_counts() const;

    const std::vector<std::unique_ptr<SensorBase>>& sensors() const { return sensors_; }

private:
    std::vector<std::unique_ptr<SensorBase>> sensors_;
};

/**
 * Construct the concrete sensor for spec.kind()
 */
std::unique_ptr<SensorBase> make_sensor(const SensorSpec& spec, size_t index);

} // namespace sensors
