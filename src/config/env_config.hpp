// src/config/env_config.hpp
#pragma once

#include <string>
#include <vector>

#include "bridge/channel_spec.hpp"
#include "sensors/sensor_spec.hpp"
#include "world/motion_source.hpp"
#include "world/physics_world.hpp"
#include "world/scene_provider.hpp"

namespace config {

struct SimulationSection {
    double physics_dt = 0.01;
    double rendering_dt = 0.05;
    bool headless = true;
};

struct BodySection {
    world::PhysicsWorldParams physics;
    world::OrbitMotionParams orbit;
    std::string motion_script;          // Lua script; empty = built-in orbit
};

struct BridgeSection {
    std::string transport = "loopback"; // loopback | socketcan | none
    std::string interface = "vcan0";    // SocketCAN interface
    int publish_timeout_ms = 50;
    int drain_timeout_ms = 100;
};

struct LoggingSection {
    std::string level = "info";
    std::string file;
};

struct TelemetrySection {
    bool enabled = false;
    std::string url = "http://localhost:8086";
    std::string org = "rapid";
    std::string bucket = "rapid_sim";
    std::string token;
    double interval_s = 0.25;           // Simulation seconds between writes
};

/**
 * EnvConfig - Loads environment parameters from YAML files
 *
 * Usage:
 *   auto cfg = EnvConfig::load("config/env.yaml");
 *   sim::EnvironmentController env(cfg, std::move(scenes), std::move(transport));
 *
 * Falls back to the built-in sensor/channel set if the file is not found.
 */
class EnvConfig {
public:
    std::string name = "default";

    SimulationSection simulation;
    BodySection body;
    world::ProceduralSceneParams scenes;
    std::vector<sensors::SensorSpec> sensors;
    std::vector<bridge::ChannelSpec> channels;
    BridgeSection bridge;
    LoggingSection logging;
    TelemetrySection telemetry;

    /**
     * Load config from a YAML file
     * @throws sim::ConfigurationError if the file exists but is invalid
     *
     * If the file doesn't exist, returns the default configuration with a warning.
     */
    static EnvConfig load(const std::string& yaml_path);

    /**
     * Parse YAML text (same rules as load())
     * @throws sim::ConfigurationError
     */
    static EnvConfig load_from_string(const std::string& yaml_text);

    /**
     * Depth camera (20 Hz), IMU (100 Hz native / 20 Hz published),
     * odometry (20 Hz, world frame) and their channels plus /clock and /tf.
     */
    static EnvConfig get_default();

    /**
     * @throws sim::ConfigurationError if any parameter is invalid
     */
    void validate() const;

    void print_summary() const;

    EnvConfig() = default;
};

} // namespace config
