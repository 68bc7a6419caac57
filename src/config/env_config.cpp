// src/config/env_config.cpp
#include "config/env_config.hpp"
#include "sensors/sensor_registry.hpp"
#include "sim/errors.hpp"
#include "sim/sim_clock.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <fstream>
#include <functional>
#include <set>
#include <stdexcept>

namespace config {

namespace {

constexpr double kDegToRad = M_PI / 180.0;

[[noreturn]] void fail(const std::string& msg) {
    throw sim::ConfigurationError("[EnvConfig] " + msg);
}

world::Vec3 parse_vec3(const YAML::Node& n, const std::string& what) {
    if (!n || !n.IsSequence() || n.size() != 3) {
        fail(what + ": expected [x, y, z]");
    }
    return world::Vec3{n[0].as<double>(), n[1].as<double>(), n[2].as<double>()};
}

// [w, x, y, z]
world::Quat parse_quat(const YAML::Node& n, const std::string& what) {
    if (!n || !n.IsSequence() || n.size() != 4) {
        fail(what + ": expected [w, x, y, z]");
    }
    return world::Quat{n[0].as<double>(), n[1].as<double>(), n[2].as<double>(), n[3].as<double>()};
}

sensors::NoiseParams parse_noise(const YAML::Node& n, const std::string& what) {
    sensors::NoiseParams p;
    const std::string model = n["model"].as<std::string>("none");
    if (!sensors::parse_noise_model(model, p.model)) {
        fail(what + ": unknown noise model '" + model + "'");
    }
    p.sigma = n["sigma"].as<double>(0.0);
    p.bias = n["bias"].as<double>(0.0);
    p.random_walk_sigma = n["random_walk_sigma"].as<double>(0.0);
    p.bias_tau_s = n["bias_tau_s"].as<double>(0.0);
    p.bias_bound = n["bias_bound"].as<double>(0.0);
    return p;
}

sensors::SensorSpec parse_sensor(const YAML::Node& s, size_t index) {
    sensors::SensorSpec spec;

    if (!s["name"]) fail("sensor #" + std::to_string(index) + ": missing 'name'");
    spec.name = s["name"].as<std::string>();
    const std::string where = "sensor '" + spec.name + "'";

    if (!s["kind"]) fail(where + ": missing 'kind'");
    sensors::SensorKind kind;
    const std::string kind_name = s["kind"].as<std::string>();
    if (!sensors::parse_sensor_kind(kind_name, kind)) {
        fail(where + ": unknown kind '" + kind_name + "'");
    }

    if (!s["rate_hz"]) fail(where + ": missing 'rate_hz'");
    spec.rate_hz = s["rate_hz"].as<double>();
    spec.enabled = s["enabled"].as<bool>(true);

    // Mount pose is required; SensorRegistry rejects a missing one too
    if (s["mount"]) {
        const auto m = s["mount"];
        sensors::MountPose mount;
        mount.frame_id = m["frame_id"].as<std::string>(spec.name);
        if (!m["position"]) fail(where + ": mount needs 'position'");
        mount.position_m = parse_vec3(m["position"], where + " mount.position");
        if (m["orientation"]) {
            mount.orientation = parse_quat(m["orientation"], where + " mount.orientation");
        } else if (m["yaw_deg"]) {
            mount.orientation = world::Quat::from_yaw(m["yaw_deg"].as<double>() * kDegToRad);
        }
        spec.mount = mount;
    } else {
        fail(where + ": missing 'mount'");
    }

    if (s["range"]) {
        spec.bounds.min = s["range"]["min"].as<double>(0.0);
        spec.bounds.max = s["range"]["max"].as<double>(0.0);
    } else {
        fail(where + ": missing 'range'");
    }

    if (s["noise"]) {
        spec.noise = parse_noise(s["noise"], where + " noise");
    } else {
        LOG_WARN("[EnvConfig] %s: no noise model given, using 'none'", where.c_str());
    }

    switch (kind) {
        case sensors::SensorKind::RangeImage: {
            sensors::RangeImageParams p;
            if (s["image"]) {
                const auto img = s["image"];
                p.width = img["width"].as<uint32_t>(p.width);
                p.height = img["height"].as<uint32_t>(p.height);
                p.hfov_rad = img["hfov_deg"].as<double>(p.hfov_rad / kDegToRad) * kDegToRad;
            }
            spec.params = p;
            break;
        }
        case sensors::SensorKind::Inertial: {
            sensors::InertialParams p;
            if (s["imu"]) {
                const auto imu = s["imu"];
                p.publish_rate_hz = imu["publish_rate_hz"].as<double>(p.publish_rate_hz);
                p.gyro_max_rps = imu["gyro_max_rps"].as<double>(p.gyro_max_rps);
                if (imu["gyro_noise"]) {
                    p.gyro_noise = parse_noise(imu["gyro_noise"], where + " imu.gyro_noise");
                }
            }
            spec.params = p;
            break;
        }
        case sensors::SensorKind::PoseVelocity: {
            sensors::PoseVelocityParams p;
            if (s["odometry"]) {
                const auto od = s["odometry"];
                p.reference_frame = od["reference_frame"].as<std::string>(p.reference_frame);
                if (od["velocity_noise"]) {
                    p.velocity_noise = parse_noise(od["velocity_noise"], where + " odometry.velocity_noise");
                }
            }
            spec.params = p;
            break;
        }
    }

    return spec;
}

uint32_t parse_can_id(const YAML::Node& n, const std::string& where) {
    if (!n) return 0;
    const std::string text = n.as<std::string>();
    try {
        size_t pos = 0;
        const unsigned long v = std::stoul(text, &pos, 0);   // accepts 0x prefix
        if (pos != text.size()) fail(where + ": bad can_id '" + text + "'");
        if (v > bridge::kMaxCanId) {
            fail(where + ": can_id '" + text + "' exceeds the 11-bit range (max 0x7FF)");
        }
        return static_cast<uint32_t>(v);
    } catch (const std::logic_error&) {
        fail(where + ": bad can_id '" + text + "'");
    }
}

bridge::ChannelSpec parse_channel(const YAML::Node& c, size_t index) {
    bridge::ChannelSpec ch;

    if (!c["name"]) fail("channel #" + std::to_string(index) + ": missing 'name'");
    ch.name = c["name"].as<std::string>();
    const std::string where = "channel '" + ch.name + "'";

    if (!c["schema"]) fail(where + ": missing 'schema'");
    const std::string schema = c["schema"].as<std::string>();
    if (!bridge::parse_schema(schema, ch.schema)) {
        fail(where + ": unknown schema '" + schema + "'");
    }

    ch.sensor = c["sensor"].as<std::string>("");
    ch.frame_id = c["frame_id"].as<std::string>("");

    const std::string rel = c["reliability"].as<std::string>("best_effort");
    if (!bridge::parse_reliability(rel, ch.qos.reliability)) {
        fail(where + ": unknown reliability '" + rel + "'");
    }
    const std::string dur = c["durability"].as<std::string>("volatile");
    if (!bridge::parse_durability(dur, ch.qos.durability)) {
        fail(where + ": unknown durability '" + dur + "'");
    }
    ch.qos.depth = c["depth"].as<uint32_t>(1);
    ch.rate_hz = c["rate_hz"].as<double>(0.0);
    ch.can_id = parse_can_id(c["can_id"], where);
    return ch;
}

EnvConfig parse(const YAML::Node& root) {
    EnvConfig cfg;
    cfg.name = root["name"].as<std::string>("unnamed");

    // ====================================================================
    // Simulation timing
    // ====================================================================
    if (root["simulation"]) {
        auto s = root["simulation"];
        cfg.simulation.physics_dt = s["physics_dt"].as<double>(0.01);
        cfg.simulation.rendering_dt = s["rendering_dt"].as<double>(0.05);
        cfg.simulation.headless = s["headless"].as<bool>(true);
    }

    // ====================================================================
    // Carrier body / motion
    // ====================================================================
    if (root["body"]) {
        auto b = root["body"];
        auto& p = cfg.body.physics;
        p.spawn_xy_range_m = b["spawn_xy_range_m"].as<double>(p.spawn_xy_range_m);
        p.spawn_z_min_m = b["spawn_z_min_m"].as<double>(p.spawn_z_min_m);
        p.spawn_z_max_m = b["spawn_z_max_m"].as<double>(p.spawn_z_max_m);
        p.velocity_tau_s = b["velocity_tau_s"].as<double>(p.velocity_tau_s);
        p.max_accel_mps2 = b["max_accel_mps2"].as<double>(p.max_accel_mps2);
        p.max_yaw_rate_rps = b["max_yaw_rate_rps"].as<double>(p.max_yaw_rate_rps);
        p.min_clearance_m = b["min_clearance_m"].as<double>(p.min_clearance_m);
        cfg.body.orbit.speed_mps = b["cruise_speed_mps"].as<double>(cfg.body.orbit.speed_mps);
        cfg.body.orbit.radius_m = b["orbit_radius_m"].as<double>(cfg.body.orbit.radius_m);
        cfg.body.motion_script = b["motion_script"].as<std::string>("");
    }

    // ====================================================================
    // Scenes
    // ====================================================================
    if (root["scenes"]) {
        auto sc = root["scenes"];
        if (sc["families"]) {
            cfg.scenes.families.clear();
            for (const auto& f : sc["families"]) {
                cfg.scenes.families.push_back(f.as<std::string>());
            }
        }
        cfg.scenes.ground_z_m = sc["ground_z_m"].as<double>(cfg.scenes.ground_z_m);
        cfg.scenes.clear_radius_m = sc["clear_radius_m"].as<double>(cfg.scenes.clear_radius_m);
        cfg.scenes.extent_m = sc["extent_m"].as<double>(cfg.scenes.extent_m);
    }

    // ====================================================================
    // Sensors and channels
    // ====================================================================
    if (!root["sensors"] || !root["sensors"].IsSequence()) {
        fail("missing 'sensors' list");
    }
    size_t i = 0;
    for (const auto& s : root["sensors"]) {
        cfg.sensors.push_back(parse_sensor(s, i++));
    }

    if (root["channels"]) {
        if (!root["channels"].IsSequence()) fail("'channels' must be a list");
        i = 0;
        for (const auto& c : root["channels"]) {
            cfg.channels.push_back(parse_channel(c, i++));
        }
    }

    // ====================================================================
    // Bridge / logging / telemetry
    // ====================================================================
    if (root["bridge"]) {
        auto br = root["bridge"];
        cfg.bridge.transport = br["transport"].as<std::string>(cfg.bridge.transport);
        cfg.bridge.interface = br["interface"].as<std::string>(cfg.bridge.interface);
        cfg.bridge.publish_timeout_ms = br["publish_timeout_ms"].as<int>(cfg.bridge.publish_timeout_ms);
        cfg.bridge.drain_timeout_ms = br["drain_timeout_ms"].as<int>(cfg.bridge.drain_timeout_ms);
    }

    if (root["logging"]) {
        auto lg = root["logging"];
        cfg.logging.level = lg["level"].as<std::string>(cfg.logging.level);
        cfg.logging.file = lg["file"].as<std::string>("");
    }

    if (root["telemetry"]) {
        auto t = root["telemetry"];
        cfg.telemetry.enabled = t["enabled"].as<bool>(false);
        cfg.telemetry.url = t["url"].as<std::string>(cfg.telemetry.url);
        cfg.telemetry.org = t["org"].as<std::string>(cfg.telemetry.org);
        cfg.telemetry.bucket = t["bucket"].as<std::string>(cfg.telemetry.bucket);
        cfg.telemetry.token = t["token"].as<std::string>("");
        cfg.telemetry.interval_s = t["interval_s"].as<double>(cfg.telemetry.interval_s);
    }

    return cfg;
}

EnvConfig parse_checked(const std::function<YAML::Node()>& loader) {
    try {
        EnvConfig cfg = parse(loader());
        cfg.validate();
        return cfg;
    } catch (const sim::ConfigurationError&) {
        throw;
    } catch (const YAML::Exception& e) {
        throw sim::ConfigurationError(std::string("[EnvConfig] YAML parse error: ") + e.what());
    }
}

} // namespace

EnvConfig EnvConfig::load(const std::string& yaml_path) {
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[EnvConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[EnvConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[EnvConfig] Loading environment config from: %s", yaml_path.c_str());

    EnvConfig cfg = parse_checked([&]() { return YAML::LoadFile(yaml_path); });
    LOG_INFO("[EnvConfig] Successfully loaded: %s", cfg.name.c_str());
    return cfg;
}

EnvConfig EnvConfig::load_from_string(const std::string& yaml_text) {
    return parse_checked([&]() { return YAML::Load(yaml_text); });
}

EnvConfig EnvConfig::get_default() {
    EnvConfig cfg;
    cfg.name = "default";

    // Depth camera
    {
        sensors::SensorSpec s;
        s.name = "depth";
        s.rate_hz = 20.0;
        s.mount = sensors::MountPose{"depth_camera", world::Vec3{0.1, 0.0, 0.0}, world::Quat::identity()};
        s.bounds = {0.1, 30.0};
        s.noise.model = sensors::NoiseModelKind::Gaussian;
        s.noise.sigma = 0.01;
        s.params = sensors::RangeImageParams{};
        cfg.sensors.push_back(s);
    }

    // IMU: 100 Hz integration, 20 Hz into the observation
    {
        sensors::SensorSpec s;
        s.name = "imu";
        s.rate_hz = 100.0;
        s.mount = sensors::MountPose{"imu_link", world::Vec3{0.0, 0.0, 0.0}, world::Quat::identity()};
        s.bounds = {-160.0, 160.0};
        s.noise.model = sensors::NoiseModelKind::BiasRandomWalk;
        s.noise.sigma = 0.02;
        s.noise.random_walk_sigma = 0.002;
        s.noise.bias_tau_s = 100.0;
        s.noise.bias_bound = 0.5;

        sensors::InertialParams p;
        p.publish_rate_hz = 20.0;
        p.gyro_max_rps = 35.0;
        p.gyro_noise.model = sensors::NoiseModelKind::Gaussian;
        p.gyro_noise.sigma = 0.001;
        s.params = p;
        cfg.sensors.push_back(s);
    }

    // Odometry in the world frame
    {
        sensors::SensorSpec s;
        s.name = "odom";
        s.rate_hz = 20.0;
        s.mount = sensors::MountPose{"odom_link", world::Vec3{0.0, 0.0, 0.0}, world::Quat::identity()};
        s.bounds = {0.0, 50.0};
        s.params = sensors::PoseVelocityParams{};
        cfg.sensors.push_back(s);
    }

    auto channel = [&](const char* name, bridge::Schema schema, const char* sensor,
                       const char* frame, bridge::Reliability rel, bridge::Durability dur,
                       uint32_t depth, double rate_hz, uint32_t can_id) {
        bridge::ChannelSpec c;
        c.name = name;
        c.schema = schema;
        c.sensor = sensor;
        c.frame_id = frame;
        c.qos.reliability = rel;
        c.qos.durability = dur;
        c.qos.depth = depth;
        c.rate_hz = rate_hz;
        c.can_id = can_id;
        cfg.channels.push_back(c);
    };

    using bridge::Schema;
    using bridge::Reliability;
    using bridge::Durability;
    channel("/camera/depth", Schema::RangeImage, "depth", "depth_camera",
            Reliability::BestEffort, Durability::Volatile, 1, 20.0, 0x200);
    channel("/camera/depth/camera_info", Schema::CameraInfo, "depth", "depth_camera",
            Reliability::Reliable, Durability::Transient, 1, 20.0, 0x201);
    channel("/imu/data", Schema::Imu, "imu", "imu_link",
            Reliability::Reliable, Durability::Volatile, 10, 20.0, 0x210);
    channel("/odom", Schema::Odometry, "odom", "world",
            Reliability::Reliable, Durability::Volatile, 5, 20.0, 0x220);
    channel("/clock", Schema::Clock, "", "",
            Reliability::BestEffort, Durability::Volatile, 1, 0.0, 0x100);
    channel("/tf", Schema::TransformTree, "", "world",
            Reliability::BestEffort, Durability::Volatile, 1, 20.0, 0x300);

    return cfg;
}

void EnvConfig::validate() const {
    // Timing (throws on dt <= 0 or a non-integer ratio)
    sim::SimClock timing(simulation.physics_dt, simulation.rendering_dt);
    (void)timing;

    const auto& p = body.physics;
    if (p.spawn_xy_range_m < 0.0) {
        fail("Invalid spawn_xy_range_m: must be >= 0");
    }
    if (p.spawn_z_min_m > p.spawn_z_max_m) {
        fail("Invalid spawn z range: spawn_z_min_m > spawn_z_max_m");
    }
    if (p.velocity_tau_s <= 0.0 || p.max_accel_mps2 <= 0.0 || p.max_yaw_rate_rps <= 0.0) {
        fail("Invalid body response: velocity_tau_s, max_accel_mps2, max_yaw_rate_rps must be > 0");
    }
    if (body.orbit.radius_m <= 0.0) {
        fail("Invalid orbit_radius_m: must be > 0");
    }

    if (scenes.families.empty()) {
        fail("scenes.families must not be empty");
    }
    for (const auto& f : scenes.families) {
        if (!world::ProceduralSceneProvider::is_known_family(f)) {
            fail("unknown scene family '" + f + "'");
        }
    }

    sensors::SensorRegistry::validate(sensors);

    std::set<std::string> enabled;
    for (const auto& s : sensors) {
        if (s.enabled) enabled.insert(s.name);
    }
    std::set<std::string> names;
    for (const auto& c : channels) {
        if (!names.insert(c.name).second) {
            fail("duplicate channel name: " + c.name);
        }
        if (bridge::is_sensor_backed(c.schema) && enabled.count(c.sensor) == 0) {
            fail("channel " + c.name + " references unknown or disabled sensor '" + c.sensor + "'");
        }
        if (c.reliable() && c.qos.depth == 0) {
            fail("channel " + c.name + ": reliable QoS needs depth > 0");
        }
        if (c.rate_hz < 0.0) {
            fail("channel " + c.name + ": rate_hz must be >= 0");
        }
    }

    if (bridge.transport != "loopback" && bridge.transport != "socketcan" && bridge.transport != "none") {
        fail("unknown bridge.transport '" + bridge.transport + "' (loopback, socketcan, none)");
    }
    if (bridge.publish_timeout_ms < 0 || bridge.drain_timeout_ms < 0) {
        fail("bridge timeouts must be >= 0");
    }

    utils::LogLevel lvl;
    if (!utils::parse_level(logging.level, lvl)) {
        fail("unknown logging.level '" + logging.level + "'");
    }

    if (telemetry.enabled && telemetry.interval_s <= 0.0) {
        fail("telemetry.interval_s must be > 0");
    }

    LOG_DEBUG("[EnvConfig] Validation passed");
}

void EnvConfig::print_summary() const {
    LOG_INFO("========================================");
    LOG_INFO("Environment Configuration Summary");
    LOG_INFO("========================================");
    LOG_INFO("Name: %s", name.c_str());
    LOG_INFO("Physics dt: %.4f s, rendering dt: %.4f s (%s)",
             simulation.physics_dt, simulation.rendering_dt,
             simulation.headless ? "headless" : "windowed");
    LOG_INFO("Motion: %s", body.motion_script.empty() ? "orbit" : body.motion_script.c_str());
    LOG_INFO("----------------------------------------");
    for (const auto& s : sensors) {
        LOG_INFO("Sensor %-8s %-14s %6.1f Hz  noise=%s%s",
                 s.name.c_str(), sensors::to_string(s.kind()), s.rate_hz,
                 sensors::to_string(s.noise.model), s.enabled ? "" : "  (disabled)");
    }
    LOG_INFO("----------------------------------------");
    for (const auto& c : channels) {
        LOG_INFO("Channel %-28s %-14s %-11s %s",
                 c.name.c_str(), bridge::to_string(c.schema),
                 bridge::to_string(c.qos.reliability), bridge::to_string(c.qos.durability));
    }
    if (bridge.transport == "socketcan") {
        LOG_INFO("Transport: socketcan (%s)", bridge.interface.c_str());
    } else {
        LOG_INFO("Transport: %s", bridge.transport.c_str());
    }
    LOG_INFO("========================================");
}

} // namespace config
