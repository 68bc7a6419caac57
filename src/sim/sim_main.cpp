// src/sim/sim_main.cpp
#include "bridge/loopback_transport.hpp"
#include "bridge/socketcan_transport.hpp"
#include "config/env_config.hpp"
#include "sim/environment.hpp"
#include "sim/errors.hpp"
#include "sim/real_time_pacer.hpp"
#include "utils/influx.hpp"
#include "utils/logging.hpp"
#include "world/scene_provider.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>
#include <string>
#include <getopt.h>

namespace {

struct CliOptions {
    std::string config_path = "config/env.yaml";
    std::string scene;                 // Empty = cycle through families
    uint64_t seed = 0;
    long steps = 200;
    long episodes = 1;
    std::string transport;             // Empty = from config
    std::string can_iface;
    bool real_time = false;
    bool influx = false;
    std::string log_level;
};

// Counts what a local consumer would see on the loopback transport
struct LoopbackTap {
    std::map<std::string, std::atomic<uint64_t>> messages;
};

void print_usage(const char* prog_name) {
    printf("Usage: %s [options]\n", prog_name);
    printf("\nOptions:\n");
    printf("  --config PATH         Environment YAML (default: config/env.yaml)\n");
    printf("  --scene ID            Scene id / family (default: cycle configured families)\n");
    printf("  --seed N              Base seed; episode i uses N+i (default: 0)\n");
    printf("  --steps N             Physics steps per episode (default: 200)\n");
    printf("  --episodes N          Number of episodes (default: 1)\n");
    printf("  --transport NAME      loopback | socketcan | none (default: from config)\n");
    printf("  --can-iface NAME      SocketCAN interface (default: from config)\n");
    printf("  --real-time           Pace simulation time to the wall clock\n");
    printf("  --fast                Run as fast as possible (default)\n");
    printf("  --influx              Enable InfluxDB telemetry\n");
    printf("  --log-level LEVEL     trace | debug | info | warn | error | off\n");
    printf("  --help                Show this help\n");
    printf("\nExamples:\n");
    printf("  %s --scene office --seed 7 --steps 500\n", prog_name);
    printf("  %s --transport socketcan --can-iface vcan0 --real-time --episodes 3\n", prog_name);
}

bool parse_count(const char* text, long& out) {
    char* end = nullptr;
    const long v = std::strtol(text, &end, 10);
    if (!end || *end != '\0' || v < 0) return false;
    out = v;
    return true;
}

std::unique_ptr<bridge::Transport> make_transport(const config::EnvConfig& cfg, LoopbackTap& tap) {
    if (cfg.bridge.transport == "socketcan") {
        return std::make_unique<bridge::SocketCanTransport>(cfg.bridge.interface);
    }
    if (cfg.bridge.transport == "loopback") {
        auto lb = std::make_unique<bridge::LoopbackTransport>();
        for (const auto& c : cfg.channels) {
            auto& counter = tap.messages[c.name];
            counter = 0;
            lb->subscribe(c.name, [&counter](const std::string&, const std::vector<uint8_t>&) {
                counter.fetch_add(1, std::memory_order_relaxed);
            });
        }
        return lb;
    }
    return nullptr;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions cli;

    static struct option long_options[] = {
        {"config",     required_argument, 0, 'c'},
        {"scene",      required_argument, 0, 's'},
        {"seed",       required_argument, 0, 'S'},
        {"steps",      required_argument, 0, 'n'},
        {"episodes",   required_argument, 0, 'e'},
        {"transport",  required_argument, 0, 't'},
        {"can-iface",  required_argument, 0, 'i'},
        {"real-time",  no_argument,       0, 'R'},
        {"fast",       no_argument,       0, 'F'},
        {"influx",     no_argument,       0, 'I'},
        {"log-level",  required_argument, 0, 'l'},
        {"help",       no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;
    long seed_value = 0;

    while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c': cli.config_path = optarg; break;
            case 's': cli.scene = optarg; break;
            case 'S':
                if (!parse_count(optarg, seed_value)) {
                    fprintf(stderr, "Error: --seed expects a non-negative integer\n");
                    return 1;
                }
                cli.seed = static_cast<uint64_t>(seed_value);
                break;
            case 'n':
                if (!parse_count(optarg, cli.steps)) {
                    fprintf(stderr, "Error: --steps expects a non-negative integer\n");
                    return 1;
                }
                break;
            case 'e':
                if (!parse_count(optarg, cli.episodes) || cli.episodes == 0) {
                    fprintf(stderr, "Error: --episodes expects a positive integer\n");
                    return 1;
                }
                break;
            case 't': cli.transport = optarg; break;
            case 'i': cli.can_iface = optarg; break;
            case 'R': cli.real_time = true; break;
            case 'F': cli.real_time = false; break;
            case 'I': cli.influx = true; break;
            case 'l': cli.log_level = optarg; break;
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    // ========================================================================
    // Configuration (file, then command-line overrides)
    // ========================================================================
    config::EnvConfig cfg;
    try {
        cfg = config::EnvConfig::load(cli.config_path);
        if (!cli.transport.empty()) cfg.bridge.transport = cli.transport;
        if (!cli.can_iface.empty()) cfg.bridge.interface = cli.can_iface;
        if (!cli.log_level.empty()) cfg.logging.level = cli.log_level;
        if (cli.influx) cfg.telemetry.enabled = true;
        cfg.validate();
    } catch (const sim::ConfigurationError& e) {
        fprintf(stderr, "Configuration error: %s\n", e.what());
        return 2;
    }

    utils::LogLevel level = utils::LogLevel::Info;
    utils::parse_level(cfg.logging.level, level);
    utils::set_level(level);
    if (!cfg.logging.file.empty()) {
        utils::open_log_file(cfg.logging.file);
    }
    cfg.print_summary();

    // ========================================================================
    // Summary box
    // ========================================================================
    char timestep_str[50], steps_str[50];
    snprintf(timestep_str, sizeof(timestep_str), "%.4f s physics / %.4f s render",
             cfg.simulation.physics_dt, cfg.simulation.rendering_dt);
    snprintf(steps_str, sizeof(steps_str), "%ld episodes x %ld steps", cli.episodes, cli.steps);

    printf("\n");
    printf("╔════════════════════════════════════════════════════════════╗\n");
    printf("║           RAPID SIM ENVIRONMENT CONFIGURATION              ║\n");
    printf("╠════════════════════════════════════════════════════════════╣\n");
    printf("║ Config:     %-47s║\n", cli.config_path.c_str());
    printf("║ Scene:      %-47s║\n", cli.scene.empty() ? "(cycle families)" : cli.scene.c_str());
    printf("║ Timestep:   %-47s║\n", timestep_str);
    printf("║ Run:        %-47s║\n", steps_str);
    printf("║ Transport:  %-47s║\n", cfg.bridge.transport.c_str());
    if (cfg.bridge.transport == "socketcan") {
        printf("║ Interface:  %-47s║\n", cfg.bridge.interface.c_str());
    }
    printf("║ Real-time:  %-47s║\n", cli.real_time ? "yes (1:1 wall clock)" : "no (fast-forward)");
    printf("║ Telemetry:  %-47s║\n", cfg.telemetry.enabled ? "InfluxDB" : "off");
    printf("╚════════════════════════════════════════════════════════════╝\n");
    printf("\n");

    // ========================================================================
    // Run
    // ========================================================================
    LoopbackTap tap;
    int exit_code = 0;

    try {
        utils::InfluxClient::Config icfg;
        icfg.enabled = cfg.telemetry.enabled;
        icfg.url = cfg.telemetry.url;
        icfg.org = cfg.telemetry.org;
        icfg.bucket = cfg.telemetry.bucket;
        icfg.token = cfg.telemetry.token;
        icfg.write_interval_s = cfg.telemetry.interval_s;
        utils::InfluxClient influx(icfg);

        auto scenes = std::make_unique<world::ProceduralSceneProvider>(cfg.scenes);
        auto transport = make_transport(cfg, tap);
        const std::vector<std::string> families = cfg.scenes.families;

        sim::EnvironmentController env(cfg, std::move(scenes), std::move(transport));
        env.initialize();

        sim::RealTimePacer pacer(1.0);
        double spin_us = std::max(20.0, std::min(100.0, cfg.simulation.physics_dt * 1e6 * 0.05));
        pacer.set_spin_threshold_us(spin_us);

        for (long ep = 0; ep < cli.episodes; ++ep) {
            const std::string scene_id = cli.scene.empty()
                ? families[static_cast<size_t>(ep) % families.size()]
                : cli.scene;
            const uint64_t seed = cli.seed + static_cast<uint64_t>(ep);

            sim::ObservationSnapshot obs = env.reset(scene_id, seed);
            pacer.restart(obs.t_s);

            double first_complete_s = -1.0;
            for (long i = 0; i < cli.steps; ++i) {
                obs = env.step();
                if (first_complete_s < 0.0 && obs.complete()) {
                    first_complete_s = obs.t_s;
                }
                influx.write_snapshot(obs, env.bridge_stats(), obs.t_s);
                if (cli.real_time) {
                    pacer.pace(obs.t_s);
                }
            }

            const auto& truth = env.truth();
            LOG_INFO("[Main] Episode %ld: scene=%s seed=%llu t=%.2fs valid=%zu/%zu complete_at=%.2fs "
                     "pos=(%.2f, %.2f, %.2f)",
                     ep, scene_id.c_str(), static_cast<unsigned long long>(seed), obs.t_s,
                     obs.valid_count(), obs.samples.size(), first_complete_s,
                     truth.position_m.x, truth.position_m.y, truth.position_m.z);
            for (const auto& [name, count] : env.sensors().update_counts()) {
                LOG_INFO("[Main]   %-10s %llu updates", name.c_str(), static_cast<unsigned long long>(count));
            }
        }

        const bridge::BridgeStats st = env.bridge_stats();
        env.close();

        printf("\n");
        printf("╔════════════════════════════════════════════════════════════╗\n");
        printf("║                    BRIDGE SUMMARY                          ║\n");
        printf("╠════════════════════════════════════════════════════════════╣\n");
        printf("║ Published:          %-39llu║\n", static_cast<unsigned long long>(st.published));
        printf("║ Delivered:          %-39llu║\n", static_cast<unsigned long long>(st.delivered));
        printf("║ Best-effort drops:  %-39llu║\n", static_cast<unsigned long long>(st.best_effort_drops));
        printf("║ Reliable buffered:  %-39llu║\n", static_cast<unsigned long long>(st.reliable_buffered));
        printf("║ Retransmitted:      %-39llu║\n", static_cast<unsigned long long>(st.retransmitted));
        printf("║ Evicted:            %-39llu║\n", static_cast<unsigned long long>(st.evicted));
        printf("║ Publish timeouts:   %-39llu║\n", static_cast<unsigned long long>(st.publish_timeouts));
        printf("║ Deferred (budget):  %-39llu║\n", static_cast<unsigned long long>(st.deferred));
        printf("║ Drain discards:     %-39llu║\n", static_cast<unsigned long long>(st.drain_discards));
        printf("║ Degraded:           %-39s║\n", st.degraded ? "yes (no-op publisher)" : "no");
        printf("╚════════════════════════════════════════════════════════════╝\n");

        if (cli.real_time) {
            const auto& ps = pacer.stats();
            LOG_INFO("[Timing] %zu paced steps, %zu deadline misses (max %.2f ms, avg %.2f ms)",
                     ps.paced_steps, ps.deadline_misses, ps.max_lateness_ms, ps.avg_lateness_ms);
        }
        for (const auto& [channel, count] : tap.messages) {
            LOG_INFO("[Loopback] %-28s %llu received", channel.c_str(),
                     static_cast<unsigned long long>(count.load()));
        }
    } catch (const sim::ConfigurationError& e) {
        LOG_ERROR("[Main] Configuration error: %s", e.what());
        exit_code = 2;
    } catch (const sim::SceneLoadError& e) {
        LOG_ERROR("[Main] Scene load failed: %s", e.what());
        exit_code = 3;
    } catch (const sim::SequencingError& e) {
        LOG_ERROR("[Main] Lifecycle error: %s", e.what());
        exit_code = 4;
    } catch (const std::exception& e) {
        LOG_ERROR("[Main] %s", e.what());
        exit_code = 1;
    }

    utils::close_log_file();
    return exit_code;
}
