// test/test_environment.cpp
/**
 * Unit Test: EnvironmentController
 *
 * Test Coverage:
 *   1. Lifecycle sequencing errors and idempotent close
 *   2. Render cadence: sensors update on the k-th physics step
 *   3. Reset restarts time, counters and validity
 *   4. Same (scene, seed) replays identical observations
 *   5. Unavailable middleware does not change observations
 *   6. Loopback subscribers receive the configured channels
 *   7. Scene load failures leave the controller usable
 *   8. Initialization failures
 *   9. Loopback round trip: decoded payloads equal the returned snapshot
 *  10. Lua motion script drives the body
 */

#include "bridge/loopback_transport.hpp"
#include "bridge/wire_codec.hpp"
#include "sim/environment.hpp"
#include "sim/errors.hpp"
#include "world/lua_motion.hpp"
#include "utils/logging.hpp"
#include "test_harness.hpp"

#include <memory>
#include <string>
#include <vector>

#ifndef RAPID_SIM_TEST_DATA_DIR
#define RAPID_SIM_TEST_DATA_DIR "test"
#endif

namespace {

// Holds the spawn pose
class HoverMotion : public world::MotionSource {
public:
    void reset(const world::Pose& spawn) override { (void)spawn; ++resets; }
    bool command(double t, const world::BodyState& state, world::MotionCmd& out) override {
        (void)t;
        (void)state;
        out = world::MotionCmd{};
        return true;
    }
    std::string name() const override { return "hover"; }

    int resets = 0;
};

std::unique_ptr<world::ProceduralSceneProvider> make_scenes(const config::EnvConfig& cfg) {
    auto scenes = std::make_unique<world::ProceduralSceneProvider>(cfg.scenes);
    // Inverted box: loads but fails geometry validation
    scenes->add_scene("broken", {world::Box{{1.0, 1.0, 1.0}, {0.0, 0.0, 0.0}}});
    return scenes;
}

std::unique_ptr<sim::EnvironmentController> make_env(std::unique_ptr<bridge::Transport> transport,
                                                     std::unique_ptr<world::MotionSource> motion = nullptr) {
    const auto cfg = config::EnvConfig::get_default();
    return std::make_unique<sim::EnvironmentController>(cfg, make_scenes(cfg), std::move(transport),
                                                        std::move(motion));
}

bool same_observation(const sim::ObservationSnapshot& a, const sim::ObservationSnapshot& b) {
    return a.t_s == b.t_s && a.samples == b.samples;
}

struct Counter {
    size_t n = 0;
    bridge::ReceiveCallback callback() {
        return [this](const std::string&, const std::vector<uint8_t>&) { ++n; };
    }
};

struct Decoder {
    std::vector<bridge::WireMessage> messages;
    size_t malformed = 0;

    bridge::ReceiveCallback callback() {
        return [this](const std::string&, const std::vector<uint8_t>& bytes) {
            bridge::WireMessage m;
            if (bridge::WireCodec::decode(bytes, m)) {
                messages.push_back(m);
            } else {
                ++malformed;
            }
        };
    }
};

template <typename T>
bool body_matches(const bridge::WireMessage& m, const sensors::SensorSample& s) {
    const auto* got = std::get_if<T>(&m.body);
    const auto* want = std::get_if<T>(&s.payload);
    return got && want && *got == *want;
}

std::string test_script(const char* name) {
    return std::string(RAPID_SIM_TEST_DATA_DIR) + "/lua/" + name;
}

} // namespace

// Test 1: Sequencing
void test_lifecycle_sequencing(TestResult& result) {
    std::cout << "\n=== Test 1: Lifecycle Sequencing ===\n";

    auto env = make_env(std::make_unique<bridge::LoopbackTransport>());
    result.check(env->state() == sim::EnvState::Constructed, "Starts Constructed");

    expect_throw<sim::SequencingError>(result, [&] { env->step(); }, "step() before initialize()");
    expect_throw<sim::SequencingError>(result, [&] { env->reset("empty", 1); }, "reset() before initialize()");
    expect_throw<sim::SequencingError>(result, [&] { env->clock(); }, "clock() before initialize()");

    env->initialize();
    result.check(env->state() == sim::EnvState::Initialized, "initialize() enters Initialized");
    result.check(env->bridge_state() == bridge::BridgeState::Bridging, "Bridge is Bridging after initialize()");

    expect_throw<sim::SequencingError>(result, [&] { env->initialize(); }, "initialize() twice");
    expect_throw<sim::SequencingError>(result, [&] { env->step(); }, "step() before reset()");

    env->reset("empty", 1);
    result.check(env->state() == sim::EnvState::Ready, "reset() enters Ready");

    env->close();
    result.check(env->state() == sim::EnvState::Closed, "close() enters Closed");
    result.check(env->bridge_state() == bridge::BridgeState::Closed, "Bridge closed with the controller");

    env->close();
    result.check(env->state() == sim::EnvState::Closed, "Second close() is a no-op");

    expect_throw<sim::SequencingError>(result, [&] { env->step(); }, "step() after close()");
    expect_throw<sim::SequencingError>(result, [&] { env->reset("empty", 1); }, "reset() after close()");
    expect_throw<sim::SequencingError>(result, [&] { env->initialize(); }, "initialize() after close()");

    auto unused = make_env(std::make_unique<bridge::LoopbackTransport>());
    unused->close();
    result.check(unused->state() == sim::EnvState::Closed, "close() straight after construction");
}

// Test 2: k = 5 render cadence
void test_render_cadence(TestResult& result) {
    std::cout << "\n=== Test 2: Render Cadence (k = 5) ===\n";

    auto env = make_env(std::make_unique<bridge::LoopbackTransport>());
    env->initialize();
    result.check(env->clock().render_interval() == 5, "10 ms physics, 50 ms render gives k = 5");

    const auto first = env->reset("empty", 1);
    result.check(first.t_s == 0.0, "Reset snapshot at t = 0");
    result.check(first.samples.size() == 3, "One sample per sensor");
    result.check(first.valid_count() == 0, "All samples invalid right after reset");

    sim::ObservationSnapshot snap;
    for (int i = 0; i < 4; ++i) snap = env->step();
    result.check(snap.find("depth")->update_count == 0, "No range update before the render tick");
    result.check(!snap.find("depth")->valid, "Range still invalid after 4 steps");

    snap = env->step();
    result.check(is_close(snap.t_s, 0.05, 1e-9), "5 steps reach t = 0.05 s");

    const auto* depth = snap.find("depth");
    result.check(depth->update_count == 1 && depth->valid, "Range updated once and valid at the render tick");
    result.check(depth->t_s == snap.t_s, "Range sample stamped with the tick time");

    const auto* imu = snap.find("imu");
    const auto& r = std::get<sensors::InertialReading>(imu->payload);
    result.check(imu->update_count == 1 && imu->valid, "Inertial published once");
    result.check(r.integrated_updates == 5, "Inertial sample collapses 5 native updates");

    for (int i = 0; i < 5; ++i) snap = env->step();
    result.check(snap.find("depth")->update_count == 2, "Second range update at the next tick");
    result.check(snap.complete(), "Observation complete once every sensor produced a valid sample");
}

// Test 3: Reset restarts the episode
void test_reset_restarts(TestResult& result) {
    std::cout << "\n=== Test 3: Reset Restarts Episode ===\n";

    auto motion = std::make_unique<HoverMotion>();
    HoverMotion* hover = motion.get();
    auto env = make_env(std::make_unique<bridge::LoopbackTransport>(), std::move(motion));
    env->initialize();

    env->reset("office", 3);
    for (int i = 0; i < 12; ++i) env->step();

    const auto snap = env->reset("warehouse", 4);
    result.check(env->clock().time() == 0.0, "Clock back at t = 0");
    result.check(snap.valid_count() == 0 && !snap.complete(), "Validity cleared");

    bool counts_zero = true;
    for (const auto& [name, count] : env->sensors().update_counts()) {
        (void)name;
        counts_zero = counts_zero && count == 0;
    }
    result.check(counts_zero, "Update counters cleared");
    result.check(env->current_scene() == "warehouse" && env->current_seed() == 4,
                 "Scene and seed recorded");
    result.check(hover->resets == 2, "Motion source reset on every episode");

    const auto spawn = env->truth().position_m;
    for (int i = 0; i < 10; ++i) env->step();
    const auto after = env->truth().position_m;
    result.check(is_close(after.x, spawn.x, 1e-9) && is_close(after.y, spawn.y, 1e-9),
                 "Injected hover motion holds the spawn position");
}

// Test 4: Determinism
void test_determinism(TestResult& result) {
    std::cout << "\n=== Test 4: Determinism ===\n";

    auto run = [](uint64_t seed) {
        auto env = make_env(std::make_unique<bridge::LoopbackTransport>());
        env->initialize();
        std::vector<sim::ObservationSnapshot> out;
        out.push_back(env->reset("forest", seed));
        for (int i = 0; i < 20; ++i) out.push_back(env->step());
        env->close();
        return out;
    };

    const auto a = run(11);
    const auto b = run(11);
    const auto c = run(12);

    bool identical = a.size() == b.size();
    for (size_t i = 0; identical && i < a.size(); ++i) {
        identical = same_observation(a[i], b[i]);
    }
    result.check(identical, "Same scene and seed give identical observations");
    result.check(!same_observation(a.back(), c.back()), "Different seed gives different observations");

    // Same controller, same seed twice
    auto env = make_env(std::make_unique<bridge::LoopbackTransport>());
    env->initialize();
    env->reset("forest", 11);
    std::vector<sim::ObservationSnapshot> again;
    for (int i = 0; i < 20; ++i) again.push_back(env->step());
    env->reset("forest", 11);
    bool replay = true;
    for (int i = 0; i < 20; ++i) {
        replay = replay && same_observation(env->step(), again[i]);
    }
    result.check(replay, "Re-reset with the same seed replays the episode");
}

// Test 5: Middleware availability does not change observations
void test_unavailable_transport(TestResult& result) {
    std::cout << "\n=== Test 5: Unavailable Transport ===\n";

    bridge::LoopbackTransport::Faults down;
    down.unavailable = true;

    auto healthy = make_env(std::make_unique<bridge::LoopbackTransport>());
    auto degraded = make_env(std::make_unique<bridge::LoopbackTransport>(down));
    auto detached = make_env(nullptr);

    healthy->initialize();
    degraded->initialize();
    detached->initialize();

    result.check(!healthy->bridge_stats().degraded, "Healthy bridge not degraded");
    result.check(degraded->bridge_stats().degraded, "Unavailable middleware degrades the bridge");
    result.check(detached->bridge_stats().degraded, "Missing transport degrades the bridge");

    bool equal = same_observation(healthy->reset("office", 5), degraded->reset("office", 5));
    detached->reset("office", 5);
    for (int i = 0; i < 15; ++i) {
        const auto h = healthy->step();
        equal = equal && same_observation(h, degraded->step());
        equal = equal && same_observation(h, detached->step());
    }
    result.check(equal, "Observations identical with and without middleware");
}

// Test 6: Loopback delivery
void test_loopback_delivery(TestResult& result) {
    std::cout << "\n=== Test 6: Loopback Delivery ===\n";

    auto transport = std::make_unique<bridge::LoopbackTransport>();
    bridge::LoopbackTransport* lb = transport.get();
    auto env = make_env(std::move(transport));

    Counter clock;
    Counter imu;
    Counter tf;
    lb->subscribe("/clock", clock.callback());
    lb->subscribe("/imu/data", imu.callback());
    lb->subscribe("/tf", tf.callback());

    env->initialize();
    env->reset("empty", 2);
    for (int i = 0; i < 10; ++i) env->step();

    result.check(clock.n == 11, "Clock on every publish (reset + 10 steps)");
    result.check(imu.n == 2, "IMU once per new sample (t = 0.05, 0.10)");
    result.check(tf.n == 3, "TF at the sensor rate (t = 0, 0.05, 0.10)");
    result.check(lb->latched_count("/camera/depth/camera_info") == 1, "camera_info latched for late joiners");

    const auto st = env->bridge_stats();
    result.check(st.published > 0 && st.publish_failures == 0, "Bridge published without failures");
}

// Test 7: Scene load failures
void test_scene_load_failure(TestResult& result) {
    std::cout << "\n=== Test 7: Scene Load Failure ===\n";

    auto env = make_env(std::make_unique<bridge::LoopbackTransport>());
    env->initialize();

    expect_throw<sim::SceneNotFoundError>(result, [&] { env->reset("atlantis", 1); }, "Unknown scene id");
    result.check(env->state() == sim::EnvState::Initialized, "Still Initialized after a failed first reset");

    env->reset("empty", 1);
    env->step();

    expect_throw<sim::SceneInvalidError>(result, [&] { env->reset("broken", 1); }, "Invalid scene geometry");
    result.check(env->state() == sim::EnvState::Initialized, "Failed reset drops back to Initialized");
    expect_throw<sim::SequencingError>(result, [&] { env->step(); }, "step() needs a successful reset");

    const auto snap = env->reset("office", 1);
    result.check(env->state() == sim::EnvState::Ready && snap.t_s == 0.0, "Next reset recovers");
}

// Test 8: Initialization failures
void test_initialize_failure(TestResult& result) {
    std::cout << "\n=== Test 8: Initialization Failure ===\n";

    auto cfg = config::EnvConfig::get_default();
    cfg.simulation.rendering_dt = 0.025;   // not a multiple of 10 ms

    sim::EnvironmentController env(cfg, make_scenes(config::EnvConfig::get_default()),
                                   std::make_unique<bridge::LoopbackTransport>());
    expect_throw<sim::ConfigurationError>(result, [&] { env.initialize(); }, "Bad timing rejected");
    result.check(env.state() == sim::EnvState::Constructed, "Stays Constructed after a failed initialize()");
    result.check(env.bridge_state() == bridge::BridgeState::Uninitialized, "Bridge never set up");

    auto bad_channel = config::EnvConfig::get_default();
    bad_channel.channels[0].sensor = "lidar";
    sim::EnvironmentController env2(bad_channel, make_scenes(bad_channel),
                                    std::make_unique<bridge::LoopbackTransport>());
    expect_throw<sim::ConfigurationError>(result, [&] { env2.initialize(); },
                                          "Channel bound to an unknown sensor rejected");

    expect_throw<sim::ConfigurationError>(result, [] {
        sim::EnvironmentController e(config::EnvConfig::get_default(), nullptr, nullptr);
    }, "Missing scene provider rejected");
}

// Test 9: Loopback round trip
void test_loopback_round_trip(TestResult& result) {
    std::cout << "\n=== Test 9: Loopback Round Trip ===\n";

    const auto cfg = config::EnvConfig::get_default();
    result.check(cfg.sensors[0].noise.model != sensors::NoiseModelKind::None &&
                 cfg.sensors[1].noise.model != sensors::NoiseModelKind::None,
                 "Depth and IMU run with noise enabled");

    auto transport = std::make_unique<bridge::LoopbackTransport>();
    bridge::LoopbackTransport* lb = transport.get();
    auto env = make_env(std::move(transport));

    struct Stream {
        const char* channel;
        const char* sensor;
        Decoder decoder;
        size_t compared = 0;
        bool equal = true;
    };
    Stream streams[] = {
        {"/camera/depth", "depth", {}, 0, true},
        {"/imu/data", "imu", {}, 0, true},
        {"/odom", "odom", {}, 0, true},
    };
    for (auto& s : streams) {
        lb->subscribe(s.channel, s.decoder.callback());
    }

    env->initialize();
    env->reset("office", 21);

    for (int i = 0; i < 30; ++i) {
        size_t before[3];
        for (int k = 0; k < 3; ++k) before[k] = streams[k].decoder.messages.size();

        const auto snap = env->step();

        for (int k = 0; k < 3; ++k) {
            auto& s = streams[k];
            if (s.decoder.messages.size() == before[k]) continue;

            const auto& msg = s.decoder.messages.back();
            const auto* sample = snap.find(s.sensor);
            bool same = sample && sample->valid &&
                        is_close(msg.header.stamp.to_seconds(), sample->t_s, 1e-9);
            if (same) {
                switch (sample->kind) {
                    case sensors::SensorKind::RangeImage:
                        same = body_matches<sensors::RangeImage>(msg, *sample);
                        break;
                    case sensors::SensorKind::Inertial:
                        same = body_matches<sensors::InertialReading>(msg, *sample);
                        break;
                    case sensors::SensorKind::PoseVelocity:
                        same = body_matches<sensors::PoseVelocityReading>(msg, *sample);
                        break;
                }
            }
            s.equal = s.equal && same;
            ++s.compared;
        }
    }

    for (const auto& s : streams) {
        result.check(s.decoder.malformed == 0, std::string(s.channel) + ": every message decodes");
        result.check(s.compared == 6, std::string(s.channel) + ": one message per 20 Hz update (6 in 0.3 s)");
        result.check(s.equal, std::string(s.channel) + ": decoded payload equals the returned snapshot");
    }

    // Receivers go out of scope before the controller
    env->close();
}

// Test 10: Lua motion script
void test_lua_motion(TestResult& result) {
    std::cout << "\n=== Test 10: Lua Motion Script ===\n";

    world::LuaMotion missing;
    result.check(!missing.init(test_script("does_not_exist.lua")), "Missing script rejected");

    world::LuaMotion incomplete;
    result.check(!incomplete.init(test_script("no_motion_cmd.lua")), "Script without motion_cmd rejected");

    auto cfg = config::EnvConfig::get_default();
    cfg.body.motion_script = test_script("constant_velocity.lua");

    sim::EnvironmentController env(cfg, make_scenes(cfg), std::make_unique<bridge::LoopbackTransport>());
    env.initialize();
    env.reset("empty", 4);

    const auto spawn = env.truth().position_m;
    for (int i = 0; i < 200; ++i) env.step();
    const auto& body = env.truth();

    result.check(is_close(body.velocity_mps.x, 1.0, 1e-3) && is_close(body.velocity_mps.y, -0.5, 1e-3),
                 "Body tracks the scripted velocity");
    result.check(is_close(body.velocity_mps.z, 0.0, 1e-9), "Unset vz defaults to 0");
    result.check(is_close(body.angular_velocity_rps.z, 0.3, 1e-9),
                 "motion_reset ran once before the first command");

    const double dx = body.position_m.x - spawn.x;
    const double dy = body.position_m.y - spawn.y;
    result.check(dx > 1.6 && dx < 1.9 && dy < -0.8 && dy > -0.95,
                 "Body moved along the commanded direction");

    env.reset("empty", 4);
    env.step();
    result.check(is_close(env.truth().angular_velocity_rps.z, 0.6, 1e-9), "Script sees every reset");
}

int main() {
    utils::set_level(utils::LogLevel::Warn);

    print_title("EnvironmentController Unit Tests");

    TestResult result;

    test_lifecycle_sequencing(result);
    test_render_cadence(result);
    test_reset_restarts(result);
    test_determinism(result);
    test_unavailable_transport(result);
    test_loopback_delivery(result);
    test_scene_load_failure(result);
    test_initialize_failure(result);
    test_loopback_round_trip(result);
    test_lua_motion(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
