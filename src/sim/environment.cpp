// src/sim/environment.cpp
#include "sim/environment.hpp"
#include "sim/errors.hpp"
#include "world/lua_motion.hpp"
#include "utils/logging.hpp"

#include <chrono>
#include <utility>

namespace sim {

namespace {

bridge::BridgeConfig bridge_config_from(const config::EnvConfig& cfg) {
    bridge::BridgeConfig bc;
    bc.publish_timeout = std::chrono::milliseconds(cfg.bridge.publish_timeout_ms);
    bc.drain_timeout = std::chrono::milliseconds(cfg.bridge.drain_timeout_ms);
    return bc;
}

} // namespace

EnvironmentController::EnvironmentController(config::EnvConfig cfg,
                                             std::unique_ptr<world::SceneProvider> scenes,
                                             std::unique_ptr<bridge::Transport> transport,
                                             std::unique_ptr<world::MotionSource> motion)
    : cfg_(std::move(cfg)),
      scenes_(std::move(scenes)),
      motion_(std::move(motion))
{
    if (!scenes_) {
        throw ConfigurationError("EnvironmentController needs a scene provider");
    }
    bridge_ = std::make_unique<bridge::TransportBridge>(std::move(transport), bridge_config_from(cfg_));
}

EnvironmentController::~EnvironmentController() {
    close();
}

// ============================================================================
// Lifecycle
// ============================================================================

void EnvironmentController::require_not_closed_(const char* op) const {
    if (state_ == EnvState::Closed) {
        throw SequencingError(std::string(op) + " after close()");
    }
}

void EnvironmentController::build_motion_() {
    if (motion_) return;

    if (!cfg_.body.motion_script.empty()) {
        auto lua = std::make_unique<world::LuaMotion>();
        if (!lua->init(cfg_.body.motion_script)) {
            throw ConfigurationError("cannot load motion script: " + cfg_.body.motion_script);
        }
        motion_ = std::move(lua);
        return;
    }

    motion_ = std::make_unique<world::OrbitMotion>(cfg_.body.orbit);
}

void EnvironmentController::initialize() {
    require_not_closed_("initialize()");
    if (state_ != EnvState::Constructed) {
        throw SequencingError("initialize() called twice");
    }

    try {
        cfg_.validate();

        // 1. Clock
        clock_ = std::make_unique<SimClock>(cfg_.simulation.physics_dt, cfg_.simulation.rendering_dt);
        LOG_INFO("[Env] Clock: physics dt=%.4f s, render dt=%.4f s (k=%llu)",
                 clock_->physics_dt(), clock_->render_dt(),
                 static_cast<unsigned long long>(clock_->render_interval()));

        // 2. Physics / render context
        build_motion_();
        physics_ = std::make_unique<world::PhysicsWorld>(cfg_.body.physics, motion_.get());
        LOG_INFO("[Env] Physics context ready (motion=%s, %s)",
                 motion_->name().c_str(), cfg_.simulation.headless ? "headless" : "windowed");

        // 3. Sensors
        registry_ = std::make_unique<sensors::SensorRegistry>(cfg_.sensors);

        tree_.clear();
        std::map<std::string, sensors::SensorKind> kinds;
        for (const auto& s : registry_->sensors()) {
            tree_.add_static(s->spec().mount->frame_id, s->spec().mount->pose());
            kinds[s->name()] = s->kind();
        }

        // 4. Bridge (transform cadence follows the slowest sensor)
        bridge_->setup(cfg_.channels, kinds, registry_->min_rate_hz());
    } catch (...) {
        teardown_();
        throw;
    }

    state_ = EnvState::Initialized;
    LOG_INFO("[Env] Initialized: %zu sensors, %zu channels",
             registry_->size(), bridge_->channels().size());
}

ObservationSnapshot EnvironmentController::reset(const std::string& scene_id, uint64_t seed) {
    require_not_closed_("reset()");
    if (state_ == EnvState::Constructed) {
        throw SequencingError("reset() before initialize()");
    }

    // In-flight reliable messages belong to the previous episode
    bridge_->drain(bridge_->config().drain_timeout);

    std::shared_ptr<const world::Scene> scene;
    try {
        scene = scenes_->load(scene_id, seed);
    } catch (const SceneLoadError& e) {
        state_ = EnvState::Initialized;
        LOG_ERROR("[Env] Scene load failed for '%s' (seed %llu): %s",
                  scene_id.c_str(), static_cast<unsigned long long>(seed), e.what());
        throw;
    }

    physics_->reset(std::move(scene), seed);
    clock_->reset();
    utils::set_sim_time(0.0);
    registry_->reset(seed);
    bridge_->reset_schedule();

    scene_id_ = scene_id;
    seed_ = seed;

    ObservationSnapshot snap = observe_and_publish_();
    state_ = EnvState::Ready;

    const auto& spawn = physics_->spawn();
    LOG_INFO("[Env] Reset: scene=%s seed=%llu spawn=(%.2f, %.2f, %.2f) yaw=%.2f",
             scene_id.c_str(), static_cast<unsigned long long>(seed),
             spawn.position.x, spawn.position.y, spawn.position.z,
             spawn.orientation.yaw());
    return snap;
}

ObservationSnapshot EnvironmentController::step() {
    require_not_closed_("step()");
    if (state_ == EnvState::Constructed) {
        throw SequencingError("step() before initialize()");
    }
    if (state_ != EnvState::Ready) {
        throw SequencingError("step() before reset()");
    }

    const double dt = clock_->physics_dt();
    const double t = clock_->advance();
    utils::set_sim_time(t);

    physics_->step(t, dt);

    const sensors::GroundTruth truth = ground_truth_();
    registry_->integrate_all(t, truth, dt);
    if (clock_->due_render_tick()) {
        registry_->update_due(t, truth);
    }

    return observe_and_publish_();
}

void EnvironmentController::close() {
    if (state_ == EnvState::Closed) return;

    if (bridge_) {
        bridge_->close();
    }
    if (registry_) {
        registry_->release();
    }
    if (physics_) {
        physics_->teardown();
    }

    state_ = EnvState::Closed;
    utils::clear_sim_time();
    LOG_INFO("[Env] Closed");
}

void EnvironmentController::teardown_() {
    registry_.reset();
    if (physics_) physics_->teardown();
    physics_.reset();
    clock_.reset();
    tree_.clear();
}

// ============================================================================
// Per-step helpers
// ============================================================================

sensors::GroundTruth EnvironmentController::ground_truth_() const {
    sensors::GroundTruth gt;
    gt.body = physics_->truth();
    gt.scene = physics_->scene();
    gt.spawn = physics_->spawn();
    return gt;
}

ObservationSnapshot EnvironmentController::observe_and_publish_() {
    tree_.update_dynamic(physics_->truth().pose());
    ObservationSnapshot snap = assembler_.assemble(clock_->time(), *registry_);
    bridge_->publish(snap, tree_);
    return snap;
}

// ============================================================================
// Queries
// ============================================================================

const SimClock& EnvironmentController::clock() const {
    if (!clock_) {
        throw SequencingError("clock() before initialize()");
    }
    return *clock_;
}

bridge::BridgeStats EnvironmentController::bridge_stats() const {
    return bridge_ ? bridge_->stats() : bridge::BridgeStats{};
}

bridge::BridgeState EnvironmentController::bridge_state() const {
    return bridge_ ? bridge_->state() : bridge::BridgeState::Uninitialized;
}

const world::BodyState& EnvironmentController::truth() const {
    if (!physics_) {
        throw SequencingError("truth() before initialize()");
    }
    return physics_->truth();
}

const sensors::SensorRegistry& EnvironmentController::sensors() const {
    if (!registry_) {
        throw SequencingError("sensors() before initialize()");
    }
    return *registry_;
}

} // namespace sim
