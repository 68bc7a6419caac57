// src/sim/environment.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "bridge/transform_tree.hpp"
#include "bridge/transport.hpp"
#include "bridge/transport_bridge.hpp"
#include "config/env_config.hpp"
#include "sensors/sensor_registry.hpp"
#include "sim/observation.hpp"
#include "sim/sim_clock.hpp"
#include "world/motion_source.hpp"
#include "world/physics_world.hpp"
#include "world/scene_provider.hpp"

namespace sim {

enum class EnvState : uint8_t {
    Constructed = 0,
    Initialized,
    Ready,
    Closed
};

inline const char* to_string(EnvState s) {
    switch (s) {
        case EnvState::Constructed: return "constructed";
        case EnvState::Initialized: return "initialized";
        case EnvState::Ready:       return "ready";
        case EnvState::Closed:      return "closed";
    }
    return "unknown";
}

/**
 * EnvironmentController - Lifecycle of one simulation environment
 *
 *   Constructed --initialize()--> Initialized --reset()--> Ready --step()--> Ready
 *        |                              |                    |
 *        +-------------- close() -------+--------------------+--> Closed
 *
 * initialize() builds, in order: clock, physics context, sensor registry,
 * transform tree statics, bridge setup. A failure tears down what was built
 * and leaves the controller Constructed.
 *
 * Per step():
 *   1. clock.advance()
 *   2. physics.step()
 *   3. sensors.integrate_all()          (every physics tick)
 *   4. sensors.update_due()             (render ticks only)
 *   5. transforms, assemble, publish
 *
 * Out-of-order calls throw SequencingError. close() is idempotent and is
 * also run by the destructor.
 */
class EnvironmentController {
public:
    /**
     * @param motion  carrier motion; null = Lua script from config, else orbit
     * @throws ConfigurationError if scenes is null
     */
    EnvironmentController(config::EnvConfig cfg,
                          std::unique_ptr<world::SceneProvider> scenes,
                          std::unique_ptr<bridge::Transport> transport,
                          std::unique_ptr<world::MotionSource> motion = nullptr);
    ~EnvironmentController();

    EnvironmentController(const EnvironmentController&) = delete;
    EnvironmentController& operator=(const EnvironmentController&) = delete;

    /**
     * @throws SequencingError unless Constructed
     * @throws ConfigurationError on invalid timing, sensors or channels
     */
    void initialize();

    /**
     * Start an episode in scene (scene_id, seed)
     *
     * @return initial observation (all sensors invalid)
     * @throws SequencingError unless Initialized or Ready
     * @throws SceneLoadError (controller is left Initialized)
     */
    ObservationSnapshot reset(const std::string& scene_id, uint64_t seed);

    /**
     * @throws SequencingError unless Ready
     */
    ObservationSnapshot step();

    void close();

    // ========================================================================
    // Queries
    // ========================================================================

    EnvState state() const { return state_; }

    // @throws SequencingError before initialize()
    const SimClock& clock() const;

    // Zeroed counters before initialize()
    bridge::BridgeStats bridge_stats() const;
    bridge::BridgeState bridge_state() const;

    const std::string& current_scene() const { return scene_id_; }
    uint64_t current_seed() const { return seed_; }

    // @throws SequencingError before initialize()
    const world::BodyState& truth() const;
    const sensors::SensorRegistry& sensors() const;

    const bridge::TransformTree& transforms() const { return tree_; }
    const config::EnvConfig& config() const { return cfg_; }

private:
    void build_motion_();
    void teardown_();
    sensors::GroundTruth ground_truth_() const;
    ObservationSnapshot observe_and_publish_();
    void require_not_closed_(const char* op) const;

    config::EnvConfig cfg_;
    std::unique_ptr<world::SceneProvider> scenes_;
    std::unique_ptr<world::MotionSource> motion_;
    std::unique_ptr<bridge::TransportBridge> bridge_;

    std::unique_ptr<SimClock> clock_;
    std::unique_ptr<world::PhysicsWorld> physics_;
    std::unique_ptr<sensors::SensorRegistry> registry_;
    bridge::TransformTree tree_;
    ObservationAssembler assembler_;

    EnvState state_ = EnvState::Constructed;
    std::string scene_id_;
    uint64_t seed_ = 0;
};

} // namespace sim
