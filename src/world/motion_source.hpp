// src/world/motion_source.hpp
#pragma once

#include "world/body_state.hpp"

#include <string>

namespace world {

// Velocity setpoint for the carrier body (world frame) plus yaw rate
struct MotionCmd {
    Vec3 velocity_mps;
    double yaw_rate_rps = 0.0;
};

/**
 * MotionSource - Produces the body motion setpoint every physics step
 */
class MotionSource {
public:
    virtual ~MotionSource() = default;

    /**
     * Called on every environment reset with the freshly drawn spawn pose
     */
    virtual void reset(const Pose& spawn) = 0;

    /**
     * @return false if no command could be produced this step (caller holds)
     */
    virtual bool command(double t, const BodyState& state, MotionCmd& out) = 0;

    virtual std::string name() const = 0;
};

struct OrbitMotionParams {
    double speed_mps = 1.0;
    double radius_m = 3.0;
};

/**
 * OrbitMotion - Constant-speed level circle starting from the spawn heading
 *
 * speed_mps = 0 gives a hover.
 */
class OrbitMotion : public MotionSource {
public:
    explicit OrbitMotion(const OrbitMotionParams& params = {}) : params_(params) {}

    void reset(const Pose& spawn) override;
    bool command(double t, const BodyState& state, MotionCmd& out) override;
    std::string name() const override { return "orbit"; }

private:
    OrbitMotionParams params_;
};

} // namespace world
