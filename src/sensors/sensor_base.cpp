// src/sensors/sensor_base.cpp
#include "sensors/sensor_base.hpp"

namespace sensors {

namespace {

// Float slack when comparing elapsed time against the period
constexpr double kDueEpsilon = 1e-9;

uint64_t splitmix64(uint64_t x) {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

} // namespace

SensorBase::SensorBase(const SensorSpec& spec, size_t index)
    : spec_(spec),
      index_(index),
      due_period_(spec.due_period_s())
{
    sample_.name = spec_.name;
    sample_.kind = spec_.kind();
    sample_.payload = empty_payload();
}

uint64_t SensorBase::derive_seed(uint64_t episode_seed, size_t index) {
    return splitmix64(episode_seed ^ splitmix64(static_cast<uint64_t>(index) + 1));
}

bool SensorBase::is_due(double t) const {
    return (t - ref_t_) >= due_period_ - kDueEpsilon;
}

void SensorBase::integrate(double t, const GroundTruth& truth, double dt) {
    (void)t;
    (void)truth;
    (void)dt;
}

const SensorSample& SensorBase::sample(double t, const GroundTruth& truth) {
    const bool ok = measure(t, truth, sample_.payload);
    sample_.t_s = t;
    sample_.valid = ok;
    ++sample_.update_count;
    sample_.valid_since_reset = sample_.valid_since_reset || ok;
    ref_t_ = t;
    return sample_;
}

void SensorBase::reset(uint64_t episode_seed) {
    sample_ = SensorSample{};
    sample_.name = spec_.name;
    sample_.kind = spec_.kind();
    sample_.payload = empty_payload();
    ref_t_ = 0.0;
    reset_state(derive_seed(episode_seed, index_));
}

world::Pose SensorBase::sensor_pose(const GroundTruth& truth) const {
    return truth.body.pose().compose(spec_.mount ? spec_.mount->pose() : world::Pose{});
}

SamplePayload SensorBase::empty_payload() const {
    switch (spec_.kind()) {
        case SensorKind::RangeImage:
            return RangeImage{};
        case SensorKind::Inertial:
            return InertialReading{};
        case SensorKind::PoseVelocity:
            return PoseVelocityReading{};
    }
    return RangeImage{};
}

} // namespace sensors
