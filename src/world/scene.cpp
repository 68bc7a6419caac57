// src/world/scene.cpp
#include "world/scene.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace world {

namespace {

// Slab test. Returns entry distance or -1 on miss.
double ray_box(const Vec3& o, const Vec3& d, const Box& b) {
    double t_near = -std::numeric_limits<double>::infinity();
    double t_far = std::numeric_limits<double>::infinity();

    const double o_arr[3] = {o.x, o.y, o.z};
    const double d_arr[3] = {d.x, d.y, d.z};
    const double lo[3] = {b.min_m.x, b.min_m.y, b.min_m.z};
    const double hi[3] = {b.max_m.x, b.max_m.y, b.max_m.z};

    for (int i = 0; i < 3; ++i) {
        if (std::abs(d_arr[i]) < 1e-12) {
            if (o_arr[i] < lo[i] || o_arr[i] > hi[i]) return -1.0;
            continue;
        }
        double t1 = (lo[i] - o_arr[i]) / d_arr[i];
        double t2 = (hi[i] - o_arr[i]) / d_arr[i];
        if (t1 > t2) std::swap(t1, t2);
        t_near = std::max(t_near, t1);
        t_far = std::min(t_far, t2);
        if (t_near > t_far || t_far < 0.0) return -1.0;
    }

    // Origin inside the box: report the exit face
    return t_near >= 0.0 ? t_near : t_far;
}

bool finite(const Vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

} // namespace

Scene::Scene(std::string id, std::string family, uint64_t seed,
             double ground_z_m, std::vector<Box> boxes)
    : id_(std::move(id)),
      family_(std::move(family)),
      seed_(seed),
      ground_z_(ground_z_m),
      boxes_(std::move(boxes))
{}

double Scene::raycast(const Vec3& origin, const Vec3& dir, double max_range_m) const {
    double best = std::numeric_limits<double>::infinity();

    // Ground plane
    if (dir.z < -1e-12) {
        const double t = (ground_z_ - origin.z) / dir.z;
        if (t > 0.0) best = t;
    }

    for (const auto& box : boxes_) {
        const double t = ray_box(origin, dir, box);
        if (t > 0.0 && t < best) best = t;
    }

    if (best > max_range_m) return -1.0;
    return best;
}

bool Scene::occupied(const Vec3& p) const {
    if (p.z < ground_z_) return true;
    for (const auto& box : boxes_) {
        if (box.contains(p)) return true;
    }
    return false;
}

bool Scene::validate(std::string& why) const {
    if (!std::isfinite(ground_z_)) {
        why = "ground plane height is not finite";
        return false;
    }
    for (size_t i = 0; i < boxes_.size(); ++i) {
        const auto& b = boxes_[i];
        if (!finite(b.min_m) || !finite(b.max_m)) {
            why = "box " + std::to_string(i) + " has non-finite bounds";
            return false;
        }
        if (b.min_m.x > b.max_m.x || b.min_m.y > b.max_m.y || b.min_m.z > b.max_m.z) {
            why = "box " + std::to_string(i) + " has min > max";
            return false;
        }
    }
    return true;
}

} // namespace world
