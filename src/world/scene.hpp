// src/world/scene.hpp
#pragma once

#include "world/geometry.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace world {

// Axis-aligned static obstacle (world frame)
struct Box {
    Vec3 min_m;
    Vec3 max_m;

    bool contains(const Vec3& p) const {
        return p.x >= min_m.x && p.x <= max_m.x &&
               p.y >= min_m.y && p.y <= max_m.y &&
               p.z >= min_m.z && p.z <= max_m.z;
    }
};

/**
 * Scene - Static geometry of one loaded scene
 *
 * Infinite ground plane at ground_z plus a list of boxes. Immutable once
 * returned by a SceneProvider; shared read-only with the sensors.
 */
class Scene {
public:
    Scene(std::string id, std::string family, uint64_t seed,
          double ground_z_m, std::vector<Box> boxes);

    const std::string& id() const { return id_; }
    const std::string& family() const { return family_; }
    uint64_t seed() const { return seed_; }
    double ground_z() const { return ground_z_; }
    const std::vector<Box>& boxes() const { return boxes_; }

    /**
     * Cast a ray from `origin` along unit `dir`.
     *
     * @return distance along the ray to the nearest surface in (0, max_range],
     *         or a negative value if nothing is hit
     */
    double raycast(const Vec3& origin, const Vec3& dir, double max_range_m) const;

    // True if p is inside an obstacle or below the ground plane
    bool occupied(const Vec3& p) const;

    /**
     * Check geometry sanity (finite values, min <= max per box).
     * Returns false and fills `why` on the first problem found.
     */
    bool validate(std::string& why) const;

private:
    std::string id_;
    std::string family_;
    uint64_t seed_;
    double ground_z_;
    std::vector<Box> boxes_;
};

} // namespace world
