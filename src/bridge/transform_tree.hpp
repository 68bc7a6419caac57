// src/bridge/transform_tree.hpp
#pragma once

#include "world/geometry.hpp"

#include <string>
#include <vector>

namespace bridge {

struct FrameTransform {
    std::string parent;
    std::string child;
    world::Vec3 translation;
    world::Quat rotation;

    bool operator==(const FrameTransform& o) const {
        return parent == o.parent && child == o.child &&
               translation == o.translation && rotation == o.rotation;
    }
};

/**
 * TransformTree - world -> body (dynamic) and body -> sensor mounts (static)
 *
 *   world
 *     └── base_link            (updated from ground truth every step)
 *           ├── depth_camera   (static mount)
 *           ├── imu_link
 *           └── ...
 */
class TransformTree {
public:
    explicit TransformTree(std::string world_frame = "world",
                           std::string body_frame = "base_link");

    void add_static(const std::string& child, const world::Pose& mount);
    void update_dynamic(const world::Pose& body_pose);
    void clear();

    // Dynamic transform first, then statics in insertion order
    std::vector<FrameTransform> transforms() const;

    /**
     * World pose of `frame`. Returns false for unknown frames.
     */
    bool resolve(const std::string& frame, world::Pose& out) const;

    const std::string& world_frame() const { return world_frame_; }
    const std::string& body_frame() const { return body_frame_; }
    size_t static_count() const { return statics_.size(); }

private:
    std::string world_frame_;
    std::string body_frame_;
    world::Pose body_;
    std::vector<FrameTransform> statics_;
};

} // namespace bridge
