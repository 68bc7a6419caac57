// src/bridge/transform_tree.cpp
#include "bridge/transform_tree.hpp"

#include <utility>

namespace bridge {

TransformTree::TransformTree(std::string world_frame, std::string body_frame)
    : world_frame_(std::move(world_frame)),
      body_frame_(std::move(body_frame))
{}

void TransformTree::add_static(const std::string& child, const world::Pose& mount) {
    for (auto& tf : statics_) {
        if (tf.child == child) {
            tf.translation = mount.position;
            tf.rotation = mount.orientation;
            return;
        }
    }
    statics_.push_back({body_frame_, child, mount.position, mount.orientation});
}

void TransformTree::update_dynamic(const world::Pose& body_pose) {
    body_ = body_pose;
}

void TransformTree::clear() {
    statics_.clear();
    body_ = world::Pose{};
}

std::vector<FrameTransform> TransformTree::transforms() const {
    std::vector<FrameTransform> out;
    out.reserve(statics_.size() + 1);
    out.push_back({world_frame_, body_frame_, body_.position, body_.orientation});
    out.insert(out.end(), statics_.begin(), statics_.end());
    return out;
}

bool TransformTree::resolve(const std::string& frame, world::Pose& out) const {
    if (frame == world_frame_) {
        out = world::Pose{};
        return true;
    }
    if (frame == body_frame_) {
        out = body_;
        return true;
    }
    for (const auto& tf : statics_) {
        if (tf.child == frame) {
            out = body_.compose({tf.translation, tf.rotation});
            return true;
        }
    }
    return false;
}

} // namespace bridge
