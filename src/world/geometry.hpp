// src/world/geometry.hpp
#pragma once

#include <cmath>

namespace world {

struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Vec3() = default;
    Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
    Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
    Vec3 operator*(double s) const { return {x * s, y * s, z * s}; }
    Vec3 operator/(double s) const { return {x / s, y / s, z / s}; }
    Vec3& operator+=(const Vec3& o) { x += o.x; y += o.y; z += o.z; return *this; }
    Vec3& operator-=(const Vec3& o) { x -= o.x; y -= o.y; z -= o.z; return *this; }

    bool operator==(const Vec3& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const Vec3& o) const { return !(*this == o); }

    double dot(const Vec3& o) const { return x * o.x + y * o.y + z * o.z; }
    Vec3 cross(const Vec3& o) const {
        return {y * o.z - z * o.y, z * o.x - x * o.z, x * o.y - y * o.x};
    }
    double norm() const { return std::sqrt(dot(*this)); }
};

/**
 * Unit quaternion, Hamilton convention, stored (w, x, y, z).
 * Rotates body-frame vectors into the parent frame.
 */
struct Quat {
    double w = 1.0;
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Quat() = default;
    Quat(double w_, double x_, double y_, double z_) : w(w_), x(x_), y(y_), z(z_) {}

    static Quat identity() { return {}; }

    static Quat from_yaw(double yaw_rad) {
        return {std::cos(0.5 * yaw_rad), 0.0, 0.0, std::sin(0.5 * yaw_rad)};
    }

    // Rotation of `angle_rad` about unit `axis`
    static Quat from_axis_angle(const Vec3& axis, double angle_rad) {
        const double s = std::sin(0.5 * angle_rad);
        return {std::cos(0.5 * angle_rad), axis.x * s, axis.y * s, axis.z * s};
    }

    Quat operator*(const Quat& o) const {
        return {
            w * o.w - x * o.x - y * o.y - z * o.z,
            w * o.x + x * o.w + y * o.z - z * o.y,
            w * o.y - x * o.z + y * o.w + z * o.x,
            w * o.z + x * o.y - y * o.x + z * o.w
        };
    }

    bool operator==(const Quat& o) const { return w == o.w && x == o.x && y == o.y && z == o.z; }
    bool operator!=(const Quat& o) const { return !(*this == o); }

    Quat conjugate() const { return {w, -x, -y, -z}; }

    double norm() const { return std::sqrt(w * w + x * x + y * y + z * z); }

    Quat normalized() const {
        const double n = norm();
        if (n <= 0.0) return identity();
        return {w / n, x / n, y / n, z / n};
    }

    bool is_unit(double tol = 1e-6) const { return std::abs(norm() - 1.0) <= tol; }

    Vec3 rotate(const Vec3& v) const {
        // v' = v + 2w(q x v) + 2 q x (q x v)
        const Vec3 q{x, y, z};
        const Vec3 t = q.cross(v) * 2.0;
        return v + t * w + q.cross(t);
    }

    double yaw() const {
        return std::atan2(2.0 * (w * z + x * y), 1.0 - 2.0 * (y * y + z * z));
    }
};

struct Pose {
    Vec3 position;
    Quat orientation;

    // this * child: express child pose (given in this frame) in the parent frame
    Pose compose(const Pose& child) const {
        return {position + orientation.rotate(child.position),
                (orientation * child.orientation).normalized()};
    }

    Vec3 transform_point(const Vec3& p) const {
        return position + orientation.rotate(p);
    }
};

} // namespace world
