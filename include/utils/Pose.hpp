/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef POSE_HPP
#define POSE_HPP

#include "utils/Vector3D.hpp"

#include <cmath>

// Unit quaternion, w + xi + yj + zk
struct Quaternion {
    float w{1.0f};
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};

    static Quaternion identity() { return Quaternion{}; }

    // Rotation about the up axis, radians
    static Quaternion fromYaw(float radians) {
        float half = radians * 0.5f;
        return Quaternion{std::cos(half), 0.0f, std::sin(half), 0.0f};
    }

    Quaternion operator*(const Quaternion& q) const {
        return Quaternion{w * q.w - x * q.x - y * q.y - z * q.z,
                          w * q.x + x * q.w + y * q.z - z * q.y,
                          w * q.y - x * q.z + y * q.w + z * q.x,
                          w * q.z + x * q.y - y * q.x + z * q.w};
    }

    Vector3D rotate(const Vector3D& v) const {
        // v' = v + 2w(u x v) + 2(u x (u x v))
        Vector3D u(x, y, z);
        Vector3D t = u.cross(v) * 2.0f;
        return v + t * w + u.cross(t);
    }

    bool operator==(const Quaternion& q) const {
        return w == q.w && x == q.x && y == q.y && z == q.z;
    }
};

// Position plus orientation
struct Pose {
    Vector3D position{};
    Quaternion orientation{};

    Pose() = default;
    explicit Pose(const Vector3D& pos, const Quaternion& rot = Quaternion::identity())
        : position(pos), orientation(rot) {}

    Vector3D forward() const { return orientation.rotate(Vector3D::forward()); }
    Vector3D up() const { return orientation.rotate(Vector3D::up()); }

    // Local offset expressed in world space
    Vector3D transformPoint(const Vector3D& local) const {
        return position + orientation.rotate(local);
    }

    Pose raised(float height) const {
        return Pose(position + Vector3D::up() * height, orientation);
    }

    bool operator==(const Pose& other) const {
        return position == other.position && orientation == other.orientation;
    }
};

#endif  // POSE_HPP
