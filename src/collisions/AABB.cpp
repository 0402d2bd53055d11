/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"

#include <algorithm>

namespace Ragfall {

bool AABB::intersects(const AABB& other) const {
    // Non-strict separation so face-touching is NOT a collision
    const Vector3D aMin = min(), aMax = max();
    const Vector3D bMin = other.min(), bMax = other.max();
    if (aMax.getX() <= bMin.getX() || bMax.getX() <= aMin.getX()) return false;
    if (aMax.getY() <= bMin.getY() || bMax.getY() <= aMin.getY()) return false;
    if (aMax.getZ() <= bMin.getZ() || bMax.getZ() <= aMin.getZ()) return false;
    return true;
}

bool AABB::contains(const Vector3D& p) const {
    const Vector3D lo = min(), hi = max();
    return p.getX() >= lo.getX() && p.getX() <= hi.getX() &&
           p.getY() >= lo.getY() && p.getY() <= hi.getY() &&
           p.getZ() >= lo.getZ() && p.getZ() <= hi.getZ();
}

Vector3D AABB::closestPoint(const Vector3D& p) const {
    const Vector3D lo = min(), hi = max();
    return Vector3D{std::clamp(p.getX(), lo.getX(), hi.getX()),
                    std::clamp(p.getY(), lo.getY(), hi.getY()),
                    std::clamp(p.getZ(), lo.getZ(), hi.getZ())};
}

} // namespace Ragfall
