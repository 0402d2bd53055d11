/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

#include "utils/Vector3D.hpp"

namespace Ragfall {

struct AABB {
    Vector3D center;   // world center
    Vector3D halfSize; // half extents (w/2, h/2, d/2)

    AABB() = default;
    AABB(const Vector3D& c, const Vector3D& half) : center(c), halfSize(half) {}

    Vector3D min() const { return center - halfSize; }
    Vector3D max() const { return center + halfSize; }

    bool intersects(const AABB& other) const;
    bool contains(const Vector3D& p) const;
    Vector3D closestPoint(const Vector3D& p) const;

    AABB translated(const Vector3D& delta) const { return AABB(center + delta, halfSize); }
};

} // namespace Ragfall

#endif // AABB_HPP
