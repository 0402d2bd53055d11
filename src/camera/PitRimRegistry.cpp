/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "camera/PitRimRegistry.hpp"

namespace Ragfall {

PitRimRegistry::MarkerID PitRimRegistry::registerMarker(const Pose& pose) {
    const MarkerID id = m_nextId++;
    m_markers.emplace(id, pose);
    return id;
}

bool PitRimRegistry::removeMarker(MarkerID id) {
    return m_markers.erase(id) > 0;
}

std::optional<Pose> PitRimRegistry::findNearest(const Vector3D& point, float radius) const {
    if (radius < 0.0f) {
        return std::nullopt;
    }

    const float radiusSq = radius * radius;
    const Pose* best = nullptr;
    float bestDistSq = 0.0f;
    for (const auto& [id, pose] : m_markers) {
        float distSq = Vector3D::distanceSquared(point, pose.position);
        if (distSq <= radiusSq && (!best || distSq < bestDistSq)) {
            best = &pose;
            bestDistSq = distSq;
        }
    }
    return best ? std::optional<Pose>(*best) : std::nullopt;
}

} // namespace Ragfall
