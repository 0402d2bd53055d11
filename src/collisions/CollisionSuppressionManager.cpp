/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionSuppressionManager.hpp"
#include "core/Logger.hpp"
#include "core/TaskScheduler.hpp"
#include "physics/PhysicsWorld.hpp"
#include "ragdoll/RagdollInstance.hpp"

#include <algorithm>
#include <format>

namespace Ragfall {

CollisionSuppressionManager::CollisionSuppressionManager(PhysicsWorld& world,
                                                         TaskScheduler& scheduler,
                                                         float nudgeImpulse)
    : m_world(world), m_scheduler(scheduler), m_nudgeImpulse(nudgeImpulse) {}

CollisionSuppressionManager::~CollisionSuppressionManager() {
    restoreAll();
}

CollisionSuppressionManager::RecordID
CollisionSuppressionManager::ignore(std::span<const ColliderID> colliders, ColliderID target,
                                    float duration) {
    if (!m_world.hasCollider(target)) {
        SUPPRESSION_WARN(std::format("Target collider {} does not exist", target));
        return INVALID_RECORD;
    }

    SuppressionRecord record;
    record.target = target;
    record.expiresAt = m_scheduler.now() + std::max(0.0f, duration);

    for (ColliderID collider : colliders) {
        if (collider == target) {
            continue;
        }
        PhysicsResult result = m_world.setIgnoreCollision(collider, target, true);
        if (result != PhysicsResult::Ok) {
            SUPPRESSION_DEBUG(std::format("Skipping collider {}: {}", collider, toString(result)));
            continue;
        }
        ++m_pairRefCounts[makePair(collider, target)];
        record.colliders.push_back(collider);
    }

    if (record.colliders.empty()) {
        SUPPRESSION_WARN(std::format("Nothing to suppress against collider {}", target));
        return INVALID_RECORD;
    }

    const RecordID id = m_nextRecordId++;
    SUPPRESSION_DEBUG(std::format("Record {}: {} colliders vs {} for {:.2f}s", id,
                                  record.colliders.size(), target, duration));
    m_records.emplace(id, std::move(record));

    m_scheduler.scheduleAfter(duration, [this, id]() { expire(id); }, m_lifetime);
    return id;
}

void CollisionSuppressionManager::expire(RecordID id) {
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return;
    }

    SuppressionRecord record = std::move(it->second);
    m_records.erase(it);

    for (ColliderID collider : record.colliders) {
        releasePair(collider, record.target);
    }
    SUPPRESSION_DEBUG(std::format("Record {} expired", id));
}

void CollisionSuppressionManager::releasePair(ColliderID collider, ColliderID target) {
    auto it = m_pairRefCounts.find(makePair(collider, target));
    if (it == m_pairRefCounts.end()) {
        return;
    }

    if (--it->second > 0) {
        return;
    }
    m_pairRefCounts.erase(it);

    PhysicsResult result = m_world.setIgnoreCollision(collider, target, false);
    if (result != PhysicsResult::Ok) {
        // Either side was destroyed while suppressed; nothing left to restore
        SUPPRESSION_DEBUG(std::format("Restore {} vs {} skipped: {}", collider, target,
                                      toString(result)));
    }
}

void CollisionSuppressionManager::restoreAll() {
    while (!m_records.empty()) {
        expire(m_records.begin()->first);
    }
}

bool CollisionSuppressionManager::isSuppressed(ColliderID collider, ColliderID target) const {
    return m_pairRefCounts.contains(makePair(collider, target));
}

bool CollisionSuppressionManager::nudgeAway(RagdollInstance& instance, ColliderID target,
                                            float distance) {
    if (instance.isDestroyed()) {
        SUPPRESSION_DEBUG("Nudge skipped: ragdoll already destroyed");
        return false;
    }

    const Vector3D rootPosition = instance.getPosition();
    auto closest = m_world.closestPointOn(target, rootPosition);
    if (!closest) {
        SUPPRESSION_DEBUG(std::format("Nudge skipped: target {} is gone", target));
        return false;
    }

    Vector3D direction = rootPosition - *closest;
    if (direction.lengthSquared() < COINCIDENT_DISTANCE_SQ) {
        direction = instance.getSourcePose().forward() + Vector3D::up() * FALLBACK_UP_BIAS;
    }
    direction = direction.normalized();

    instance.translate(m_world, direction * distance);

    const Vector3D deltaV = direction * m_nudgeImpulse;
    for (const auto& part : instance.getParts()) {
        PhysicsResult result = m_world.addVelocityChange(part.body, deltaV);
        if (result != PhysicsResult::Ok) {
            SUPPRESSION_DEBUG(std::format("Impulse on '{}' skipped: {}", part.name,
                                          toString(result)));
        }
    }
    return true;
}

} // namespace Ragfall
