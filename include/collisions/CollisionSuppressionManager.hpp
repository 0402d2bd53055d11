/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_SUPPRESSION_MANAGER_HPP
#define COLLISION_SUPPRESSION_MANAGER_HPP

#include "collisions/CollisionBody.hpp"

#include <boost/container/flat_map.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <utility>
#include <vector>

namespace Ragfall {

class PhysicsWorld;
class RagdollInstance;
class TaskScheduler;

/**
 * @brief Time-bounded collision suppression between collider sets and a target.
 *
 * Each ignore() call creates a record that expires on its own through the
 * TaskScheduler. Records may overlap on the same pair; a pair becomes
 * collidable again only when the last record covering it expires.
 *
 * Expiry tolerates stale references: if either collider was destroyed in the
 * meantime the pair is skipped. Destroying the manager restores every active
 * record immediately, so no pair stays suppressed after its owner is gone.
 *
 * @note The PhysicsWorld and TaskScheduler must outlive the manager.
 */
class CollisionSuppressionManager {
public:
    using RecordID = uint64_t;
    static constexpr RecordID INVALID_RECORD = 0;

    static constexpr float DEFAULT_NUDGE_IMPULSE{1.5f};
    // Squared distance under which the ragdoll counts as sitting on the target
    static constexpr float COINCIDENT_DISTANCE_SQ{0.0001f};
    // Up bias added to the fallback forward direction
    static constexpr float FALLBACK_UP_BIAS{0.1f};

    CollisionSuppressionManager(PhysicsWorld& world, TaskScheduler& scheduler,
                                float nudgeImpulse = DEFAULT_NUDGE_IMPULSE);
    ~CollisionSuppressionManager();

    CollisionSuppressionManager(const CollisionSuppressionManager&) = delete;
    CollisionSuppressionManager& operator=(const CollisionSuppressionManager&) = delete;

    /**
     * @brief Stops every (collider, target) pair from colliding for duration seconds
     * @param colliders Colliders to suppress, missing ones are skipped
     * @param target The volume they must pass through
     * @param duration Seconds until the record expires
     * @return Record id, or INVALID_RECORD when no pair could be suppressed
     */
    RecordID ignore(std::span<const ColliderID> colliders, ColliderID target, float duration);

    /**
     * @brief Pushes a ragdoll clear of the target volume.
     *
     * The push direction points from the closest point on target towards the
     * ragdoll root. When the two coincide the ragdoll's source forward plus a
     * small up bias is used. The ragdoll is translated by distance along that
     * direction and every part gets a velocity change of nudgeImpulse.
     *
     * @return false when the instance is destroyed or the target is missing
     */
    bool nudgeAway(RagdollInstance& instance, ColliderID target, float distance);

    /**
     * @brief Expires every active record now
     */
    void restoreAll();

    size_t activeRecordCount() const { return m_records.size(); }
    bool isSuppressed(ColliderID collider, ColliderID target) const;

    float getNudgeImpulse() const { return m_nudgeImpulse; }
    void setNudgeImpulse(float impulse) { m_nudgeImpulse = impulse; }

private:
    using ColliderPair = std::pair<ColliderID, ColliderID>;

    struct SuppressionRecord {
        std::vector<ColliderID> colliders;
        ColliderID target{INVALID_COLLIDER};
        double expiresAt{0.0};
    };

    static ColliderPair makePair(ColliderID a, ColliderID b) {
        return a < b ? ColliderPair{a, b} : ColliderPair{b, a};
    }

    void expire(RecordID id);
    void releasePair(ColliderID collider, ColliderID target);

    PhysicsWorld& m_world;
    TaskScheduler& m_scheduler;
    float m_nudgeImpulse;

    boost::container::flat_map<RecordID, SuppressionRecord> m_records;
    boost::container::flat_map<ColliderPair, uint32_t> m_pairRefCounts;
    RecordID m_nextRecordId{1};

    // Scheduled expiries are bound to this token and dropped once it is gone
    std::shared_ptr<int> m_lifetime{std::make_shared<int>(0)};
};

} // namespace Ragfall

#endif // COLLISION_SUPPRESSION_MANAGER_HPP
