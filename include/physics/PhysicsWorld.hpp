/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHYSICS_WORLD_HPP
#define PHYSICS_WORLD_HPP

#include "collisions/AABB.hpp"
#include "collisions/CollisionBody.hpp"
#include "utils/Vector3D.hpp"

#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

namespace Ragfall {

/**
 * @brief Outcome of a body or collider mutation.
 *
 * Mutations never throw. Callers check the result and log a failure,
 * so acting on a destroyed object is a visible no-op rather than a fault.
 */
enum class PhysicsResult : uint8_t {
    Ok = 0,
    MissingBody,
    MissingCollider
};

const char* toString(PhysicsResult result);

struct BodyState {
    BodyID id{INVALID_BODY};
    Vector3D position{};
    Vector3D velocity{};
    BodyType type{BodyType::DYNAMIC};
    CollisionDetection detection{CollisionDetection::Discrete};
    ClassificationTag tag{ClassificationTag::Untagged};
    uint32_t layer{CollisionLayer::Layer_Default};

    bool isKinematic() const { return type == BodyType::KINEMATIC; }
};

struct ColliderState {
    ColliderID id{INVALID_COLLIDER};
    BodyID owner{INVALID_BODY}; // INVALID_BODY for free-standing volumes
    AABB bounds{};              // body-local when owned, world space otherwise
    bool enabled{true};
    bool isTrigger{false};
    ClassificationTag tag{ClassificationTag::Untagged};
};

/**
 * @brief Registry of bodies and colliders.
 *
 * Holds only the state the mortality subsystem manipulates: kinematic and
 * continuous-detection flags, velocity, position, classification tags,
 * collider enable flags and pairwise ignore rules. It does not integrate
 * motion or resolve contacts.
 */
class PhysicsWorld {
public:
    PhysicsWorld() = default;
    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;

    // Bodies
    BodyID createBody(const Vector3D& position, BodyType type,
                      ClassificationTag tag = ClassificationTag::Untagged,
                      uint32_t layer = CollisionLayer::Layer_Default);
    /**
     * @brief Destroys a body together with every collider attached to it
     */
    PhysicsResult destroyBody(BodyID id);
    bool hasBody(BodyID id) const { return m_bodies.contains(id); }
    const BodyState* getBody(BodyID id) const;

    PhysicsResult setBodyType(BodyID id, BodyType type);
    PhysicsResult setKinematic(BodyID id, bool kinematic);
    PhysicsResult setCollisionDetection(BodyID id, CollisionDetection mode);
    PhysicsResult setTag(BodyID id, ClassificationTag tag);
    PhysicsResult setPosition(BodyID id, const Vector3D& position);
    PhysicsResult translate(BodyID id, const Vector3D& delta);
    PhysicsResult setVelocity(BodyID id, const Vector3D& velocity);
    /**
     * @brief Adds an instantaneous, mass-independent change in velocity.
     *
     * Kinematic bodies are unaffected; the call still succeeds.
     */
    PhysicsResult addVelocityChange(BodyID id, const Vector3D& deltaV);

    // Colliders
    ColliderID createCollider(BodyID owner, const AABB& localBounds,
                              bool enabled = true, bool isTrigger = false);
    ColliderID createVolume(const AABB& worldBounds, bool isTrigger,
                            ClassificationTag tag = ClassificationTag::Untagged);
    /**
     * @brief Destroys a collider and forgets every ignore rule that names it
     */
    PhysicsResult destroyCollider(ColliderID id);
    bool hasCollider(ColliderID id) const { return m_colliders.contains(id); }
    const ColliderState* getCollider(ColliderID id) const;

    PhysicsResult setColliderEnabled(ColliderID id, bool enabled);
    PhysicsResult setColliderTag(ColliderID id, ClassificationTag tag);

    /**
     * @brief Adds or removes a pairwise ignore rule
     * @return MissingCollider when either side does not exist
     */
    PhysicsResult setIgnoreCollision(ColliderID a, ColliderID b, bool ignore);
    bool isIgnoring(ColliderID a, ColliderID b) const;

    /**
     * @brief True when both colliders exist, are enabled, belong to different
     *        bodies and no ignore rule covers the pair
     */
    bool canCollide(ColliderID a, ColliderID b) const;
    bool overlaps(ColliderID a, ColliderID b) const;

    std::optional<AABB> worldBounds(ColliderID id) const;
    std::optional<Vector3D> closestPointOn(ColliderID id, const Vector3D& point) const;

    size_t getBodyCount() const { return m_bodies.size(); }
    size_t getColliderCount() const { return m_colliders.size(); }
    size_t getIgnoredPairCount() const { return m_ignoredPairs.size(); }

    void clear();

private:
    using ColliderPair = std::pair<ColliderID, ColliderID>;

    static ColliderPair makePair(ColliderID a, ColliderID b) {
        return a < b ? ColliderPair{a, b} : ColliderPair{b, a};
    }

    BodyState* findBody(BodyID id);
    ColliderState* findCollider(ColliderID id);

    boost::container::flat_map<BodyID, BodyState> m_bodies;
    boost::container::flat_map<ColliderID, ColliderState> m_colliders;
    boost::container::flat_set<ColliderPair> m_ignoredPairs;

    BodyID m_nextBodyId{1};
    ColliderID m_nextColliderId{1};
};

} // namespace Ragfall

#endif // PHYSICS_WORLD_HPP
