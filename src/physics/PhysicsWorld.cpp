/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "physics/PhysicsWorld.hpp"
#include "core/Logger.hpp"

#include <format>
#include <vector>

namespace Ragfall {

const char* toString(PhysicsResult result) {
    switch (result) {
    case PhysicsResult::Ok:
        return "Ok";
    case PhysicsResult::MissingBody:
        return "MissingBody";
    case PhysicsResult::MissingCollider:
        return "MissingCollider";
    default:
        return "Unknown";
    }
}

BodyState* PhysicsWorld::findBody(BodyID id) {
    auto it = m_bodies.find(id);
    return it != m_bodies.end() ? &it->second : nullptr;
}

ColliderState* PhysicsWorld::findCollider(ColliderID id) {
    auto it = m_colliders.find(id);
    return it != m_colliders.end() ? &it->second : nullptr;
}

const BodyState* PhysicsWorld::getBody(BodyID id) const {
    auto it = m_bodies.find(id);
    return it != m_bodies.end() ? &it->second : nullptr;
}

const ColliderState* PhysicsWorld::getCollider(ColliderID id) const {
    auto it = m_colliders.find(id);
    return it != m_colliders.end() ? &it->second : nullptr;
}

BodyID PhysicsWorld::createBody(const Vector3D& position, BodyType type,
                                ClassificationTag tag, uint32_t layer) {
    BodyState body;
    body.id = m_nextBodyId++;
    body.position = position;
    body.type = type;
    body.tag = tag;
    body.layer = layer;
    m_bodies.emplace(body.id, body);
    return body.id;
}

PhysicsResult PhysicsWorld::destroyBody(BodyID id) {
    if (!m_bodies.contains(id)) {
        return PhysicsResult::MissingBody;
    }

    std::vector<ColliderID> attached;
    for (const auto& [colliderId, collider] : m_colliders) {
        if (collider.owner == id) {
            attached.push_back(colliderId);
        }
    }
    for (ColliderID colliderId : attached) {
        destroyCollider(colliderId);
    }

    m_bodies.erase(id);
    PHYSICS_DEBUG(std::format("Destroyed body {} ({} colliders)", id, attached.size()));
    return PhysicsResult::Ok;
}

PhysicsResult PhysicsWorld::setBodyType(BodyID id, BodyType type) {
    BodyState* body = findBody(id);
    if (!body) {
        return PhysicsResult::MissingBody;
    }
    body->type = type;
    return PhysicsResult::Ok;
}

PhysicsResult PhysicsWorld::setKinematic(BodyID id, bool kinematic) {
    return setBodyType(id, kinematic ? BodyType::KINEMATIC : BodyType::DYNAMIC);
}

PhysicsResult PhysicsWorld::setCollisionDetection(BodyID id, CollisionDetection mode) {
    BodyState* body = findBody(id);
    if (!body) {
        return PhysicsResult::MissingBody;
    }
    body->detection = mode;
    return PhysicsResult::Ok;
}

PhysicsResult PhysicsWorld::setTag(BodyID id, ClassificationTag tag) {
    BodyState* body = findBody(id);
    if (!body) {
        return PhysicsResult::MissingBody;
    }
    body->tag = tag;
    return PhysicsResult::Ok;
}

PhysicsResult PhysicsWorld::setPosition(BodyID id, const Vector3D& position) {
    BodyState* body = findBody(id);
    if (!body) {
        return PhysicsResult::MissingBody;
    }
    body->position = position;
    return PhysicsResult::Ok;
}

PhysicsResult PhysicsWorld::translate(BodyID id, const Vector3D& delta) {
    BodyState* body = findBody(id);
    if (!body) {
        return PhysicsResult::MissingBody;
    }
    body->position += delta;
    return PhysicsResult::Ok;
}

PhysicsResult PhysicsWorld::setVelocity(BodyID id, const Vector3D& velocity) {
    BodyState* body = findBody(id);
    if (!body) {
        return PhysicsResult::MissingBody;
    }
    body->velocity = velocity;
    return PhysicsResult::Ok;
}

PhysicsResult PhysicsWorld::addVelocityChange(BodyID id, const Vector3D& deltaV) {
    BodyState* body = findBody(id);
    if (!body) {
        return PhysicsResult::MissingBody;
    }
    if (body->type == BodyType::DYNAMIC) {
        body->velocity += deltaV;
    }
    return PhysicsResult::Ok;
}

ColliderID PhysicsWorld::createCollider(BodyID owner, const AABB& localBounds,
                                        bool enabled, bool isTrigger) {
    const BodyState* body = getBody(owner);
    if (!body) {
        PHYSICS_ERROR(std::format("Cannot attach collider to missing body {}", owner));
        return INVALID_COLLIDER;
    }

    ColliderState collider;
    collider.id = m_nextColliderId++;
    collider.owner = owner;
    collider.bounds = localBounds;
    collider.enabled = enabled;
    collider.isTrigger = isTrigger;
    collider.tag = body->tag;
    m_colliders.emplace(collider.id, collider);
    return collider.id;
}

ColliderID PhysicsWorld::createVolume(const AABB& worldBounds, bool isTrigger,
                                      ClassificationTag tag) {
    ColliderState collider;
    collider.id = m_nextColliderId++;
    collider.bounds = worldBounds;
    collider.isTrigger = isTrigger;
    collider.tag = tag;
    m_colliders.emplace(collider.id, collider);
    return collider.id;
}

PhysicsResult PhysicsWorld::destroyCollider(ColliderID id) {
    if (m_colliders.erase(id) == 0) {
        return PhysicsResult::MissingCollider;
    }

    for (auto it = m_ignoredPairs.begin(); it != m_ignoredPairs.end();) {
        if (it->first == id || it->second == id) {
            it = m_ignoredPairs.erase(it);
        } else {
            ++it;
        }
    }
    return PhysicsResult::Ok;
}

PhysicsResult PhysicsWorld::setColliderEnabled(ColliderID id, bool enabled) {
    ColliderState* collider = findCollider(id);
    if (!collider) {
        return PhysicsResult::MissingCollider;
    }
    collider->enabled = enabled;
    return PhysicsResult::Ok;
}

PhysicsResult PhysicsWorld::setColliderTag(ColliderID id, ClassificationTag tag) {
    ColliderState* collider = findCollider(id);
    if (!collider) {
        return PhysicsResult::MissingCollider;
    }
    collider->tag = tag;
    return PhysicsResult::Ok;
}

PhysicsResult PhysicsWorld::setIgnoreCollision(ColliderID a, ColliderID b, bool ignore) {
    if (!hasCollider(a) || !hasCollider(b)) {
        return PhysicsResult::MissingCollider;
    }

    if (ignore) {
        m_ignoredPairs.insert(makePair(a, b));
    } else {
        m_ignoredPairs.erase(makePair(a, b));
    }
    return PhysicsResult::Ok;
}

bool PhysicsWorld::isIgnoring(ColliderID a, ColliderID b) const {
    return m_ignoredPairs.contains(makePair(a, b));
}

bool PhysicsWorld::canCollide(ColliderID a, ColliderID b) const {
    const ColliderState* ca = getCollider(a);
    const ColliderState* cb = getCollider(b);
    if (!ca || !cb || a == b) {
        return false;
    }
    if (!ca->enabled || !cb->enabled) {
        return false;
    }
    if (ca->owner != INVALID_BODY && ca->owner == cb->owner) {
        return false;
    }
    return !isIgnoring(a, b);
}

bool PhysicsWorld::overlaps(ColliderID a, ColliderID b) const {
    if (!canCollide(a, b)) {
        return false;
    }
    auto boundsA = worldBounds(a);
    auto boundsB = worldBounds(b);
    return boundsA && boundsB && boundsA->intersects(*boundsB);
}

std::optional<AABB> PhysicsWorld::worldBounds(ColliderID id) const {
    const ColliderState* collider = getCollider(id);
    if (!collider) {
        return std::nullopt;
    }
    if (collider->owner == INVALID_BODY) {
        return collider->bounds;
    }
    const BodyState* body = getBody(collider->owner);
    if (!body) {
        return std::nullopt;
    }
    return collider->bounds.translated(body->position);
}

std::optional<Vector3D> PhysicsWorld::closestPointOn(ColliderID id, const Vector3D& point) const {
    auto bounds = worldBounds(id);
    if (!bounds) {
        return std::nullopt;
    }
    return bounds->closestPoint(point);
}

void PhysicsWorld::clear() {
    m_ignoredPairs.clear();
    m_colliders.clear();
    m_bodies.clear();
}

} // namespace Ragfall
