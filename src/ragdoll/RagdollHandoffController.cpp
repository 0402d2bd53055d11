/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ragdoll/RagdollHandoffController.hpp"
#include "core/Logger.hpp"
#include "physics/PhysicsWorld.hpp"

#include <format>
#include <utility>

namespace Ragfall {

RagdollInstance::RagdollInstance(std::string name, const Pose& sourcePose)
    : m_root(std::make_shared<SceneNode>(std::move(name), sourcePose)),
      m_sourcePose(sourcePose) {}

BodyID RagdollInstance::getRootBody() const {
    return m_parts.empty() ? INVALID_BODY : m_parts.front().body;
}

std::vector<ColliderID> RagdollInstance::getColliders() const {
    std::vector<ColliderID> colliders;
    colliders.reserve(m_parts.size());
    for (const auto& part : m_parts) {
        colliders.push_back(part.collider);
    }
    return colliders;
}

size_t RagdollInstance::translate(PhysicsWorld& world, const Vector3D& delta) {
    if (m_destroyed) {
        return 0;
    }

    m_root->translate(delta);
    size_t moved = 0;
    for (const auto& part : m_parts) {
        if (world.translate(part.body, delta) == PhysicsResult::Ok) {
            ++moved;
        }
    }
    return moved;
}

RagdollHandoffController::RagdollHandoffController(PhysicsWorld& world)
    : m_world(world) {}

RagdollHandoffController::RagdollHandoffController(PhysicsWorld& world,
                                                   RagdollTemplate ragdollTemplate)
    : m_world(world) {
    setTemplate(std::move(ragdollTemplate));
}

void RagdollHandoffController::setTemplate(RagdollTemplate ragdollTemplate) {
    if (!ragdollTemplate.isValid()) {
        RAGDOLL_WARN(std::format("Template '{}' has no parts, ignoring", ragdollTemplate.name));
        m_template.reset();
        return;
    }
    m_template = std::move(ragdollTemplate);
}

bool RagdollHandoffController::checked(PhysicsResult result, const char* operation,
                                       const RagdollInstance::Part& part) const {
    if (result != PhysicsResult::Ok) {
        RAGDOLL_ERROR(std::format("{} failed on part '{}': {}", operation, part.name,
                                  toString(result)));
        return false;
    }
    return true;
}

std::shared_ptr<RagdollInstance> RagdollHandoffController::spawn(const Pose& sourcePose,
                                                                 const Vector3D& sourceVelocity) {
    if (!m_template) {
        RAGDOLL_WARN("No ragdoll template configured, entity stays in place");
        return nullptr;
    }

    auto instance = std::make_shared<RagdollInstance>(m_template->name, sourcePose);
    instance->m_tag = m_template->authoredTag;
    instance->m_animatorEnabled = m_template->hasAnimator;

    // Instantiate in the authored state
    for (const auto& spec : m_template->parts) {
        RagdollInstance::Part part;
        part.name = spec.name;
        part.body = m_world.createBody(sourcePose.transformPoint(spec.localOffset),
                                       BodyType::KINEMATIC, m_template->authoredTag,
                                       CollisionLayer::Layer_Ragdoll);
        part.collider = m_world.createCollider(part.body, AABB(Vector3D(), spec.halfSize),
                                               false);
        instance->m_parts.push_back(std::move(part));
    }

    // Handoff
    instance->m_tag = ClassificationTag::Untagged;
    instance->m_animatorEnabled = false;

    size_t failures = 0;
    for (const auto& part : instance->m_parts) {
        bool ok = checked(m_world.setTag(part.body, ClassificationTag::Untagged), "setTag", part) &&
                  checked(m_world.setColliderTag(part.collider, ClassificationTag::Untagged),
                          "setColliderTag", part) &&
                  checked(m_world.setKinematic(part.body, false), "setKinematic", part) &&
                  checked(m_world.setCollisionDetection(part.body, CollisionDetection::Continuous),
                          "setCollisionDetection", part) &&
                  checked(m_world.setColliderEnabled(part.collider, true), "setColliderEnabled",
                          part) &&
                  checked(m_world.setVelocity(part.body, sourceVelocity), "setVelocity", part);
        if (!ok) {
            ++failures;
        }
    }

    ++m_spawnCount;
    RAGDOLL_INFO(std::format("Spawned '{}' with {} parts ({} failed)", instance->getName(),
                             instance->m_parts.size(), failures));
    return instance;
}

void RagdollHandoffController::teardown(RagdollInstance& instance) {
    if (instance.m_destroyed) {
        RAGDOLL_DEBUG(std::format("'{}' already torn down", instance.getName()));
        return;
    }

    for (const auto& part : instance.m_parts) {
        PhysicsResult result = m_world.destroyBody(part.body);
        if (result != PhysicsResult::Ok) {
            RAGDOLL_DEBUG(std::format("Part '{}' already gone ({})", part.name, toString(result)));
        }
    }

    instance.m_parts.clear();
    instance.m_destroyed = true;
    ++m_teardownCount;
    RAGDOLL_INFO(std::format("Tore down '{}'", instance.getName()));
}

} // namespace Ragfall
