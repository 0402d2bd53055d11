/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Actor.hpp"
#include "core/Logger.hpp"
#include "physics/PhysicsWorld.hpp"

#include <format>
#include <memory>
#include <utility>

namespace Ragfall {

Actor::Actor(PhysicsWorld &world, std::string name, const Pose &spawnPose,
             const Vector3D &halfSize)
    : m_world(world), m_name(std::move(name)),
      m_orientation(spawnPose.orientation) {
  m_body = m_world.createBody(spawnPose.position, BodyType::DYNAMIC,
                              ClassificationTag::Player,
                              CollisionLayer::Layer_Player);
  m_collider = m_world.createCollider(m_body, AABB(Vector3D(), halfSize));
  m_root = std::make_shared<SceneNode>(m_name, spawnPose);
  m_eye = std::make_shared<SceneNode>(m_name + "Eye");
  syncNodes();
}

Actor::~Actor() {
  if (m_world.destroyBody(m_body) != PhysicsResult::Ok) {
    ACTOR_DEBUG(std::format("{}: body {} already gone", m_name, m_body));
  }
}

void Actor::update(float deltaTime) {
  if (!m_locomotionEnabled || isBodyFrozen()) {
    return;
  }
  const BodyState *body = m_world.getBody(m_body);
  if (!body) {
    return;
  }
  if (m_world.translate(m_body, body->velocity * deltaTime) == PhysicsResult::Ok) {
    syncNodes();
  }
}

Pose Actor::getPose() const {
  const BodyState *body = m_world.getBody(m_body);
  return Pose(body ? body->position : m_root->getPosition(), m_orientation);
}

void Actor::setPose(const Pose &pose) {
  m_orientation = pose.orientation;
  PhysicsResult result = m_world.setPosition(m_body, pose.position);
  if (result != PhysicsResult::Ok) {
    ACTOR_WARN(std::format("{}: setPose failed ({})", m_name, toString(result)));
  }
  m_root->setPose(pose);
  syncNodes();
}

Vector3D Actor::getVelocity() const {
  const BodyState *body = m_world.getBody(m_body);
  return body ? body->velocity : Vector3D();
}

void Actor::setVelocity(const Vector3D &velocity) {
  PhysicsResult result = m_world.setVelocity(m_body, velocity);
  if (result != PhysicsResult::Ok) {
    ACTOR_WARN(std::format("{}: setVelocity failed ({})", m_name, toString(result)));
  }
}

void Actor::setBodyFrozen(bool frozen) {
  PhysicsResult result = m_world.setKinematic(m_body, frozen);
  if (result != PhysicsResult::Ok) {
    ACTOR_WARN(std::format("{}: freeze={} failed ({})", m_name, frozen, toString(result)));
  }
}

bool Actor::isBodyFrozen() const {
  const BodyState *body = m_world.getBody(m_body);
  return body && body->isKinematic();
}

void Actor::syncNodes() {
  Pose pose = getPose();
  m_root->setPose(pose);
  m_eye->setPose(pose.raised(DEFAULT_EYE_HEIGHT));
}

} // namespace Ragfall
