/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTOR_HPP
#define ACTOR_HPP

#include "collisions/CollisionBody.hpp"
#include "scene/SceneNode.hpp"
#include "utils/Pose.hpp"
#include "utils/Vector3D.hpp"

#include <string>

namespace Ragfall {

class PhysicsWorld;

/**
 * @brief The controllable, living entity.
 *
 * Owns one main physics body with a single capsule-like box collider, a root
 * node that mirrors the body and an eye node used by the near viewpoint.
 * Input and locomotion live elsewhere; they read the capability flags here
 * before driving the actor.
 */
class Actor {
public:
  static constexpr float DEFAULT_EYE_HEIGHT{1.6f};

  Actor(PhysicsWorld &world, std::string name, const Pose &spawnPose,
        const Vector3D &halfSize = Vector3D(0.4f, 0.9f, 0.4f));
  ~Actor();

  Actor(const Actor &) = delete;
  Actor &operator=(const Actor &) = delete;

  /**
   * @brief Integrates position from the body velocity while the actor can move
   * @param deltaTime Seconds since the previous frame
   */
  void update(float deltaTime);

  const std::string &getName() const { return m_name; }

  Pose getPose() const;
  /**
   * @brief Teleports the actor, body and nodes together
   */
  void setPose(const Pose &pose);

  Vector3D getVelocity() const;
  void setVelocity(const Vector3D &velocity);

  BodyID getBodyId() const { return m_body; }
  ColliderID getColliderId() const { return m_collider; }
  const SceneNodePtr &getRootNode() const { return m_root; }
  const SceneNodePtr &getEyeNode() const { return m_eye; }

  // Capabilities toggled by the mortality state machine
  bool isLocomotionEnabled() const { return m_locomotionEnabled; }
  void setLocomotionEnabled(bool enabled) { m_locomotionEnabled = enabled; }
  bool isInteractionEnabled() const { return m_interactionEnabled; }
  void setInteractionEnabled(bool enabled) { m_interactionEnabled = enabled; }

  bool isVisible() const { return m_visible; }
  void setVisible(bool visible) { m_visible = visible; }

  // Ground contact is reported by the locomotion collaborator
  bool isGrounded() const { return m_grounded; }
  void setGrounded(bool grounded) { m_grounded = grounded; }

  /**
   * @brief Frozen bodies are kinematic and ignore velocity
   */
  void setBodyFrozen(bool frozen);
  bool isBodyFrozen() const;

private:
  void syncNodes();

  PhysicsWorld &m_world;
  std::string m_name;
  BodyID m_body{INVALID_BODY};
  ColliderID m_collider{INVALID_COLLIDER};
  SceneNodePtr m_root;
  SceneNodePtr m_eye;
  Quaternion m_orientation{};
  bool m_locomotionEnabled{true};
  bool m_interactionEnabled{true};
  bool m_visible{true};
  bool m_grounded{true};
};

} // namespace Ragfall

#endif // ACTOR_HPP
