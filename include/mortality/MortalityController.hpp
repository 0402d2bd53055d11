/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MORTALITY_CONTROLLER_HPP
#define MORTALITY_CONTROLLER_HPP

#include "collisions/CollisionBody.hpp"
#include "mortality/DeathCause.hpp"
#include "mortality/MortalityConfig.hpp"
#include "mortality/MortalityNotifier.hpp"
#include "utils/Pose.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace Ragfall {

class Actor;
class CollisionSuppressionManager;
class DeathFocusListener;
class RagdollHandoffController;
class RagdollInstance;
class TaskScheduler;

enum class MortalityState : uint8_t {
  Alive,
  Dying, // only inside die()
  Dead
};

/**
 * @brief Owns an actor's health and drives its death and respawn.
 *
 * Death is idempotent: while the actor is dying or dead every further die()
 * is logged and ignored, so simultaneous triggers (a pit volume and lethal
 * damage in the same frame) produce a single ragdoll and a single Death
 * notification.
 *
 * die() sequence:
 * 1. mark dead, disable locomotion and interaction
 * 2. spawn the ragdoll from the actor's pose and velocity
 * 3. hide the actor (ragdoll spawned) and freeze its body
 * 4. notify Death handlers synchronously
 * 5. hand the ragdoll to the death focus listener
 * 6. schedule respawn or scene reload after respawnDelay
 *
 * Collaborators are borrowed; they must outlive the controller. Scheduled
 * work is bound to the controller's lifetime and is dropped once it is gone.
 */
class MortalityController {
public:
  using SceneReloader = std::function<void()>;

  MortalityController(Actor &actor, RagdollHandoffController &ragdolls,
                      CollisionSuppressionManager &suppression,
                      TaskScheduler &scheduler,
                      const MortalityConfig &config = MortalityConfig{});
  ~MortalityController();

  MortalityController(const MortalityController &) = delete;
  MortalityController &operator=(const MortalityController &) = delete;

  // Wiring
  void setDeathFocusListener(DeathFocusListener *listener) { m_focusListener = listener; }
  DeathFocusListener *getDeathFocusListener() const { return m_focusListener; }
  void setSceneReloader(SceneReloader reloader) { m_sceneReloader = std::move(reloader); }

  /**
   * @brief Reduces health, dying at zero. Non-positive amounts are ignored.
   */
  void applyDamage(int amount);

  /**
   * @brief Kills the actor. Ignored while already dying or dead.
   * @param cause ForcedFall always selects the fall camera anchor; Generic
   *        deaths are still treated as falls when the actor is dropping fast
   *        or has fallen well below its respawn anchor
   */
  void die(DeathCause cause = DeathCause::Generic);

  /**
   * @brief Calls die() after delay seconds unless the actor died in between.
   * Ignored while the actor is already dead.
   */
  void scheduleDeath(float delay, DeathCause cause = DeathCause::Generic);

  /**
   * @brief Restores the actor at its respawn anchor
   * @return false when the actor is not dead
   */
  bool respawn();

  /**
   * @brief Raises health up to the maximum. Ignored while dead.
   */
  void heal(int amount);

  /**
   * @brief Keeps the ragdoll from colliding with volume for a while.
   *
   * The ragdoll is also nudged clear of the volume. Requests that arrive
   * before a ragdoll exists are retried once per tick for up to
   * suppressionRetryFrames ticks, then dropped.
   *
   * @param duration Seconds, values <= 0 use ragdollIgnoreDuration
   */
  void suppressRagdollCollisionWith(ColliderID volume, float duration = 0.0f);

  MortalityNotifier::HandlerToken registerHandler(MortalityEventType type,
                                                  MortalityNotifier::Handler handler) {
    return m_notifier.registerHandler(type, std::move(handler));
  }
  bool removeHandler(const MortalityNotifier::HandlerToken &token) {
    return m_notifier.removeHandler(token);
  }

  /**
   * @brief Fall classification used for the camera anchor
   */
  bool isFallDeath(DeathCause cause, const Pose &pose, const Vector3D &velocity) const;

  int getCurrentHealth() const { return m_currentHealth; }
  int getMaxHealth() const { return m_config.maxHealth; }
  bool isDead() const { return m_state != MortalityState::Alive; }
  MortalityState getState() const { return m_state; }
  uint64_t getDeathCount() const { return m_deathCount; }

  std::weak_ptr<RagdollInstance> getRagdoll() const { return m_ragdoll; }
  bool hasRagdoll() const { return m_ragdoll != nullptr; }

  const Pose &getRespawnAnchor() const { return m_respawnAnchor; }
  void setRespawnAnchor(const Pose &anchor) { m_respawnAnchor = anchor; }

  size_t pendingSuppressionRequests() const { return m_pendingSuppressions.size(); }
  const MortalityConfig &getConfig() const { return m_config; }

private:
  struct PendingSuppression {
    ColliderID volume{INVALID_COLLIDER};
    float duration{0.0f};
    int attemptsLeft{0};
  };

  void applySuppression(ColliderID volume, float duration);
  void scheduleSuppressionRetry();
  void retryPendingSuppressions();
  void onRespawnTimer(uint64_t deathCount);

  Actor &m_actor;
  RagdollHandoffController &m_ragdolls;
  CollisionSuppressionManager &m_suppression;
  TaskScheduler &m_scheduler;
  MortalityConfig m_config;

  DeathFocusListener *m_focusListener{nullptr};
  SceneReloader m_sceneReloader;
  MortalityNotifier m_notifier;

  int m_currentHealth{0};
  MortalityState m_state{MortalityState::Alive};
  uint64_t m_deathCount{0}; // one life-cycle per death
  Pose m_respawnAnchor;

  std::shared_ptr<RagdollInstance> m_ragdoll;
  std::vector<PendingSuppression> m_pendingSuppressions;
  bool m_retryScheduled{false};

  std::shared_ptr<int> m_lifetime{std::make_shared<int>(0)};
};

} // namespace Ragfall

#endif // MORTALITY_CONTROLLER_HPP
