/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "mortality/MortalityController.hpp"
#include "collisions/CollisionSuppressionManager.hpp"
#include "core/Logger.hpp"
#include "core/TaskScheduler.hpp"
#include "entities/Actor.hpp"
#include "mortality/DeathFocusListener.hpp"
#include "ragdoll/RagdollHandoffController.hpp"
#include "ragdoll/RagdollInstance.hpp"

#include <algorithm>
#include <exception>
#include <format>

namespace Ragfall {

MortalityController::MortalityController(Actor &actor,
                                         RagdollHandoffController &ragdolls,
                                         CollisionSuppressionManager &suppression,
                                         TaskScheduler &scheduler,
                                         const MortalityConfig &config)
    : m_actor(actor), m_ragdolls(ragdolls), m_suppression(suppression),
      m_scheduler(scheduler), m_config(config) {
  if (!m_config.isValid()) {
    MORTALITY_WARN("Invalid mortality config, using defaults");
    m_config = MortalityConfig{};
  }
  m_currentHealth = m_config.maxHealth;

  const Pose spawnPose = m_actor.getPose();
  m_respawnAnchor = m_config.useRespawnPosition
                        ? Pose(m_config.respawnPosition, spawnPose.orientation)
                        : spawnPose;
}

MortalityController::~MortalityController() {
  if (m_ragdoll) {
    m_ragdolls.teardown(*m_ragdoll);
  }
}

void MortalityController::applyDamage(int amount) {
  if (amount <= 0) {
    MORTALITY_DEBUG(std::format("Ignoring non-positive damage {}", amount));
    return;
  }
  if (m_state != MortalityState::Alive) {
    MORTALITY_DEBUG(std::format("{} is dead, damage ignored", m_actor.getName()));
    return;
  }

  m_currentHealth = std::max(0, m_currentHealth - amount);
  MORTALITY_DEBUG(std::format("{} took {} damage ({}/{})", m_actor.getName(), amount,
                              m_currentHealth, m_config.maxHealth));
  if (m_currentHealth == 0) {
    die(DeathCause::Generic);
  }
}

void MortalityController::heal(int amount) {
  if (amount <= 0 || m_state != MortalityState::Alive) {
    return;
  }
  m_currentHealth = std::min(m_config.maxHealth, m_currentHealth + amount);
}

bool MortalityController::isFallDeath(DeathCause cause, const Pose &pose,
                                      const Vector3D &velocity) const {
  if (cause == DeathCause::ForcedFall) {
    return true;
  }
  if (velocity.getY() < m_config.fallVelocityThreshold) {
    return true;
  }
  return pose.position.getY() <
         m_respawnAnchor.position.getY() - m_config.fallHeightThreshold;
}

void MortalityController::die(DeathCause cause) {
  if (m_state != MortalityState::Alive) {
    MORTALITY_DEBUG(std::format("die({}) ignored, {} is already dead", toString(cause),
                                m_actor.getName()));
    return;
  }

  m_state = MortalityState::Dying;
  ++m_deathCount;

  const Pose deathPose = m_actor.getPose();
  const Vector3D deathVelocity = m_actor.getVelocity();
  const bool fallDeath = isFallDeath(cause, deathPose, deathVelocity);

  m_actor.setLocomotionEnabled(false);
  m_actor.setInteractionEnabled(false);

  m_ragdoll = m_ragdolls.spawn(deathPose, deathVelocity);
  if (m_ragdoll && m_config.hideEntityOnRagdoll) {
    m_actor.setVisible(false);
  }
  m_actor.setBodyFrozen(true);

  m_state = MortalityState::Dead;
  MORTALITY_INFO(std::format("{} died ({}, fall={}, ragdoll={})", m_actor.getName(),
                             toString(cause), fallDeath, m_ragdoll != nullptr));

  m_notifier.notify(MortalityEventType::Death);

  if (m_ragdoll && m_focusListener) {
    try {
      m_focusListener->focusOnRagdoll(m_ragdoll, deathPose, fallDeath);
    } catch (const std::exception &e) {
      MORTALITY_ERROR(std::format("Death focus failed: {}", e.what()));
    } catch (...) {
      MORTALITY_ERROR("Death focus failed with an unknown exception");
    }
  }

  const uint64_t life = m_deathCount;
  m_scheduler.scheduleAfter(
      m_config.respawnDelay, [this, life]() { onRespawnTimer(life); }, m_lifetime);
}

void MortalityController::scheduleDeath(float delay, DeathCause cause) {
  // A dead actor shares its generation with the life that follows the respawn
  if (m_state != MortalityState::Alive) {
    MORTALITY_DEBUG(std::format("scheduleDeath({}) ignored, {} is already dead",
                                toString(cause), m_actor.getName()));
    return;
  }

  const uint64_t life = m_deathCount;
  m_scheduler.scheduleAfter(
      delay,
      [this, life, cause]() {
        if (life != m_deathCount) {
          MORTALITY_DEBUG("Delayed death dropped, actor already died since");
          return;
        }
        die(cause);
      },
      m_lifetime);
}

void MortalityController::onRespawnTimer(uint64_t deathCount) {
  if (m_state != MortalityState::Dead || deathCount != m_deathCount) {
    MORTALITY_DEBUG("Stale respawn timer ignored");
    return;
  }

  if (m_config.reloadSceneOnDeath) {
    if (m_sceneReloader) {
      MORTALITY_INFO("Reloading scene");
      try {
        m_sceneReloader();
        return;
      } catch (const std::exception &e) {
        MORTALITY_ERROR(std::format("Scene reload failed: {}, respawning in place", e.what()));
      } catch (...) {
        MORTALITY_ERROR("Scene reload failed with an unknown exception, respawning in place");
      }
    } else {
      MORTALITY_WARN("No scene reloader wired, respawning in place");
    }
  }

  respawn();
}

bool MortalityController::respawn() {
  if (m_state != MortalityState::Dead) {
    MORTALITY_DEBUG(std::format("respawn() ignored, {} is alive", m_actor.getName()));
    return false;
  }

  m_actor.setPose(m_respawnAnchor);
  m_actor.setVelocity(Vector3D());
  m_currentHealth = m_config.maxHealth;
  m_state = MortalityState::Alive;

  m_actor.setLocomotionEnabled(true);
  m_actor.setInteractionEnabled(true);

  if (m_ragdoll) {
    m_ragdolls.teardown(*m_ragdoll);
    m_ragdoll.reset();
  }
  m_pendingSuppressions.clear();

  m_actor.setVisible(true);
  m_actor.setBodyFrozen(false);

  MORTALITY_INFO(std::format("{} respawned", m_actor.getName()));
  m_notifier.notify(MortalityEventType::Respawn);
  return true;
}

void MortalityController::suppressRagdollCollisionWith(ColliderID volume, float duration) {
  const float effective = duration > 0.0f ? duration : m_config.ragdollIgnoreDuration;

  if (m_ragdoll) {
    applySuppression(volume, effective);
    return;
  }

  if (m_config.suppressionRetryFrames <= 0) {
    MORTALITY_WARN(std::format("No ragdoll to suppress against volume {}", volume));
    return;
  }

  MORTALITY_DEBUG(std::format("No ragdoll yet, buffering suppression against {}", volume));
  m_pendingSuppressions.push_back(
      PendingSuppression{volume, effective, m_config.suppressionRetryFrames});
  scheduleSuppressionRetry();
}

void MortalityController::applySuppression(ColliderID volume, float duration) {
  const auto colliders = m_ragdoll->getColliders();
  if (m_suppression.ignore(colliders, volume, duration) ==
      CollisionSuppressionManager::INVALID_RECORD) {
    return;
  }
  m_suppression.nudgeAway(*m_ragdoll, volume, m_config.nudgeDistance);
}

void MortalityController::scheduleSuppressionRetry() {
  if (m_retryScheduled) {
    return;
  }
  m_retryScheduled = true;
  m_scheduler.scheduleNextTick([this]() { retryPendingSuppressions(); }, m_lifetime);
}

void MortalityController::retryPendingSuppressions() {
  m_retryScheduled = false;

  if (m_ragdoll) {
    auto pending = std::move(m_pendingSuppressions);
    m_pendingSuppressions.clear();
    for (const auto &request : pending) {
      applySuppression(request.volume, request.duration);
    }
    return;
  }

  for (auto &request : m_pendingSuppressions) {
    --request.attemptsLeft;
  }
  std::erase_if(m_pendingSuppressions, [](const PendingSuppression &request) {
    if (request.attemptsLeft > 0) {
      return false;
    }
    MORTALITY_WARN(std::format("Gave up suppressing volume {}: no ragdoll appeared",
                               request.volume));
    return true;
  });

  if (!m_pendingSuppressions.empty()) {
    scheduleSuppressionRetry();
  }
}

} // namespace Ragfall
