/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "camera/CameraFocusCoordinator.hpp"
#include "camera/PitRimRegistry.hpp"
#include "core/Logger.hpp"
#include "entities/Actor.hpp"
#include "mortality/MortalityController.hpp"
#include "ragdoll/RagdollInstance.hpp"

#include <format>
#include <utility>

namespace Ragfall {

CameraFocusCoordinator::CameraFocusCoordinator(Actor& actor, MortalityController& mortality,
                                               const PitRimRegistry& pitRims,
                                               const CameraFocusConfig& config)
    : m_actor(actor), m_mortality(mortality), m_pitRims(pitRims), m_config(config) {
    if (!m_config.isValid()) {
        CAMERA_FOCUS_WARN("Invalid camera focus config, using defaults");
        m_config = CameraFocusConfig{};
    }

    m_deathToken = m_mortality.registerHandler(MortalityEventType::Death, [this]() { onDeath(); });
    m_respawnToken =
        m_mortality.registerHandler(MortalityEventType::Respawn, [this]() { onRespawn(); });
    m_mortality.setDeathFocusListener(this);
}

CameraFocusCoordinator::~CameraFocusCoordinator() {
    m_mortality.removeHandler(m_deathToken);
    m_mortality.removeHandler(m_respawnToken);
    if (m_mortality.getDeathFocusListener() == this) {
        m_mortality.setDeathFocusListener(nullptr);
    }
}

void CameraFocusCoordinator::setViewpoints(ViewpointPtr nearView, ViewpointPtr farView) {
    m_near = std::move(nearView);
    m_far = std::move(farView);
    if (!m_near || !m_far) {
        CAMERA_FOCUS_WARN(std::format("Viewpoint missing (near={}, far={}), using exclusive switching",
                                      m_near != nullptr, m_far != nullptr));
    }
    applyActivation();
}

void CameraFocusCoordinator::update(float /*deltaTime*/) {
    if (m_mortality.isDead()) {
        return;
    }

    const bool grounded = m_actor.isGrounded();
    const bool falling = m_actor.getVelocity().getY() < m_config.fallVelocityThreshold && !grounded;

    if (falling && m_state.mode == ViewMode::Near) {
        CAMERA_FOCUS_DEBUG("Falling, switching to far view");
        switchTo(ViewMode::Far);
    } else if (!falling && grounded && m_state.mode == ViewMode::Far) {
        CAMERA_FOCUS_DEBUG("Landed, switching to near view");
        switchTo(ViewMode::Near);
    }
}

void CameraFocusCoordinator::onDeath() {
    switchTo(ViewMode::Far);
}

void CameraFocusCoordinator::onRespawn() {
    m_anchorNode.reset();
    m_state.focusAnchor.reset();

    if (m_snapshot) {
        if (m_near) {
            m_near->follow = m_snapshot->nearFollow;
            m_near->lookAt = m_snapshot->nearLookAt;
        }
        if (m_far) {
            m_far->follow = m_snapshot->farFollow;
            m_far->lookAt = m_snapshot->farLookAt;
        }
        m_snapshot.reset();
    }

    switchTo(ViewMode::Near);
}

Pose CameraFocusCoordinator::computeAnchor(const Pose& deathPose, bool isFallDeath) const {
    if (!isFallDeath) {
        return Pose(deathPose.position + Vector3D::up() * m_config.nonFallAnchorHeightOffset);
    }

    if (auto marker = m_pitRims.findNearest(deathPose.position, m_config.pitSearchRadius)) {
        return *marker;
    }
    return Pose(deathPose.position + Vector3D::up() * m_config.deathAnchorHeightOffset);
}

void CameraFocusCoordinator::focusOnRagdoll(const std::shared_ptr<RagdollInstance>& ragdoll,
                                            const Pose& deathPose, bool isFallDeath) {
    if (!m_far) {
        CAMERA_FOCUS_WARN("No far viewpoint, skipping death focus");
        return;
    }
    if (!ragdoll) {
        CAMERA_FOCUS_WARN("No ragdoll to focus on");
        return;
    }

    // Only the first focus of a life sees the real targets
    if (!m_snapshot) {
        TargetSnapshot snapshot;
        if (m_near) {
            snapshot.nearFollow = m_near->follow;
            snapshot.nearLookAt = m_near->lookAt;
        }
        snapshot.farFollow = m_far->follow;
        snapshot.farLookAt = m_far->lookAt;
        m_snapshot = std::move(snapshot);
    }

    const Pose anchor = computeAnchor(deathPose, isFallDeath);
    if (!m_anchorNode) {
        m_anchorNode = std::make_shared<SceneNode>(ANCHOR_NAME, anchor);
    } else {
        m_anchorNode->setPose(anchor);
    }

    m_far->follow = m_anchorNode;
    m_far->lookAt = ragdoll->getRoot();
    m_state.focusAnchor = anchor;
    switchTo(ViewMode::Far);

    const Vector3D& p = anchor.position;
    CAMERA_FOCUS_INFO(std::format("Death focus on '{}' from ({:.2f}, {:.2f}, {:.2f}), fall={}",
                                  ragdoll->getName(), p.getX(), p.getY(), p.getZ(), isFallDeath));
}

Viewpoint* CameraFocusCoordinator::activeViewpoint() const {
    Viewpoint* best = nullptr;
    for (const auto& view : {m_near, m_far}) {
        if (view && view->enabled && (!best || view->priority > best->priority)) {
            best = view.get();
        }
    }
    return best;
}

void CameraFocusCoordinator::switchTo(ViewMode mode) {
    if (mode == ViewMode::Near) {
        m_state.focusAnchor.reset();
    }
    m_state.mode = mode;
    applyActivation();
}

void CameraFocusCoordinator::applyActivation() {
    const bool nearLive = m_state.mode == ViewMode::Near;
    const bool usePriority =
        m_config.switchingMode == SwitchingMode::Priority && m_near && m_far;

    if (usePriority) {
        m_near->enabled = true;
        m_far->enabled = true;
        m_near->priority = nearLive ? m_config.activePriority() : m_config.inactivePriority();
        m_far->priority = nearLive ? m_config.inactivePriority() : m_config.activePriority();
        return;
    }

    if (m_near) {
        m_near->enabled = nearLive;
    }
    if (m_far) {
        m_far->enabled = !nearLive;
    }
}

} // namespace Ragfall
