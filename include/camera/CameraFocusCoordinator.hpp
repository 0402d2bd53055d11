/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CAMERA_FOCUS_COORDINATOR_HPP
#define CAMERA_FOCUS_COORDINATOR_HPP

#include "camera/CameraFocusConfig.hpp"
#include "camera/Viewpoint.hpp"
#include "mortality/DeathFocusListener.hpp"
#include "mortality/MortalityNotifier.hpp"
#include "scene/SceneNode.hpp"
#include "utils/Pose.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace Ragfall {

class Actor;
class MortalityController;
class PitRimRegistry;
class RagdollInstance;

enum class ViewMode : uint8_t {
    Near, // first-person style
    Far   // third-person style
};

inline const char* toString(ViewMode mode) {
    return mode == ViewMode::Near ? "Near" : "Far";
}

/**
 * @brief Observable camera state. A focus anchor exists only while Far.
 */
struct ViewState {
    ViewMode mode{ViewMode::Near};
    std::optional<Pose> focusAnchor;

    bool isDeathFocused() const { return mode == ViewMode::Far && focusAnchor.has_value(); }
};

/**
 * @brief Keeps the near and far viewpoints in step with the actor's life.
 *
 * States: Near, Far and Far with death focus. While alive, falling (vertical
 * speed below the threshold and not grounded) switches to Far and landing
 * switches back to Near. Once the actor is dead that detection stops so it
 * cannot fight the death view.
 *
 * On death the far viewpoint is forced live. focusOnRagdoll() then snapshots
 * the viewpoint targets, places a transient "DeathCamAnchor" node and aims
 * the far viewpoint from the anchor at the ragdoll. Respawn removes the
 * anchor, restores the snapshot and returns to Near.
 *
 * The coordinator subscribes itself to the mortality controller on
 * construction and unsubscribes on destruction.
 */
class CameraFocusCoordinator : public DeathFocusListener {
public:
    static constexpr const char* ANCHOR_NAME = "DeathCamAnchor";

    CameraFocusCoordinator(Actor& actor, MortalityController& mortality,
                           const PitRimRegistry& pitRims,
                           const CameraFocusConfig& config = CameraFocusConfig{});
    ~CameraFocusCoordinator() override;

    CameraFocusCoordinator(const CameraFocusCoordinator&) = delete;
    CameraFocusCoordinator& operator=(const CameraFocusCoordinator&) = delete;

    /**
     * @brief Installs the viewpoints, either may be null, and applies Near
     */
    void setViewpoints(ViewpointPtr nearView, ViewpointPtr farView);
    const ViewpointPtr& getNearViewpoint() const { return m_near; }
    const ViewpointPtr& getFarViewpoint() const { return m_far; }

    /**
     * @brief Per-frame fall detection
     */
    void update(float deltaTime);

    void onDeath();
    void onRespawn();

    /**
     * @brief Frames the ragdoll from a context-dependent anchor.
     *
     * Fall deaths use the nearest pit-rim marker within pitSearchRadius,
     * otherwise a point deathAnchorHeightOffset above the death pose.
     * Other deaths use nonFallAnchorHeightOffset. Skipped with a warning
     * when there is no far viewpoint.
     */
    void focusOnRagdoll(const std::shared_ptr<RagdollInstance>& ragdoll,
                        const Pose& deathPose, bool isFallDeath) override;

    Pose computeAnchor(const Pose& deathPose, bool isFallDeath) const;

    const ViewState& getViewState() const { return m_state; }
    ViewMode getMode() const { return m_state.mode; }
    bool isDeathFocused() const { return m_state.isDeathFocused(); }

    /**
     * @brief Highest-priority enabled viewpoint, nullptr when none is live
     */
    Viewpoint* activeViewpoint() const;

    SceneNodePtr getFocusAnchorNode() const { return m_anchorNode; }
    bool hasTargetSnapshot() const { return m_snapshot.has_value(); }
    const CameraFocusConfig& getConfig() const { return m_config; }

private:
    struct TargetSnapshot {
        SceneNodeWeakPtr nearFollow;
        SceneNodeWeakPtr nearLookAt;
        SceneNodeWeakPtr farFollow;
        SceneNodeWeakPtr farLookAt;
    };

    void switchTo(ViewMode mode);
    void applyActivation();

    Actor& m_actor;
    MortalityController& m_mortality;
    const PitRimRegistry& m_pitRims;
    CameraFocusConfig m_config;

    ViewpointPtr m_near;
    ViewpointPtr m_far;
    ViewState m_state;
    std::optional<TargetSnapshot> m_snapshot;
    SceneNodePtr m_anchorNode;

    MortalityNotifier::HandlerToken m_deathToken;
    MortalityNotifier::HandlerToken m_respawnToken;
};

} // namespace Ragfall

#endif // CAMERA_FOCUS_COORDINATOR_HPP
