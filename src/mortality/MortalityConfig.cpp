/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "mortality/MortalityConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"

namespace Ragfall {

MortalityConfig MortalityConfig::fromSettings(const SettingsManager& settings,
                                              const std::string& category) {
    MortalityConfig config;
    config.maxHealth = settings.get<int>(category, "max_health", config.maxHealth);
    config.respawnDelay = settings.get<float>(category, "respawn_delay", config.respawnDelay);
    config.reloadSceneOnDeath =
        settings.get<bool>(category, "reload_scene_on_death", config.reloadSceneOnDeath);
    config.useRespawnPosition =
        settings.get<bool>(category, "use_respawn_position", config.useRespawnPosition);
    config.respawnPosition = Vector3D(settings.get<float>(category, "respawn_position_x", 0.0f),
                                      settings.get<float>(category, "respawn_position_y", 0.0f),
                                      settings.get<float>(category, "respawn_position_z", 0.0f));
    config.hideEntityOnRagdoll =
        settings.get<bool>(category, "hide_entity_on_ragdoll", config.hideEntityOnRagdoll);
    config.fallVelocityThreshold =
        settings.get<float>(category, "fall_velocity_threshold", config.fallVelocityThreshold);
    config.fallHeightThreshold =
        settings.get<float>(category, "fall_height_threshold", config.fallHeightThreshold);
    config.ragdollIgnoreDuration =
        settings.get<float>(category, "ragdoll_ignore_duration", config.ragdollIgnoreDuration);
    config.suppressionRetryFrames =
        settings.get<int>(category, "suppression_retry_frames", config.suppressionRetryFrames);
    config.nudgeDistance = settings.get<float>(category, "nudge_distance", config.nudgeDistance);
    config.nudgeImpulse = settings.get<float>(category, "nudge_impulse", config.nudgeImpulse);

    if (!config.isValid()) {
        MORTALITY_WARN("Invalid mortality settings in '" + category + "', using defaults");
        return MortalityConfig{};
    }
    return config;
}

} // namespace Ragfall
