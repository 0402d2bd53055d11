/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MORTALITY_CONFIG_HPP
#define MORTALITY_CONFIG_HPP

#include "utils/Vector3D.hpp"

#include <string>

namespace Ragfall {

class SettingsManager;

/**
 * @brief Tunables for the mortality state machine
 */
struct MortalityConfig {
    int maxHealth{100};
    float respawnDelay{2.0f};            // Seconds from death to respawn or reload
    bool reloadSceneOnDeath{true};       // Otherwise respawn in place
    bool useRespawnPosition{false};      // Otherwise the anchor is captured at construction
    Vector3D respawnPosition{};
    bool hideEntityOnRagdoll{true};

    // Automatic fall-death classification
    float fallVelocityThreshold{-5.0f};  // Vertical speed below this is a fall
    float fallHeightThreshold{3.0f};     // Dropping this far below the anchor is a fall

    // Ragdoll collision suppression
    float ragdollIgnoreDuration{1.0f};   // Used when a request passes duration <= 0
    int suppressionRetryFrames{20};      // Ticks to wait for a ragdoll before dropping a request
    float nudgeDistance{0.25f};
    float nudgeImpulse{1.5f};            // Velocity change applied to every part

    bool isValid() const {
        return maxHealth > 0 && respawnDelay >= 0.0f && fallHeightThreshold >= 0.0f &&
               ragdollIgnoreDuration > 0.0f && suppressionRetryFrames >= 0 &&
               nudgeDistance >= 0.0f && nudgeImpulse >= 0.0f;
    }

    /**
     * @brief Reads a config from a settings category, missing keys keep their defaults
     */
    static MortalityConfig fromSettings(const SettingsManager& settings,
                                        const std::string& category = "mortality");
};

} // namespace Ragfall

#endif // MORTALITY_CONFIG_HPP
