/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "camera/CameraFocusConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"

namespace Ragfall {

CameraFocusConfig CameraFocusConfig::fromSettings(const SettingsManager& settings,
                                                  const std::string& category) {
    CameraFocusConfig config;
    config.fallVelocityThreshold =
        settings.get<float>(category, "fall_velocity_threshold", config.fallVelocityThreshold);
    config.pitSearchRadius = settings.get<float>(category, "pit_search_radius", config.pitSearchRadius);
    config.deathAnchorHeightOffset =
        settings.get<float>(category, "death_anchor_height_offset", config.deathAnchorHeightOffset);
    config.nonFallAnchorHeightOffset = settings.get<float>(
        category, "non_fall_anchor_height_offset", config.nonFallAnchorHeightOffset);
    config.nearPriority = settings.get<int>(category, "near_priority", config.nearPriority);
    config.farPriority = settings.get<int>(category, "far_priority", config.farPriority);

    const std::string mode = settings.get<std::string>(category, "switching_mode", "priority");
    if (mode == "exclusive") {
        config.switchingMode = SwitchingMode::Exclusive;
    } else if (mode != "priority") {
        CAMERA_FOCUS_WARN("Unknown switching_mode '" + mode + "', using priority");
    }

    if (!config.isValid()) {
        CAMERA_FOCUS_WARN("Invalid camera settings in '" + category + "', using defaults");
        return CameraFocusConfig{};
    }
    return config;
}

} // namespace Ragfall
