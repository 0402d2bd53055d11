/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CAMERA_FOCUS_CONFIG_HPP
#define CAMERA_FOCUS_CONFIG_HPP

#include <cstdint>
#include <string>

namespace Ragfall {

class SettingsManager;

enum class SwitchingMode : uint8_t {
    Priority,  // Both viewpoints stay enabled, the live one gets the higher priority
    Exclusive  // Only the live viewpoint is enabled
};

struct CameraFocusConfig {
    float fallVelocityThreshold{-5.0f};     // Vertical speed below this counts as falling
    float pitSearchRadius{50.0f};           // Pit-rim marker search radius around the death point
    float deathAnchorHeightOffset{6.0f};    // Fall deaths without a marker
    float nonFallAnchorHeightOffset{3.6f};  // Every other death
    SwitchingMode switchingMode{SwitchingMode::Priority};
    int nearPriority{20};
    int farPriority{10};

    bool isValid() const {
        return pitSearchRadius >= 0.0f && deathAnchorHeightOffset >= 0.0f &&
               nonFallAnchorHeightOffset >= 0.0f && nearPriority != farPriority;
    }

    int activePriority() const { return nearPriority > farPriority ? nearPriority : farPriority; }
    int inactivePriority() const { return nearPriority > farPriority ? farPriority : nearPriority; }

    static CameraFocusConfig fromSettings(const SettingsManager& settings,
                                          const std::string& category = "camera");
};

} // namespace Ragfall

#endif // CAMERA_FOCUS_CONFIG_HPP
