/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DEATH_FOCUS_LISTENER_HPP
#define DEATH_FOCUS_LISTENER_HPP

#include "utils/Pose.hpp"

#include <memory>

namespace Ragfall {

class RagdollInstance;

/**
 * @brief Receives the freshly spawned ragdoll right after the death notification
 */
class DeathFocusListener {
public:
    virtual ~DeathFocusListener() = default;

    virtual void focusOnRagdoll(const std::shared_ptr<RagdollInstance>& ragdoll,
                                const Pose& deathPose, bool isFallDeath) = 0;
};

} // namespace Ragfall

#endif // DEATH_FOCUS_LISTENER_HPP
