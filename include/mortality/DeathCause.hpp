/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DEATH_CAUSE_HPP
#define DEATH_CAUSE_HPP

#include <cstdint>

namespace Ragfall {

enum class DeathCause : uint8_t {
    Generic,    // Damage, spikes, scripted deaths
    ForcedFall  // Fell into a pit or off the world
};

inline const char* toString(DeathCause cause) {
    switch (cause) {
    case DeathCause::Generic:
        return "Generic";
    case DeathCause::ForcedFall:
        return "ForcedFall";
    default:
        return "Unknown";
    }
}

} // namespace Ragfall

#endif // DEATH_CAUSE_HPP
