/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_BODY_HPP
#define COLLISION_BODY_HPP

#include <cstdint>

namespace Ragfall {

using BodyID = uint64_t;
using ColliderID = uint64_t;

constexpr BodyID INVALID_BODY = 0;
constexpr ColliderID INVALID_COLLIDER = 0;

// Body type classifications
enum class BodyType : uint8_t {
    STATIC,      // Immovable objects (world geometry, trigger volumes)
    KINEMATIC,   // Script-controlled, ignores forces
    DYNAMIC      // Physics-driven
};

enum class CollisionDetection : uint8_t {
    Discrete,
    Continuous
};

// Labels trigger detectors use to recognise what touched them
enum class ClassificationTag : uint8_t {
    Untagged = 0,
    Player,
    Hazard
};

// Bitmask collision layers (combine via bitwise OR)
enum CollisionLayer : uint32_t {
    Layer_Default     = 1u << 0,
    Layer_Player      = 1u << 1,
    Layer_Ragdoll     = 1u << 2,
    Layer_Environment = 1u << 3,
    Layer_Trigger     = 1u << 4,
};

} // namespace Ragfall

#endif // COLLISION_BODY_HPP
