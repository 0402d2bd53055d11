/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RAGDOLL_TEMPLATE_HPP
#define RAGDOLL_TEMPLATE_HPP

#include "collisions/CollisionBody.hpp"
#include "utils/Vector3D.hpp"

#include <string>
#include <vector>

namespace Ragfall {

struct RagdollPartSpec {
    std::string name;
    Vector3D localOffset; // from the source pose, in its local frame
    Vector3D halfSize;
};

/**
 * @brief Authored ragdoll representation.
 *
 * Describes the instance as it is authored: bodies start kinematic with
 * colliders off and the instance still carries the living entity's tag and
 * animator. The handoff controller converts all of that at spawn time.
 * The first part is the root body.
 */
struct RagdollTemplate {
    std::string name{"Ragdoll"};
    std::vector<RagdollPartSpec> parts;
    ClassificationTag authoredTag{ClassificationTag::Player};
    bool hasAnimator{true};

    bool isValid() const { return !parts.empty(); }

    // Pelvis, torso, head and four limbs
    static RagdollTemplate humanoid() {
        RagdollTemplate t;
        t.name = "HumanoidRagdoll";
        t.parts = {
            {"Pelvis", Vector3D(0.0f, 0.0f, 0.0f), Vector3D(0.18f, 0.12f, 0.12f)},
            {"Torso", Vector3D(0.0f, 0.45f, 0.0f), Vector3D(0.2f, 0.3f, 0.12f)},
            {"Head", Vector3D(0.0f, 0.95f, 0.0f), Vector3D(0.12f, 0.12f, 0.12f)},
            {"LeftArm", Vector3D(-0.35f, 0.5f, 0.0f), Vector3D(0.08f, 0.3f, 0.08f)},
            {"RightArm", Vector3D(0.35f, 0.5f, 0.0f), Vector3D(0.08f, 0.3f, 0.08f)},
            {"LeftLeg", Vector3D(-0.12f, -0.5f, 0.0f), Vector3D(0.09f, 0.4f, 0.09f)},
            {"RightLeg", Vector3D(0.12f, -0.5f, 0.0f), Vector3D(0.09f, 0.4f, 0.09f)},
        };
        return t;
    }
};

} // namespace Ragfall

#endif // RAGDOLL_TEMPLATE_HPP
