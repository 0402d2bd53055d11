/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RAGDOLL_HANDOFF_CONTROLLER_HPP
#define RAGDOLL_HANDOFF_CONTROLLER_HPP

#include "physics/PhysicsWorld.hpp"
#include "ragdoll/RagdollInstance.hpp"
#include "ragdoll/RagdollTemplate.hpp"
#include "utils/Pose.hpp"
#include "utils/Vector3D.hpp"

#include <cstddef>
#include <memory>
#include <optional>

namespace Ragfall {

/**
 * @brief Hands a dying entity over to a physics-driven ragdoll.
 *
 * spawn() instantiates the configured template at the entity's last pose and
 * converts it from its authored state:
 * - entity classification tags are cleared on the instance and every part
 * - the animator is disabled
 * - every body becomes dynamic with continuous collision detection
 * - every collider is enabled
 * - every part receives the entity's velocity unchanged
 *
 * Without a template spawn() returns nullptr and logs a warning; the caller
 * keeps the living entity frozen in place instead.
 */
class RagdollHandoffController {
public:
    explicit RagdollHandoffController(PhysicsWorld& world);
    RagdollHandoffController(PhysicsWorld& world, RagdollTemplate ragdollTemplate);

    void setTemplate(RagdollTemplate ragdollTemplate);
    void clearTemplate() { m_template.reset(); }
    bool hasTemplate() const { return m_template.has_value(); }

    std::shared_ptr<RagdollInstance> spawn(const Pose& sourcePose,
                                           const Vector3D& sourceVelocity);

    /**
     * @brief Destroys every body and collider of the instance.
     *
     * Safe to call twice. Restoring the living entity is the caller's job.
     */
    void teardown(RagdollInstance& instance);

    size_t getSpawnCount() const { return m_spawnCount; }
    size_t getTeardownCount() const { return m_teardownCount; }

private:
    bool checked(PhysicsResult result, const char* operation,
                 const RagdollInstance::Part& part) const;

    PhysicsWorld& m_world;
    std::optional<RagdollTemplate> m_template;
    size_t m_spawnCount{0};
    size_t m_teardownCount{0};
};

} // namespace Ragfall

#endif // RAGDOLL_HANDOFF_CONTROLLER_HPP
