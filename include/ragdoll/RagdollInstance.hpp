/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RAGDOLL_INSTANCE_HPP
#define RAGDOLL_INSTANCE_HPP

#include "collisions/CollisionBody.hpp"
#include "scene/SceneNode.hpp"
#include "utils/Pose.hpp"

#include <boost/container/small_vector.hpp>
#include <string>
#include <vector>

namespace Ragfall {

class PhysicsWorld;

/**
 * @brief A spawned ragdoll: a root node plus one body and collider per part.
 *
 * Created and destroyed only by RagdollHandoffController. Other systems hold
 * it through std::weak_ptr and must expect it to disappear at respawn.
 */
class RagdollInstance {
public:
    struct Part {
        std::string name;
        BodyID body{INVALID_BODY};
        ColliderID collider{INVALID_COLLIDER};
    };

    using PartList = boost::container::small_vector<Part, 8>;

    RagdollInstance(std::string name, const Pose& sourcePose);

    const std::string& getName() const { return m_root->getName(); }
    const SceneNodePtr& getRoot() const { return m_root; }
    const PartList& getParts() const { return m_parts; }
    BodyID getRootBody() const;
    std::vector<ColliderID> getColliders() const;

    // Pose of the entity at the moment of handoff
    const Pose& getSourcePose() const { return m_sourcePose; }

    Vector3D getPosition() const { return m_root->getPosition(); }

    ClassificationTag getTag() const { return m_tag; }
    bool isAnimatorEnabled() const { return m_animatorEnabled; }
    bool isDestroyed() const { return m_destroyed; }

    /**
     * @brief Moves the root node and every part body by delta
     * @return Number of part bodies that moved
     */
    size_t translate(PhysicsWorld& world, const Vector3D& delta);

private:
    friend class RagdollHandoffController;

    SceneNodePtr m_root;
    Pose m_sourcePose;
    PartList m_parts;
    ClassificationTag m_tag{ClassificationTag::Untagged};
    bool m_animatorEnabled{false};
    bool m_destroyed{false};
};

} // namespace Ragfall

#endif // RAGDOLL_INSTANCE_HPP
