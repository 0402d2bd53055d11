/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SCENE_NODE_HPP
#define SCENE_NODE_HPP

#include "utils/Pose.hpp"

#include <memory>
#include <string>
#include <utility>

namespace Ragfall {

/**
 * @brief Named transform that viewpoints can follow or look at.
 *
 * Nodes are shared; observers hold them weakly so a destroyed node simply
 * stops being a target.
 */
class SceneNode {
public:
    explicit SceneNode(std::string name, const Pose& pose = Pose{})
        : m_name(std::move(name)), m_pose(pose) {}

    const std::string& getName() const { return m_name; }

    const Pose& getPose() const { return m_pose; }
    void setPose(const Pose& pose) { m_pose = pose; }

    const Vector3D& getPosition() const { return m_pose.position; }
    void setPosition(const Vector3D& position) { m_pose.position = position; }
    void translate(const Vector3D& delta) { m_pose.position += delta; }

private:
    std::string m_name;
    Pose m_pose;
};

using SceneNodePtr = std::shared_ptr<SceneNode>;
using SceneNodeWeakPtr = std::weak_ptr<SceneNode>;

} // namespace Ragfall

#endif // SCENE_NODE_HPP
