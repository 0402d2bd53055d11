/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VIEWPOINT_HPP
#define VIEWPOINT_HPP

#include "scene/SceneNode.hpp"

#include <memory>
#include <string>
#include <utility>

namespace Ragfall {

/**
 * @brief A virtual camera the rig can blend to.
 *
 * Among enabled viewpoints the one with the highest priority is live.
 * Targets are weak so a destroyed node simply stops being tracked.
 */
struct Viewpoint {
    std::string name;
    int priority{0};
    bool enabled{true};
    SceneNodeWeakPtr follow;
    SceneNodeWeakPtr lookAt;

    explicit Viewpoint(std::string viewName, int initialPriority = 0)
        : name(std::move(viewName)), priority(initialPriority) {}

    SceneNodePtr getFollow() const { return follow.lock(); }
    SceneNodePtr getLookAt() const { return lookAt.lock(); }
};

using ViewpointPtr = std::shared_ptr<Viewpoint>;

} // namespace Ragfall

#endif // VIEWPOINT_HPP
