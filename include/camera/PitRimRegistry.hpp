/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PIT_RIM_REGISTRY_HPP
#define PIT_RIM_REGISTRY_HPP

#include "utils/Pose.hpp"

#include <boost/container/flat_map.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace Ragfall {

/**
 * @brief Registered pit-rim markers used to frame fall deaths
 */
class PitRimRegistry {
public:
    using MarkerID = uint32_t;
    static constexpr MarkerID INVALID_MARKER = 0;

    MarkerID registerMarker(const Pose& pose);
    bool removeMarker(MarkerID id);
    void clear() { m_markers.clear(); }

    /**
     * @brief Nearest marker within radius of point, boundary included
     *
     * Equidistant markers resolve to the one registered first.
     */
    std::optional<Pose> findNearest(const Vector3D& point, float radius) const;

    size_t size() const { return m_markers.size(); }

private:
    boost::container::flat_map<MarkerID, Pose> m_markers;
    MarkerID m_nextId{1};
};

} // namespace Ragfall

#endif // PIT_RIM_REGISTRY_HPP
