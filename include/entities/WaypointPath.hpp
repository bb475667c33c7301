/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WAYPOINT_PATH_HPP
#define WAYPOINT_PATH_HPP

#include "utils/Vector2D.hpp"
#include <cstddef>
#include <vector>

namespace Bulwark {

/**
 * @brief Immutable polyline enemies walk along, shared by every enemy of a level
 *
 * Segment lengths are computed once. Duplicate consecutive waypoints are
 * allowed and produce zero-length segments.
 */
class WaypointPath {
public:
    /**
     * @throws std::invalid_argument if fewer than two waypoints are given
     */
    explicit WaypointPath(std::vector<Vector2D> points);

    size_t size() const { return m_points.size(); }
    size_t lastIndex() const { return m_points.size() - 1; }
    const Vector2D& point(size_t index) const { return m_points[index]; }
    const std::vector<Vector2D>& points() const { return m_points; }

    // Length of the segment from point(index) to point(index + 1)
    float segmentLength(size_t index) const { return m_segmentLengths[index]; }

    // Path length covered before reaching point(index)
    float lengthUpTo(size_t index) const { return m_cumulative[index]; }

    float totalLength() const { return m_cumulative.back(); }

private:
    std::vector<Vector2D> m_points;
    std::vector<float> m_segmentLengths;
    std::vector<float> m_cumulative;
};

} // namespace Bulwark

#endif // WAYPOINT_PATH_HPP
