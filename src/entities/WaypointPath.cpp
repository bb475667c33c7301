/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/WaypointPath.hpp"
#include <format>
#include <stdexcept>

namespace Bulwark {

WaypointPath::WaypointPath(std::vector<Vector2D> points)
    : m_points(std::move(points))
{
    if (m_points.size() < 2) {
        throw std::invalid_argument(std::format(
            "WaypointPath requires at least 2 waypoints, got {}", m_points.size()));
    }

    m_segmentLengths.reserve(m_points.size() - 1);
    m_cumulative.reserve(m_points.size());
    m_cumulative.push_back(0.0f);

    for (size_t i = 0; i + 1 < m_points.size(); ++i) {
        float length = Vector2D::distance(m_points[i], m_points[i + 1]);
        m_segmentLengths.push_back(length);
        m_cumulative.push_back(m_cumulative.back() + length);
    }
}

} // namespace Bulwark
