/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_FOLLOWER_HPP
#define PATH_FOLLOWER_HPP

#include "entities/WaypointPath.hpp"
#include "utils/Vector2D.hpp"
#include <cstddef>
#include <memory>

namespace Bulwark {

/**
 * @brief Tracks how far an entity has walked along a WaypointPath
 *
 * (pathIndex, distance along the current segment) is the only stored state;
 * world position is always derived from it. pathIndex never decreases and
 * never passes the last waypoint.
 */
class PathFollower {
public:
    PathFollower() = default;
    explicit PathFollower(std::shared_ptr<const WaypointPath> path);

    // Restart at waypoint 0 of the given path
    void reset(std::shared_ptr<const WaypointPath> path);

    /**
     * @brief Moves speed * deltaTime world units forward, crossing as many
     * waypoints as that distance covers. Zero-length segments are crossed
     * without consuming distance.
     */
    void advance(float speed, float deltaTime);

    Vector2D position() const;

    // Unit direction of the segment being walked (last segment once finished)
    Vector2D heading() const;

    // pathIndex / (waypoints - 1): 0 at spawn, 1 at the terminal waypoint
    float progressFraction() const;

    // Continuous counterpart of progressFraction based on distance walked
    float pathCompletion() const;

    bool hasReachedEnd() const;

    size_t pathIndex() const { return m_pathIndex; }

    // Fraction of the current segment already covered, in [0, 1)
    float segmentProgress() const;

    float distanceTraveled() const;
    float totalPathLength() const;

    bool hasPath() const { return m_path != nullptr; }

private:
    void skipEmptySegments();

    std::shared_ptr<const WaypointPath> m_path;
    size_t m_pathIndex{0};
    float m_distanceOnSegment{0.0f};
};

} // namespace Bulwark

#endif // PATH_FOLLOWER_HPP
