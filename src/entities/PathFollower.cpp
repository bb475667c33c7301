/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/PathFollower.hpp"
#include <algorithm>
#include <cassert>

namespace Bulwark {

PathFollower::PathFollower(std::shared_ptr<const WaypointPath> path) {
    reset(std::move(path));
}

void PathFollower::reset(std::shared_ptr<const WaypointPath> path) {
    m_path = std::move(path);
    m_pathIndex = 0;
    m_distanceOnSegment = 0.0f;
}

void PathFollower::advance(float speed, float deltaTime) {
    if (!m_path || speed <= 0.0f || deltaTime <= 0.0f) {
        return;
    }

    const size_t lastIndex = m_path->lastIndex();
    float remaining = speed * deltaTime;

    while (remaining > 0.0f && m_pathIndex < lastIndex) {
        float toNext = m_path->segmentLength(m_pathIndex) - m_distanceOnSegment;
        if (remaining >= toNext) {
            remaining -= toNext;
            ++m_pathIndex;
            m_distanceOnSegment = 0.0f;
        } else {
            m_distanceOnSegment += remaining;
            remaining = 0.0f;
        }
    }

    skipEmptySegments();
    assert(m_pathIndex <= lastIndex);
}

void PathFollower::skipEmptySegments() {
    const size_t lastIndex = m_path->lastIndex();
    while (m_pathIndex < lastIndex && m_distanceOnSegment == 0.0f &&
           m_path->segmentLength(m_pathIndex) <= 0.0f) {
        ++m_pathIndex;
    }
}

Vector2D PathFollower::position() const {
    if (!m_path) {
        return Vector2D();
    }
    if (m_pathIndex >= m_path->lastIndex()) {
        return m_path->point(m_path->lastIndex());
    }
    return Vector2D::lerp(m_path->point(m_pathIndex),
                          m_path->point(m_pathIndex + 1),
                          segmentProgress());
}

Vector2D PathFollower::heading() const {
    if (!m_path) {
        return Vector2D();
    }
    size_t from = std::min(m_pathIndex, m_path->lastIndex() - 1);
    return Vector2D::direction(m_path->point(from), m_path->point(from + 1));
}

float PathFollower::progressFraction() const {
    if (!m_path) {
        return 0.0f;
    }
    return static_cast<float>(m_pathIndex) / static_cast<float>(m_path->lastIndex());
}

float PathFollower::pathCompletion() const {
    if (!m_path) {
        return 0.0f;
    }
    if (hasReachedEnd()) {
        return 1.0f;
    }
    float total = m_path->totalLength();
    return total > 0.0f ? distanceTraveled() / total : 0.0f;
}

bool PathFollower::hasReachedEnd() const {
    return m_path != nullptr && m_pathIndex >= m_path->lastIndex();
}

float PathFollower::segmentProgress() const {
    if (!m_path || m_pathIndex >= m_path->lastIndex()) {
        return 0.0f;
    }
    float length = m_path->segmentLength(m_pathIndex);
    return length > 0.0f ? m_distanceOnSegment / length : 0.0f;
}

float PathFollower::distanceTraveled() const {
    if (!m_path) {
        return 0.0f;
    }
    return m_path->lengthUpTo(m_pathIndex) + m_distanceOnSegment;
}

float PathFollower::totalPathLength() const {
    return m_path ? m_path->totalLength() : 0.0f;
}

} // namespace Bulwark
