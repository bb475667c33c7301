/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"
#include <algorithm>
#include <utility>

namespace Bulwark {

bool AABB::intersects(const AABB& other) const {
    const bool overlapX = minX < other.maxX && other.minX < maxX;
    const bool overlapY = minY < other.maxY && other.minY < maxY;
    return overlapX && overlapY;
}

bool AABB::contains(const Vector2D& p) const {
    const float x = p.getX();
    const float y = p.getY();
    return minX <= x && x <= maxX && minY <= y && y <= maxY;
}

bool AABB::intersectsSegment(const Vector2D& from, const Vector2D& to) const {
    float tEnter = 0.0f;
    float tExit = 1.0f;

    auto clip = [&tEnter, &tExit](float start, float delta, float low, float high) {
        if (delta == 0.0f) {
            return low < start && start < high;
        }
        float t0 = (low - start) / delta;
        float t1 = (high - start) / delta;
        if (t0 > t1) {
            std::swap(t0, t1);
        }
        tEnter = std::max(tEnter, t0);
        tExit = std::min(tExit, t1);
        return tEnter < tExit;
    };

    return clip(from.getX(), to.getX() - from.getX(), minX, maxX) &&
           clip(from.getY(), to.getY() - from.getY(), minY, maxY);
}

} // namespace Bulwark
