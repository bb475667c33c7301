/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

#include "utils/Vector2D.hpp"

namespace Bulwark {

/**
 * @brief Axis-aligned hit box for projectile/enemy contact.
 *
 * Stored as min/max corners in world units. Entity sizes are diameters, so
 * fromCenterSize() spans size/2 on every side of the position.
 */
struct AABB {
    float minX{0.0f};
    float minY{0.0f};
    float maxX{0.0f};
    float maxY{0.0f};

    AABB() = default;
    AABB(float cx, float cy, float hw, float hh)
        : minX(cx - hw), minY(cy - hh), maxX(cx + hw), maxY(cy + hh) {}

    static AABB fromCenterSize(const Vector2D& position, float size) {
        const float half = size * 0.5f;
        return AABB(position.getX(), position.getY(), half, half);
    }

    float left() const { return minX; }
    float right() const { return maxX; }
    float top() const { return minY; }
    float bottom() const { return maxY; }
    Vector2D center() const { return Vector2D((minX + maxX) * 0.5f, (minY + maxY) * 0.5f); }

    // Open-interval overlap: boxes that only share an edge do not intersect
    bool intersects(const AABB& other) const;
    // Closed: points on the border count as inside
    bool contains(const Vector2D& p) const;

    // Same box grown by 'margin' on every side
    AABB expanded(float margin) const {
        AABB grown = *this;
        grown.minX -= margin;
        grown.minY -= margin;
        grown.maxX += margin;
        grown.maxY += margin;
        return grown;
    }

    // Slab test: true if the segment passes through the open interior.
    // A zero-length segment degenerates to a strict point-inside test.
    bool intersectsSegment(const Vector2D& from, const Vector2D& to) const;
};

} // namespace Bulwark

#endif // AABB_HPP
