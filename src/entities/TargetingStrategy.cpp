/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/TargetingStrategy.hpp"
#include "entities/Enemy.hpp"
#include "utils/Vector2D.hpp"

namespace Bulwark {

namespace {

// Larger score wins; minimising strategies negate their metric
float score(TargetingStrategy strategy, const Enemy& enemy, const Vector2D& origin) {
    switch (strategy) {
        case TargetingStrategy::Closest:
            return -Vector2D::distanceSquared(origin, enemy.getPosition());
        case TargetingStrategy::Furthest:
            return Vector2D::distanceSquared(origin, enemy.getPosition());
        case TargetingStrategy::Weakest:
            return -enemy.getHealth();
        case TargetingStrategy::Strongest:
            return enemy.getHealth();
        case TargetingStrategy::PathProgress:
            // Distance walked orders enemies exactly like progressFraction()
            // and also separates enemies on the same segment
            return enemy.getDistanceTraveled();
    }
    return 0.0f;
}

} // namespace

const char* toString(TargetingStrategy strategy) {
    switch (strategy) {
        case TargetingStrategy::Closest: return "closest";
        case TargetingStrategy::Furthest: return "furthest";
        case TargetingStrategy::Weakest: return "weakest";
        case TargetingStrategy::Strongest: return "strongest";
        case TargetingStrategy::PathProgress: return "pathProgress";
    }
    return "unknown";
}

std::optional<TargetingStrategy> targetingStrategyFromString(std::string_view name) {
    for (auto strategy : {TargetingStrategy::Closest, TargetingStrategy::Furthest,
                          TargetingStrategy::Weakest, TargetingStrategy::Strongest,
                          TargetingStrategy::PathProgress}) {
        if (name == toString(strategy)) {
            return strategy;
        }
    }
    return std::nullopt;
}

bool isTargetable(const Enemy& enemy, const Vector2D& origin, float range) {
    if (!enemy.isActive()) {
        return false;
    }
    return Vector2D::distanceSquared(origin, enemy.getPosition()) <= range * range;
}

const Enemy* selectTarget(TargetingStrategy strategy,
                          const Vector2D& origin,
                          float range,
                          const std::vector<std::unique_ptr<Enemy>>& enemies) {
    const Enemy* best = nullptr;
    float bestScore = 0.0f;

    for (const auto& enemy : enemies) {
        if (!isTargetable(*enemy, origin, range)) {
            continue;
        }
        float candidate = score(strategy, *enemy, origin);
        if (best == nullptr || candidate > bestScore) {
            best = enemy.get();
            bestScore = candidate;
        }
    }
    return best;
}

} // namespace Bulwark
