/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TARGETING_STRATEGY_HPP
#define TARGETING_STRATEGY_HPP

#include "entities/EntityTypes.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace Bulwark {

class Enemy;
class Vector2D;

/**
 * @brief Rule a tower uses to pick one enemy among those in range
 *
 * Every strategy scans candidates in live-collection (spawn) order and only
 * replaces its pick on a strictly better score, so on ties the earliest
 * spawned enemy wins.
 */
enum class TargetingStrategy : uint8_t {
    Closest = 0,   // minimum distance to the tower
    Furthest,      // maximum distance to the tower
    Weakest,       // minimum current health
    Strongest,     // maximum current health
    PathProgress   // furthest along the path (closest to escaping)
};

const char* toString(TargetingStrategy strategy);
std::optional<TargetingStrategy> targetingStrategyFromString(std::string_view name);

/**
 * @brief True if the enemy is alive, still on the path and within range (inclusive)
 */
bool isTargetable(const Enemy& enemy, const Vector2D& origin, float range);

/**
 * @brief Picks the best targetable enemy for a strategy
 * @return nullptr when no enemy is in range
 */
const Enemy* selectTarget(TargetingStrategy strategy,
                          const Vector2D& origin,
                          float range,
                          const std::vector<std::unique_ptr<Enemy>>& enemies);

} // namespace Bulwark

#endif // TARGETING_STRATEGY_HPP
