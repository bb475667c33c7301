/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_RESOLVER_HPP
#define COLLISION_RESOLVER_HPP

#include "collisions/CollisionInfo.hpp"
#include "entities/Enemy.hpp"
#include "entities/Projectile.hpp"
#include <vector>

namespace Bulwark {

/**
 * @brief Broad-phase projectile x enemy test and damage application
 *
 * Projectiles are visited in launch order and enemies in spawn order. A
 * projectile strikes at most one enemy directly per call: the first live
 * enemy it has not struck before whose box the projectile's box swept along
 * its last move overlaps (boxes that only touch at an edge do not count).
 * Splash and chain damage follow from that direct hit.
 */
class CollisionResolver {
public:
    /**
     * @brief Applies every hit of this tick
     *
     * Enemies are mutated through the list; neither list changes shape.
     * @return One event per damage application, in application order
     */
    std::vector<HitEvent> resolve(const ProjectileList& projectiles, const EnemyList& enemies) const;

private:
    void applySplash(const Projectile& projectile, const Enemy& center, const EnemyList& enemies,
                     std::vector<HitEvent>& events) const;
    void applyChain(Projectile& projectile, const Enemy& first, const EnemyList& enemies,
                    std::vector<HitEvent>& events) const;
};

} // namespace Bulwark

#endif // COLLISION_RESOLVER_HPP
