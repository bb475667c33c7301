/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PROJECTILE_MANAGER_HPP
#define PROJECTILE_MANAGER_HPP

#include "entities/Enemy.hpp"
#include "entities/EntityPool.hpp"
#include "entities/Projectile.hpp"
#include "entities/ProjectileSpawnRequest.hpp"
#include <cstddef>

namespace Bulwark {

class EntityConfigRegistry;

/**
 * @brief Live projectiles of one simulation and their pool
 */
class ProjectileManager {
public:
    ProjectileManager(const EntityConfigRegistry& registry, size_t maxProjectiles, size_t poolSize);

    ProjectileManager(const ProjectileManager&) = delete;
    ProjectileManager& operator=(const ProjectileManager&) = delete;

    /**
     * @brief Launches a projectile described by a tower's fire request
     * @return nullptr if the projectile type is unknown or the cap is reached
     */
    Projectile* spawnProjectile(const ProjectileSpawnRequest& request);

    void updateAll(float deltaTime, const EnemyList& enemies);

    // Returns dead projectiles to the pool, keeping the rest in launch order
    size_t reapDead();

    const ProjectileList& getProjectiles() const { return m_projectiles; }
    size_t getProjectileCount() const { return m_projectiles.size(); }
    const EntityPool<Projectile>& getPool() const { return m_pool; }
    size_t getDroppedCount() const { return m_dropped; }

    void clear();

private:
    const EntityConfigRegistry& m_registry;
    ProjectileList m_projectiles;
    EntityPool<Projectile> m_pool;
    size_t m_maxProjectiles;
    size_t m_dropped{0};
    EntityId m_nextId{1};
};

} // namespace Bulwark

#endif // PROJECTILE_MANAGER_HPP
