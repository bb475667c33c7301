/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ProjectileManager.hpp"
#include "core/Logger.hpp"
#include "managers/EntityConfigRegistry.hpp"
#include <algorithm>
#include <format>
#include <iterator>

namespace Bulwark {

ProjectileManager::ProjectileManager(const EntityConfigRegistry& registry, size_t maxProjectiles, size_t poolSize)
    : m_registry(registry), m_pool(poolSize), m_maxProjectiles(maxProjectiles) {
    m_pool.prewarm(poolSize);
}

Projectile* ProjectileManager::spawnProjectile(const ProjectileSpawnRequest& request) {
    const ProjectileDefinition* definition = m_registry.findProjectile(request.projectileType);
    if (definition == nullptr) {
        PROJECTILE_ERROR(std::format("ProjectileManager::spawnProjectile - unknown projectile type '{}'",
                                     request.projectileType));
        return nullptr;
    }
    if (m_projectiles.size() >= m_maxProjectiles) {
        ++m_dropped;
        PROJECTILE_DEBUG(std::format("Projectile cap of {} reached, dropping shot from tower #{}",
                                     m_maxProjectiles, request.sourceTowerId));
        return nullptr;
    }

    std::unique_ptr<Projectile> projectile = m_pool.acquire();
    projectile->launch(m_nextId++, *definition, request);
    m_projectiles.push_back(std::move(projectile));
    return m_projectiles.back().get();
}

void ProjectileManager::updateAll(float deltaTime, const EnemyList& enemies) {
    for (auto& projectile : m_projectiles) {
        projectile->update(deltaTime, enemies);
    }
}

size_t ProjectileManager::reapDead() {
    auto firstDead = std::stable_partition(m_projectiles.begin(), m_projectiles.end(),
                                           [](const std::unique_ptr<Projectile>& projectile) {
                                               return !projectile->isDead();
                                           });
    ProjectileList released(std::make_move_iterator(firstDead), std::make_move_iterator(m_projectiles.end()));
    m_projectiles.erase(firstDead, m_projectiles.end());
    for (auto& projectile : released) {
        m_pool.release(std::move(projectile));
    }
    return released.size();
}

void ProjectileManager::clear() {
    ProjectileList released = std::move(m_projectiles);
    m_projectiles.clear();
    for (auto& projectile : released) {
        m_pool.release(std::move(projectile));
    }
}

} // namespace Bulwark
