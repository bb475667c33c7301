/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EnemyManager.hpp"
#include "core/Logger.hpp"
#include "managers/EntityConfigRegistry.hpp"
#include <algorithm>
#include <format>
#include <iterator>
#include <stdexcept>

namespace Bulwark {

EnemyManager::EnemyManager(const EntityConfigRegistry& registry, std::shared_ptr<const WaypointPath> path,
                           size_t maxEnemies, size_t poolSize)
    : m_registry(registry), m_path(std::move(path)), m_pool(poolSize), m_maxEnemies(maxEnemies) {
    if (!m_path) {
        throw std::invalid_argument("EnemyManager requires a waypoint path");
    }
    m_enemies.reserve(std::min(maxEnemies, poolSize));
    m_pool.prewarm(poolSize);
}

Enemy* EnemyManager::spawnEnemy(const std::string& type, float maxHealth) {
    const EnemyDefinition* definition = m_registry.findEnemy(type);
    if (definition == nullptr) {
        ENEMY_WARN(std::format("EnemyManager::spawnEnemy - unknown enemy type '{}', skipping", type));
        return nullptr;
    }
    if (isAtCapacity()) {
        ENEMY_DEBUG(std::format("Enemy cap of {} reached, not spawning {}", m_maxEnemies, type));
        return nullptr;
    }

    std::unique_ptr<Enemy> enemy = m_pool.acquire();
    enemy->spawn(m_nextId++, *definition, maxHealth, m_path);
    ENEMY_DEBUG(std::format("Spawned {} #{} with {} health", type, enemy->getId(), enemy->getMaxHealth()));

    m_enemies.push_back(std::move(enemy));
    return m_enemies.back().get();
}

void EnemyManager::updateAll(float deltaTime) {
    for (auto& enemy : m_enemies) {
        enemy->update(deltaTime);
    }
}

std::vector<FinishedEnemy> EnemyManager::reapFinished() {
    std::vector<FinishedEnemy> finished;

    auto firstFinished = std::stable_partition(m_enemies.begin(), m_enemies.end(),
                                               [](const std::unique_ptr<Enemy>& enemy) {
                                                   return !enemy->isDead() && !enemy->hasReachedEnd();
                                               });
    if (firstFinished == m_enemies.end()) {
        return finished;
    }

    finished.reserve(static_cast<size_t>(std::distance(firstFinished, m_enemies.end())));
    for (auto it = firstFinished; it != m_enemies.end(); ++it) {
        const Enemy& enemy = **it;
        finished.push_back(FinishedEnemy{enemy.getId(), enemy.getType(), enemy.getBounty(),
                                         enemy.getSpawnCost(), enemy.isDead()});
    }

    // Remove from the live set first, then hand to the pool
    std::vector<std::unique_ptr<Enemy>> released(std::make_move_iterator(firstFinished),
                                                 std::make_move_iterator(m_enemies.end()));
    m_enemies.erase(firstFinished, m_enemies.end());
    for (auto& enemy : released) {
        m_pool.release(std::move(enemy));
    }
    return finished;
}

Enemy* EnemyManager::findEnemy(EntityId id) {
    auto it = std::find_if(m_enemies.begin(), m_enemies.end(),
                           [id](const std::unique_ptr<Enemy>& enemy) { return enemy->getId() == id; });
    return it == m_enemies.end() ? nullptr : it->get();
}

void EnemyManager::clear() {
    EnemyList released = std::move(m_enemies);
    m_enemies.clear();
    for (auto& enemy : released) {
        m_pool.release(std::move(enemy));
    }
}

} // namespace Bulwark
