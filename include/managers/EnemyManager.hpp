/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENEMY_MANAGER_HPP
#define ENEMY_MANAGER_HPP

#include "entities/Enemy.hpp"
#include "entities/EntityPool.hpp"
#include "entities/EntityTypes.hpp"
#include "entities/WaypointPath.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace Bulwark {

class EntityConfigRegistry;

// An enemy that left the live set this tick
struct FinishedEnemy {
    EntityId id{INVALID_ENTITY_ID};
    std::string type;
    int bounty{0};
    int spawnCost{0};
    bool killed{false}; // false means it walked off the end of the path
};

/**
 * @brief Owns the live enemies of one simulation and their pool
 *
 * Live enemies are kept in spawn order, which is also the candidate order
 * towers and collision checks iterate in.
 */
class EnemyManager {
public:
    EnemyManager(const EntityConfigRegistry& registry, std::shared_ptr<const WaypointPath> path,
                 size_t maxEnemies, size_t poolSize);

    EnemyManager(const EnemyManager&) = delete;
    EnemyManager& operator=(const EnemyManager&) = delete;

    /**
     * @brief Spawns an enemy of the given type at the start of the path
     * @return The new enemy, or nullptr for an unknown type or when the cap is reached
     */
    Enemy* spawnEnemy(const std::string& type, float maxHealth);

    void updateAll(float deltaTime);

    /**
     * @brief Moves dead and escaped enemies back to the pool
     *
     * Dead is checked first, so an enemy burned to death on its last step
     * reports as killed rather than escaped.
     */
    std::vector<FinishedEnemy> reapFinished();

    Enemy* findEnemy(EntityId id);
    const EnemyList& getEnemies() const { return m_enemies; }
    size_t getEnemyCount() const { return m_enemies.size(); }
    size_t getMaxEnemies() const { return m_maxEnemies; }
    bool isAtCapacity() const { return m_enemies.size() >= m_maxEnemies; }

    const EntityPool<Enemy>& getPool() const { return m_pool; }

    // Returns every live enemy to the pool
    void clear();

private:
    const EntityConfigRegistry& m_registry;
    std::shared_ptr<const WaypointPath> m_path;
    EnemyList m_enemies;
    EntityPool<Enemy> m_pool;
    size_t m_maxEnemies;
    EntityId m_nextId{1};
};

} // namespace Bulwark

#endif // ENEMY_MANAGER_HPP
