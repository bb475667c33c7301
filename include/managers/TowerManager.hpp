/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TOWER_MANAGER_HPP
#define TOWER_MANAGER_HPP

#include "entities/Enemy.hpp"
#include "entities/EntityPool.hpp"
#include "entities/EntityTypes.hpp"
#include "entities/ProjectileSpawnRequest.hpp"
#include "entities/Tower.hpp"
#include <boost/container/flat_map.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace Bulwark {

class EntityConfigRegistry;
class IEconomy;
class LevelMap;

enum class PlacementError : uint8_t {
    None = 0,
    UnknownTowerType,
    OutOfBounds,
    OnPath,
    Blocked,
    Occupied,
    InsufficientFunds,
    TowerLimitReached
};

const char* toString(PlacementError error);

struct PlacementResult {
    PlacementError error{PlacementError::None};
    EntityId towerId{INVALID_ENTITY_ID};

    bool succeeded() const { return error == PlacementError::None; }
};

enum class UpgradeResult : uint8_t {
    None = 0,
    UnknownTower,
    MaxLevel,
    InsufficientFunds
};

const char* toString(UpgradeResult result);

/**
 * @brief Placed towers of one simulation, the grid occupancy and the tower pool
 *
 * Every player-facing failure comes back as a reason code. Money only moves
 * through the IEconomy passed to each call.
 */
class TowerManager {
public:
    struct SellRatios {
        float base{0.5f};
        float upgrade{0.25f};
    };

    TowerManager(const EntityConfigRegistry& registry, const LevelMap& map, size_t maxTowers,
                 size_t poolSize, SellRatios sellRatios);

    TowerManager(const TowerManager&) = delete;
    TowerManager& operator=(const TowerManager&) = delete;

    /**
     * @brief Checks every placement rule, affordability last
     * @return PlacementError::None when placeTower would succeed
     */
    PlacementError validatePlacement(const std::string& type, GridCell cell, const IEconomy& economy) const;

    PlacementResult placeTower(const std::string& type, GridCell cell, IEconomy& economy);

    // Tower occupying the cell, if any
    std::optional<EntityId> selectTower(GridCell cell) const;

    UpgradeResult upgradeTower(EntityId id, IEconomy& economy);

    /**
     * @brief Removes the tower, refunds its sell value and frees its cell
     * @return The refunded amount, or nullopt for an unknown id
     */
    std::optional<int> sellTower(EntityId id, IEconomy& economy);

    bool setTargetingStrategy(EntityId id, TargetingStrategy strategy);

    // Ticks every tower in placement order, appending what they fire
    void updateAll(float deltaTime, const EnemyList& enemies, std::mt19937& rng,
                   std::vector<ProjectileSpawnRequest>& fired);

    Tower* findTower(EntityId id);
    const Tower* findTower(EntityId id) const;

    int getSellValue(const Tower& tower) const;

    const TowerList& getTowers() const { return m_towers; }
    size_t getTowerCount() const { return m_towers.size(); }
    size_t getMaxTowers() const { return m_maxTowers; }
    const EntityPool<Tower>& getPool() const { return m_pool; }

    void clear();

private:
    TowerList::iterator findIterator(EntityId id);

    const EntityConfigRegistry& m_registry;
    const LevelMap& m_map;
    TowerList m_towers;
    EntityPool<Tower> m_pool;
    boost::container::flat_map<GridCell, EntityId> m_occupancy;
    size_t m_maxTowers;
    SellRatios m_sellRatios;
    EntityId m_nextId{1};
};

} // namespace Bulwark

#endif // TOWER_MANAGER_HPP
