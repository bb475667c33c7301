/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/TowerManager.hpp"
#include "core/IEconomy.hpp"
#include "core/Logger.hpp"
#include "managers/EntityConfigRegistry.hpp"
#include "world/LevelMap.hpp"
#include <algorithm>
#include <format>

namespace Bulwark {

const char* toString(PlacementError error) {
    switch (error) {
        case PlacementError::None: return "None";
        case PlacementError::UnknownTowerType: return "UnknownTowerType";
        case PlacementError::OutOfBounds: return "OutOfBounds";
        case PlacementError::OnPath: return "OnPath";
        case PlacementError::Blocked: return "Blocked";
        case PlacementError::Occupied: return "Occupied";
        case PlacementError::InsufficientFunds: return "InsufficientFunds";
        case PlacementError::TowerLimitReached: return "TowerLimitReached";
    }
    return "Unknown";
}

const char* toString(UpgradeResult result) {
    switch (result) {
        case UpgradeResult::None: return "None";
        case UpgradeResult::UnknownTower: return "UnknownTower";
        case UpgradeResult::MaxLevel: return "MaxLevel";
        case UpgradeResult::InsufficientFunds: return "InsufficientFunds";
    }
    return "Unknown";
}

TowerManager::TowerManager(const EntityConfigRegistry& registry, const LevelMap& map, size_t maxTowers,
                           size_t poolSize, SellRatios sellRatios)
    : m_registry(registry), m_map(map), m_pool(poolSize), m_maxTowers(maxTowers), m_sellRatios(sellRatios) {
    m_pool.prewarm(poolSize);
}

PlacementError TowerManager::validatePlacement(const std::string& type, GridCell cell,
                                               const IEconomy& economy) const {
    const TowerDefinition* definition = m_registry.findTower(type);
    if (definition == nullptr) {
        return PlacementError::UnknownTowerType;
    }
    if (!m_map.isInBounds(cell)) {
        return PlacementError::OutOfBounds;
    }
    if (m_map.isOnPath(cell)) {
        return PlacementError::OnPath;
    }
    if (m_map.isBlocked(cell)) {
        return PlacementError::Blocked;
    }
    if (m_occupancy.contains(cell)) {
        return PlacementError::Occupied;
    }
    if (m_towers.size() >= m_maxTowers) {
        return PlacementError::TowerLimitReached;
    }
    if (!economy.canAfford(definition->cost)) {
        return PlacementError::InsufficientFunds;
    }
    return PlacementError::None;
}

PlacementResult TowerManager::placeTower(const std::string& type, GridCell cell, IEconomy& economy) {
    PlacementError error = validatePlacement(type, cell, economy);
    if (error != PlacementError::None) {
        TOWER_DEBUG(std::format("Cannot place {} at ({}, {}): {}", type, cell.col, cell.row, toString(error)));
        return PlacementResult{error, INVALID_ENTITY_ID};
    }

    const TowerDefinition& definition = *m_registry.findTower(type);
    if (!economy.spend(definition.cost)) {
        return PlacementResult{PlacementError::InsufficientFunds, INVALID_ENTITY_ID};
    }

    std::unique_ptr<Tower> tower = m_pool.acquire();
    tower->place(m_nextId++, definition, cell, m_map.cellToWorld(cell));
    const EntityId id = tower->getId();
    m_occupancy.emplace(cell, id);
    m_towers.push_back(std::move(tower));

    TOWER_INFO(std::format("Placed {} #{} at ({}, {}) for {}", type, id, cell.col, cell.row, definition.cost));
    return PlacementResult{PlacementError::None, id};
}

std::optional<EntityId> TowerManager::selectTower(GridCell cell) const {
    auto it = m_occupancy.find(cell);
    if (it == m_occupancy.end()) {
        return std::nullopt;
    }
    return it->second;
}

UpgradeResult TowerManager::upgradeTower(EntityId id, IEconomy& economy) {
    Tower* tower = findTower(id);
    if (tower == nullptr) {
        return UpgradeResult::UnknownTower;
    }
    if (!tower->canUpgrade()) {
        return UpgradeResult::MaxLevel;
    }

    const int cost = tower->getUpgradeCost();
    if (!economy.spend(cost)) {
        return UpgradeResult::InsufficientFunds;
    }

    tower->upgrade();
    TOWER_INFO(std::format("Upgraded {} #{} to level {} for {}", tower->getType(), id, tower->getLevel(), cost));
    return UpgradeResult::None;
}

std::optional<int> TowerManager::sellTower(EntityId id, IEconomy& economy) {
    auto it = findIterator(id);
    if (it == m_towers.end()) {
        TOWER_WARN(std::format("TowerManager::sellTower - no tower with id {}", id));
        return std::nullopt;
    }

    const int refund = getSellValue(**it);
    m_occupancy.erase((*it)->getCell());
    std::unique_ptr<Tower> tower = std::move(*it);
    m_towers.erase(it);
    m_pool.release(std::move(tower));

    economy.earn(refund);
    TOWER_INFO(std::format("Sold tower #{} for {}", id, refund));
    return refund;
}

bool TowerManager::setTargetingStrategy(EntityId id, TargetingStrategy strategy) {
    Tower* tower = findTower(id);
    if (tower == nullptr) {
        return false;
    }
    tower->setTargetingStrategy(strategy);
    return true;
}

void TowerManager::updateAll(float deltaTime, const EnemyList& enemies, std::mt19937& rng,
                             std::vector<ProjectileSpawnRequest>& fired) {
    for (auto& tower : m_towers) {
        if (auto request = tower->update(deltaTime, enemies, rng)) {
            fired.push_back(std::move(*request));
        }
    }
}

TowerList::iterator TowerManager::findIterator(EntityId id) {
    return std::find_if(m_towers.begin(), m_towers.end(),
                        [id](const std::unique_ptr<Tower>& tower) { return tower->getId() == id; });
}

Tower* TowerManager::findTower(EntityId id) {
    auto it = findIterator(id);
    return it == m_towers.end() ? nullptr : it->get();
}

const Tower* TowerManager::findTower(EntityId id) const {
    auto it = std::find_if(m_towers.begin(), m_towers.end(),
                           [id](const std::unique_ptr<Tower>& tower) { return tower->getId() == id; });
    return it == m_towers.end() ? nullptr : it->get();
}

int TowerManager::getSellValue(const Tower& tower) const {
    return tower.getSellValue(m_sellRatios.base, m_sellRatios.upgrade);
}

void TowerManager::clear() {
    TowerList released = std::move(m_towers);
    m_towers.clear();
    m_occupancy.clear();
    for (auto& tower : released) {
        m_pool.release(std::move(tower));
    }
}

} // namespace Bulwark
