/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Simulation.hpp"
#include "core/IEconomy.hpp"
#include "core/Logger.hpp"
#include "managers/EntityConfigRegistry.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>

namespace Bulwark {

namespace {

uint32_t resolveSeed(uint32_t configured) {
    if (configured != 0) {
        return configured;
    }
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    uint32_t seed = static_cast<uint32_t>(ticks ^ (ticks >> 32));
    return seed != 0 ? seed : 1u;
}

} // namespace

Simulation::Simulation(const EntityConfigRegistry& registry, const SimulationConfig& config, IEconomy& economy)
    : m_config(config)
    , m_economy(economy)
    , m_seed(resolveSeed(config.seed))
    , m_rng(m_seed)
    , m_map(registry.getMap(config.mapName))
    , m_enemies(registry, m_map.getPath(), config.maxEnemies, config.enemyPoolSize)
    , m_towers(registry, m_map, config.maxTowers, config.towerPoolSize,
               TowerManager::SellRatios{config.sellBaseRatio, config.sellUpgradeRatio})
    , m_projectiles(registry, config.maxProjectiles, config.projectilePoolSize)
    , m_waves(registry.getEnemies(), config.waves, m_rng)
{
    SIM_INFO(std::format("Simulation created on map '{}' with seed {}", m_map.getName(), m_seed));
}

FrameSummary Simulation::step(float deltaTime) {
    FrameSummary summary;
    if (!std::isfinite(deltaTime) || deltaTime < 0.0f) {
        SIM_WARN(std::format("Simulation::step - ignoring invalid delta time {}", deltaTime));
        deltaTime = 0.0f;
    }
    deltaTime = std::min(deltaTime, m_config.maxDeltaTime);
    summary.deltaTime = deltaTime;
    m_elapsedTime += deltaTime;
    ++m_totals.ticks;

    // 1. Waves
    WaveUpdate wave = m_waves.update(deltaTime, m_enemies.getEnemyCount(), !m_enemies.isAtCapacity());
    for (const SpawnRequest& spawn : wave.spawns) {
        if (m_enemies.spawnEnemy(spawn.enemyType, spawn.maxHealth) != nullptr) {
            ++summary.enemiesSpawned;
        }
    }
    if (wave.waveCompleted) {
        m_economy.earn(wave.reward);
        summary.waveCompleted = true;
        summary.completedWave = wave.completedWave;
        summary.waveReward = wave.reward;
    }
    summary.waveStarted = wave.waveStarted;
    summary.allWavesComplete = wave.allWavesComplete;

    // 2. Enemies
    m_enemies.updateAll(deltaTime);
    reapEnemies(summary);

    // 3. Towers
    m_fireRequests.clear();
    m_towers.updateAll(deltaTime, m_enemies.getEnemies(), m_rng, m_fireRequests);
    for (const ProjectileSpawnRequest& request : m_fireRequests) {
        if (m_projectiles.spawnProjectile(request) == nullptr) {
            continue;
        }
        ++summary.projectilesFired;
        if (Tower* tower = m_towers.findTower(request.sourceTowerId)) {
            tower->recordShot();
        }
    }

    // 4. Projectiles and hits
    m_projectiles.updateAll(deltaTime, m_enemies.getEnemies());
    m_lastHits = m_resolver.resolve(m_projectiles.getProjectiles(), m_enemies.getEnemies());
    creditHits(summary);
    reapEnemies(summary);
    m_projectiles.reapDead();

    summary.currentWave = m_waves.getCurrentWave();
    m_totals.projectilesFired += summary.projectilesFired;
    return summary;
}

void Simulation::reapEnemies(FrameSummary& summary) {
    for (const FinishedEnemy& enemy : m_enemies.reapFinished()) {
        if (enemy.killed) {
            m_economy.earn(enemy.bounty);
            m_waves.recordKill(enemy.spawnCost);
            summary.bountyEarned += enemy.bounty;
            ++summary.enemiesKilled;
            ++m_totals.enemiesKilled;
            m_totals.bountyEarned += enemy.bounty;
        } else {
            ++summary.enemiesEscaped;
            ++summary.livesLost;
            ++m_totals.enemiesEscaped;
            SIM_DEBUG(std::format("{} #{} reached the exit", enemy.type, enemy.id));
        }
    }
}

void Simulation::creditHits(FrameSummary& summary) {
    summary.hits += static_cast<uint32_t>(m_lastHits.size());
    for (const HitEvent& hit : m_lastHits) {
        if (Tower* tower = m_towers.findTower(hit.sourceTowerId)) {
            tower->recordHit(hit.damage, hit.killed);
        }
    }
}

PlacementResult Simulation::placeTower(const std::string& type, GridCell cell) {
    return m_towers.placeTower(type, cell, m_economy);
}

std::optional<EntityId> Simulation::selectTower(GridCell cell) const {
    return m_towers.selectTower(cell);
}

UpgradeResult Simulation::upgradeTower(EntityId id) {
    return m_towers.upgradeTower(id, m_economy);
}

std::optional<int> Simulation::sellTower(EntityId id) {
    return m_towers.sellTower(id, m_economy);
}

bool Simulation::setTowerTargeting(EntityId id, TargetingStrategy strategy) {
    return m_towers.setTargetingStrategy(id, strategy);
}

bool Simulation::startNextWave() {
    return m_waves.startNextWave();
}

SimulationSnapshot Simulation::snapshot() const {
    SimulationSnapshot snap;
    snap.wave = m_waves.getCurrentWave();
    snap.waveState = m_waves.getState();
    snap.elapsedTime = m_elapsedTime;

    snap.enemies.reserve(m_enemies.getEnemyCount());
    for (const auto& enemy : m_enemies.getEnemies()) {
        const StatusEffectSet& effects = enemy->getStatusEffects();
        snap.enemies.push_back(EnemySnapshot{enemy->getId(), enemy->getType(), enemy->getPosition(),
                                             enemy->getHealthPercent(), enemy->getRotation(),
                                             effects.isSlowed(), effects.isStunned(),
                                             effects.isBurning(), effects.isFrozen()});
    }

    snap.towers.reserve(m_towers.getTowerCount());
    for (const auto& tower : m_towers.getTowers()) {
        snap.towers.push_back(TowerSnapshot{tower->getId(), tower->getType(), tower->getCell(),
                                            tower->getPosition(), tower->getLevel(), tower->getRange(),
                                            tower->getRotation(), tower->getTargetId()});
    }

    snap.projectiles.reserve(m_projectiles.getProjectileCount());
    for (const auto& projectile : m_projectiles.getProjectiles()) {
        snap.projectiles.push_back(ProjectileSnapshot{projectile->getId(), projectile->getType(),
                                                      projectile->getPosition(), projectile->getRotation()});
    }
    return snap;
}

} // namespace Bulwark
