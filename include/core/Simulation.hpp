/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_HPP
#define SIMULATION_HPP

#include "collisions/CollisionInfo.hpp"
#include "collisions/CollisionResolver.hpp"
#include "core/SimulationConfig.hpp"
#include "core/SimulationSnapshot.hpp"
#include "entities/ProjectileSpawnRequest.hpp"
#include "managers/EnemyManager.hpp"
#include "managers/ProjectileManager.hpp"
#include "managers/TowerManager.hpp"
#include "managers/WaveDirector.hpp"
#include "world/LevelMap.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace Bulwark {

class EntityConfigRegistry;
class IEconomy;

// What one step changed, for the economy/score/UI side
struct FrameSummary {
    float deltaTime{0.0f}; // after clamping
    int currentWave{1};
    uint32_t enemiesSpawned{0};
    uint32_t enemiesKilled{0};
    uint32_t enemiesEscaped{0};
    int bountyEarned{0};
    int livesLost{0};
    uint32_t projectilesFired{0};
    uint32_t hits{0};
    bool waveStarted{false};
    bool waveCompleted{false};
    int completedWave{0};
    int waveReward{0};
    bool allWavesComplete{false};
};

struct SimulationTotals {
    uint64_t ticks{0};
    uint64_t enemiesKilled{0};
    uint64_t enemiesEscaped{0};
    uint64_t projectilesFired{0};
    int64_t bountyEarned{0};
};

/**
 * @brief One running level: every live collection, pool and manager
 *
 * Nothing here is global, so any number of simulations can coexist. Money
 * moves only through the IEconomy handed in; lives and score belong to the
 * caller, who reads them off each FrameSummary.
 *
 * Per step, in order: waves spawn, enemies move (dead and escaped ones are
 * reaped), towers fire, projectiles move, hits are resolved, killed enemies
 * and spent projectiles are reaped.
 */
class Simulation {
public:
    /**
     * @throws ConfigurationError if the configured map is missing or invalid
     */
    Simulation(const EntityConfigRegistry& registry, const SimulationConfig& config, IEconomy& economy);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // deltaTime is clamped to [0, maxDeltaTime]
    FrameSummary step(float deltaTime);

    PlacementResult placeTower(const std::string& type, GridCell cell);
    std::optional<EntityId> selectTower(GridCell cell) const;
    UpgradeResult upgradeTower(EntityId id);
    std::optional<int> sellTower(EntityId id);
    bool setTowerTargeting(EntityId id, TargetingStrategy strategy);

    // Starts the next wave early (or at all, when auto start is off)
    bool startNextWave();

    SimulationSnapshot snapshot() const;

    const LevelMap& getLevelMap() const { return m_map; }
    const SimulationConfig& getConfig() const { return m_config; }
    uint32_t getSeed() const { return m_seed; }
    float getElapsedTime() const { return m_elapsedTime; }
    const SimulationTotals& getTotals() const { return m_totals; }
    const std::vector<HitEvent>& getLastHits() const { return m_lastHits; }

    EnemyManager& getEnemyManager() { return m_enemies; }
    const EnemyManager& getEnemyManager() const { return m_enemies; }
    TowerManager& getTowerManager() { return m_towers; }
    const TowerManager& getTowerManager() const { return m_towers; }
    ProjectileManager& getProjectileManager() { return m_projectiles; }
    const ProjectileManager& getProjectileManager() const { return m_projectiles; }
    WaveDirector& getWaveDirector() { return m_waves; }
    const WaveDirector& getWaveDirector() const { return m_waves; }
    std::mt19937& getRng() { return m_rng; }

private:
    void reapEnemies(FrameSummary& summary);
    void creditHits(FrameSummary& summary);

    SimulationConfig m_config;
    IEconomy& m_economy;
    uint32_t m_seed;
    std::mt19937 m_rng;

    LevelMap m_map;
    EnemyManager m_enemies;
    TowerManager m_towers;
    ProjectileManager m_projectiles;
    WaveDirector m_waves;
    CollisionResolver m_resolver;

    std::vector<ProjectileSpawnRequest> m_fireRequests;
    std::vector<HitEvent> m_lastHits;
    float m_elapsedTime{0.0f};
    SimulationTotals m_totals;
};

} // namespace Bulwark

#endif // SIMULATION_HPP
