/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WAVE_DIRECTOR_HPP
#define WAVE_DIRECTOR_HPP

#include "entities/EntityDefinitions.hpp"
#include <boost/container/flat_map.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace Bulwark {

struct WaveConfig {
    int baseBudget{10};
    float growthFactor{2.0f};        // budget = baseBudget * growthFactor^(wave - 1)
    float healthRampPerWave{5.0f};   // extra health per wave since a type first appeared
    float spawnInterval{0.5f};       // seconds between spawns
    float interWaveDelay{3.0f};      // pause before the next wave auto-starts
    int completionBonus{50};
    int completionBonusPerWave{5};
    int maxWaves{0};                 // 0 = endless
    bool autoStart{true};
};

struct SpawnRequest {
    std::string enemyType;
    float maxHealth{0.0f};
    int cost{0};
};

enum class WaveState : uint8_t {
    WaveActive = 0, // spawning and/or enemies of this wave still alive
    WaveComplete,   // budget spent and the field is clear, waiting for the next wave
    Finished        // last configured wave completed
};

const char* toString(WaveState state);

// What happened during one WaveDirector::update call
struct WaveUpdate {
    std::vector<SpawnRequest> spawns;
    bool waveStarted{false};
    bool waveCompleted{false};
    int completedWave{0};
    int reward{0};
    bool allWavesComplete{false};
};

struct WaveStats {
    int64_t totalBudgetSpent{0};
    int64_t totalBudgetKilled{0};
    uint32_t enemiesSpawned{0};
    uint32_t wavesCompleted{0};
};

/**
 * @brief Budget driven wave spawner
 *
 * Each wave gets a spawn budget. A spawn picks uniformly at random among the
 * roster types whose cost fits the remaining budget and that pass their wave
 * gate. When nothing fits, allBudgetSpent is set and the wave ends once the
 * field is clear.
 *
 * Wave gate per type: excluded while wave <= introWave, afterwards included
 * with probability (wave - introWave) / rampWaves clamped to [0, 1]
 * (rampWaves 0 means always).
 *
 * Health scaling: a type's spawns get baseHealth + healthRampPerWave *
 * (wave - first wave the type spawned in). No other wave scaling is applied.
 */
class WaveDirector {
public:
    WaveDirector(std::vector<EnemyDefinition> roster, WaveConfig config, std::mt19937& rng);

    /**
     * @brief Advances pacing timers and the wave state machine
     * @param liveEnemies Enemies currently on the field
     * @param canSpawn false while the live enemy cap is reached
     */
    WaveUpdate update(float deltaTime, size_t liveEnemies, bool canSpawn);

    /**
     * @brief Makes one budget decision, ignoring spawn pacing
     * @return The chosen spawn, or nullopt once nothing affordable and eligible remains
     */
    std::optional<SpawnRequest> trySpawn();

    // Rolls the wave gate for a type (consumes randomness only for 0 < p < 1)
    bool isTypeEligible(const EnemyDefinition& definition);
    float getInclusionProbability(const EnemyDefinition& definition) const;

    float scaledHealth(const EnemyDefinition& definition) const;

    /**
     * @brief Begins the next wave
     * @return false unless the current wave has completed
     */
    bool startNextWave();

    int completionReward(int wave) const;
    void recordKill(int spawnCost);

    int getCurrentWave() const { return m_currentWave; }
    int64_t getWaveBudget() const { return m_waveBudget; }
    int64_t getSpentBudget() const { return m_spentBudget; }
    int64_t getRemainingBudget() const { return m_waveBudget - m_spentBudget; }
    bool isAllBudgetSpent() const { return m_allBudgetSpent; }
    WaveState getState() const { return m_state; }
    float getInterWaveTimer() const { return m_interWaveTimer; }
    const WaveStats& getStats() const { return m_stats; }
    const WaveConfig& getConfig() const { return m_config; }
    const std::vector<EnemyDefinition>& getRoster() const { return m_roster; }

    bool hasSpawned(const std::string& type) const { return m_firstSpawnWave.contains(type); }
    std::optional<int> getFirstSpawnWave(const std::string& type) const;

private:
    int64_t budgetForWave(int wave) const;
    void completeWave(WaveUpdate& result);

    std::vector<EnemyDefinition> m_roster;
    WaveConfig m_config;
    std::mt19937& m_rng;

    int m_currentWave{1};
    int64_t m_waveBudget{0};
    int64_t m_spentBudget{0};
    bool m_allBudgetSpent{false};
    WaveState m_state{WaveState::WaveActive};
    float m_spawnTimer{0.0f};
    float m_interWaveTimer{0.0f};

    boost::container::flat_map<std::string, int> m_firstSpawnWave;
    WaveStats m_stats;
};

} // namespace Bulwark

#endif // WAVE_DIRECTOR_HPP
