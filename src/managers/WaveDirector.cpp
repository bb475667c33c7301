/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/WaveDirector.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <format>
#include <stdexcept>

namespace Bulwark {

namespace {
// Keeps runaway growth factors from overflowing the budget
constexpr double MAX_WAVE_BUDGET = 1.0e15;
}

const char* toString(WaveState state) {
    switch (state) {
        case WaveState::WaveActive: return "WaveActive";
        case WaveState::WaveComplete: return "WaveComplete";
        case WaveState::Finished: return "Finished";
    }
    return "Unknown";
}

WaveDirector::WaveDirector(std::vector<EnemyDefinition> roster, WaveConfig config, std::mt19937& rng)
    : m_roster(std::move(roster)), m_config(config), m_rng(rng) {
    if (m_config.baseBudget < 0 || m_config.growthFactor <= 0.0f) {
        throw std::invalid_argument("WaveDirector requires a non-negative base budget and a positive growth factor");
    }
    for (const EnemyDefinition& definition : m_roster) {
        if (definition.spawnCost < 1) {
            throw std::invalid_argument(std::format("Enemy type '{}' has a spawn cost below 1", definition.name));
        }
    }
    m_waveBudget = budgetForWave(m_currentWave);
    WAVE_INFO(std::format("Wave {} started with budget {} ({} enemy types)",
                          m_currentWave, m_waveBudget, m_roster.size()));
}

int64_t WaveDirector::budgetForWave(int wave) const {
    double budget = static_cast<double>(m_config.baseBudget) *
                    std::pow(static_cast<double>(m_config.growthFactor), wave - 1);
    return static_cast<int64_t>(std::floor(std::min(budget, MAX_WAVE_BUDGET)));
}

WaveUpdate WaveDirector::update(float deltaTime, size_t liveEnemies, bool canSpawn) {
    WaveUpdate result;

    switch (m_state) {
        case WaveState::WaveActive:
            if (!m_allBudgetSpent) {
                m_spawnTimer = std::max(0.0f, m_spawnTimer - deltaTime);
                if (m_spawnTimer <= 0.0f && canSpawn) {
                    if (auto spawn = trySpawn()) {
                        result.spawns.push_back(std::move(*spawn));
                        m_spawnTimer = m_config.spawnInterval;
                    }
                }
            }
            if (m_allBudgetSpent && liveEnemies == 0) {
                completeWave(result);
            }
            break;

        case WaveState::WaveComplete:
            if (m_config.autoStart) {
                m_interWaveTimer = std::max(0.0f, m_interWaveTimer - deltaTime);
                if (m_interWaveTimer <= 0.0f) {
                    result.waveStarted = startNextWave();
                }
            }
            break;

        case WaveState::Finished:
            break;
    }
    return result;
}

void WaveDirector::completeWave(WaveUpdate& result) {
    ++m_stats.wavesCompleted;
    result.waveCompleted = true;
    result.completedWave = m_currentWave;
    result.reward = completionReward(m_currentWave);

    WAVE_INFO(std::format("Wave {} complete, spent {}/{} budget, reward {}",
                          m_currentWave, m_spentBudget, m_waveBudget, result.reward));

    if (m_config.maxWaves > 0 && m_currentWave >= m_config.maxWaves) {
        m_state = WaveState::Finished;
        result.allWavesComplete = true;
        WAVE_INFO(std::format("All {} waves complete", m_config.maxWaves));
        return;
    }
    m_state = WaveState::WaveComplete;
    m_interWaveTimer = m_config.interWaveDelay;
}

std::optional<SpawnRequest> WaveDirector::trySpawn() {
    if (m_allBudgetSpent || m_state != WaveState::WaveActive) {
        return std::nullopt;
    }

    const int64_t remaining = getRemainingBudget();
    std::vector<size_t> candidates;
    candidates.reserve(m_roster.size());
    for (size_t i = 0; i < m_roster.size(); ++i) {
        const EnemyDefinition& definition = m_roster[i];
        if (definition.spawnCost <= remaining && isTypeEligible(definition)) {
            candidates.push_back(i);
        }
    }

    if (candidates.empty()) {
        m_allBudgetSpent = true;
        WAVE_INFO(std::format("Wave {}: spawning complete, spent {}/{} budget",
                              m_currentWave, m_spentBudget, m_waveBudget));
        return std::nullopt;
    }

    std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
    const EnemyDefinition& chosen = m_roster[candidates[pick(m_rng)]];

    m_spentBudget += chosen.spawnCost;
    assert(m_spentBudget <= m_waveBudget);
    m_stats.totalBudgetSpent += chosen.spawnCost;
    ++m_stats.enemiesSpawned;

    // Recorded before scaling so the first wave a type appears in uses base health
    m_firstSpawnWave.try_emplace(chosen.name, m_currentWave);

    SpawnRequest request{chosen.name, scaledHealth(chosen), chosen.spawnCost};
    WAVE_DEBUG(std::format("Wave {}: spawning {} (cost {}, health {}), {} budget left",
                           m_currentWave, request.enemyType, request.cost, request.maxHealth,
                           getRemainingBudget()));
    return request;
}

float WaveDirector::getInclusionProbability(const EnemyDefinition& definition) const {
    if (m_currentWave <= definition.introWave) {
        return 0.0f;
    }
    if (definition.rampWaves <= 0) {
        return 1.0f;
    }
    float probability = static_cast<float>(m_currentWave - definition.introWave) /
                        static_cast<float>(definition.rampWaves);
    return std::clamp(probability, 0.0f, 1.0f);
}

bool WaveDirector::isTypeEligible(const EnemyDefinition& definition) {
    const float probability = getInclusionProbability(definition);
    if (probability <= 0.0f) {
        return false;
    }
    if (probability >= 1.0f) {
        return true;
    }
    std::uniform_real_distribution<float> roll(0.0f, 1.0f);
    return roll(m_rng) < probability;
}

float WaveDirector::scaledHealth(const EnemyDefinition& definition) const {
    auto first = getFirstSpawnWave(definition.name);
    if (!first) {
        return definition.health;
    }
    return definition.health + m_config.healthRampPerWave * static_cast<float>(m_currentWave - *first);
}

std::optional<int> WaveDirector::getFirstSpawnWave(const std::string& type) const {
    auto it = m_firstSpawnWave.find(type);
    if (it == m_firstSpawnWave.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool WaveDirector::startNextWave() {
    if (m_state != WaveState::WaveComplete) {
        return false;
    }

    ++m_currentWave;
    m_waveBudget = budgetForWave(m_currentWave);
    m_spentBudget = 0;
    m_allBudgetSpent = false;
    m_spawnTimer = 0.0f;
    m_interWaveTimer = 0.0f;
    m_state = WaveState::WaveActive;

    WAVE_INFO(std::format("Wave {} started with budget {}", m_currentWave, m_waveBudget));
    return true;
}

int WaveDirector::completionReward(int wave) const {
    return m_config.completionBonus + m_config.completionBonusPerWave * wave;
}

void WaveDirector::recordKill(int spawnCost) {
    m_stats.totalBudgetKilled += spawnCost;
}

} // namespace Bulwark
