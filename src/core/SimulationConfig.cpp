/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SimulationConfig.hpp"
#include "core/ConfigurationError.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <format>

namespace Bulwark {

namespace {

size_t readSize(const SettingsManager& settings, const char* category, const char* key, size_t fallback) {
    int value = settings.get<int>(category, key, static_cast<int>(fallback));
    if (value < 0) {
        throw ConfigurationError(std::format("Setting {}.{} must not be negative (got {})", category, key, value));
    }
    return static_cast<size_t>(value);
}

} // namespace

SimulationConfig SimulationConfig::fromSettings(const SettingsManager& settings) {
    SimulationConfig config;

    config.maxDeltaTime = settings.get<float>("simulation", "max_delta_time", config.maxDeltaTime);
    config.seed = static_cast<uint32_t>(settings.get<int>("simulation", "seed", 0));
    config.fixedTimestep = settings.get<float>("simulation", "fixed_timestep", config.fixedTimestep);

    config.maxEnemies = readSize(settings, "limits", "max_enemies", config.maxEnemies);
    config.maxProjectiles = readSize(settings, "limits", "max_projectiles", config.maxProjectiles);
    config.maxTowers = readSize(settings, "limits", "max_towers", config.maxTowers);

    config.enemyPoolSize = readSize(settings, "pools", "enemy_pool_size", config.enemyPoolSize);
    config.projectilePoolSize = readSize(settings, "pools", "projectile_pool_size", config.projectilePoolSize);
    config.towerPoolSize = readSize(settings, "pools", "tower_pool_size", config.towerPoolSize);

    WaveConfig& waves = config.waves;
    waves.baseBudget = settings.get<int>("waves", "base_budget", waves.baseBudget);
    waves.growthFactor = settings.get<float>("waves", "growth_factor", waves.growthFactor);
    waves.healthRampPerWave = settings.get<float>("waves", "health_ramp_per_wave", waves.healthRampPerWave);
    waves.spawnInterval = settings.get<float>("waves", "spawn_interval", waves.spawnInterval);
    waves.interWaveDelay = settings.get<float>("waves", "inter_wave_delay", waves.interWaveDelay);
    waves.completionBonus = settings.get<int>("waves", "completion_bonus", waves.completionBonus);
    waves.completionBonusPerWave = settings.get<int>("waves", "completion_bonus_per_wave", waves.completionBonusPerWave);
    waves.maxWaves = settings.get<int>("waves", "max_waves", waves.maxWaves);
    waves.autoStart = settings.get<bool>("waves", "auto_start", waves.autoStart);

    config.startingMoney = settings.get<int>("economy", "starting_money", config.startingMoney);
    config.sellBaseRatio = settings.get<float>("economy", "sell_base_ratio", config.sellBaseRatio);
    config.sellUpgradeRatio = settings.get<float>("economy", "sell_upgrade_ratio", config.sellUpgradeRatio);

    config.startingLives = settings.get<int>("player", "starting_lives", config.startingLives);
    config.mapName = settings.get<std::string>("map", "name", config.mapName);

    config.validate();
    return config;
}

void SimulationConfig::validate() const {
    if (maxDeltaTime <= 0.0f) {
        throw ConfigurationError("simulation.max_delta_time must be positive");
    }
    if (fixedTimestep <= 0.0f || fixedTimestep > maxDeltaTime) {
        throw ConfigurationError("simulation.fixed_timestep must be positive and at most max_delta_time");
    }
    if (enemyPoolSize == 0 || projectilePoolSize == 0 || towerPoolSize == 0) {
        throw ConfigurationError("pool sizes must be at least 1");
    }
    if (waves.baseBudget < 1 || waves.growthFactor <= 0.0f) {
        throw ConfigurationError("waves.base_budget must be at least 1 and waves.growth_factor positive");
    }
    if (waves.spawnInterval < 0.0f || waves.interWaveDelay < 0.0f || waves.maxWaves < 0) {
        throw ConfigurationError("wave timings and waves.max_waves must not be negative");
    }
    if (startingMoney < 0 || startingLives < 1) {
        throw ConfigurationError("economy.starting_money must not be negative and player.starting_lives at least 1");
    }
    if (sellBaseRatio < 0.0f || sellUpgradeRatio < 0.0f) {
        throw ConfigurationError("sell ratios must not be negative");
    }
}

} // namespace Bulwark
