/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include "managers/WaveDirector.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace Bulwark {

class SettingsManager;

/**
 * @brief Tunables of one simulation and session
 *
 * Defaults match res/settings.json. fromSettings() reads each value from its
 * "category.key" and falls back to the default when absent.
 */
struct SimulationConfig {
    // simulation
    float maxDeltaTime{0.1f};
    uint32_t seed{0}; // 0 seeds from the clock
    float fixedTimestep{1.0f / 60.0f};

    // limits
    size_t maxEnemies{500};
    size_t maxProjectiles{500};
    size_t maxTowers{300};

    // pools
    size_t enemyPoolSize{100};
    size_t projectilePoolSize{200};
    size_t towerPoolSize{50};

    WaveConfig waves;

    // economy
    int startingMoney{500};
    float sellBaseRatio{0.5f};
    float sellUpgradeRatio{0.25f};

    // player
    int startingLives{20};

    std::string mapName{"map1"};

    static SimulationConfig fromSettings(const SettingsManager& settings);

    // @throws ConfigurationError when a value is out of range
    void validate() const;
};

} // namespace Bulwark

#endif // SIMULATION_CONFIG_HPP
