/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_SNAPSHOT_HPP
#define SIMULATION_SNAPSHOT_HPP

#include "entities/EntityTypes.hpp"
#include "managers/WaveDirector.hpp"
#include "utils/Vector2D.hpp"
#include <string>
#include <vector>

namespace Bulwark {

// Read-only per-frame copies for a renderer or UI. Rotations are in radians.

struct EnemySnapshot {
    EntityId id{INVALID_ENTITY_ID};
    std::string type;
    Vector2D position;
    float healthFraction{0.0f};
    float rotation{0.0f};
    bool slowed{false};
    bool stunned{false};
    bool burning{false};
    bool frozen{false};
};

struct TowerSnapshot {
    EntityId id{INVALID_ENTITY_ID};
    std::string type;
    GridCell cell;
    Vector2D position;
    int level{1};
    float range{0.0f};
    float rotation{0.0f};
    EntityId targetId{INVALID_ENTITY_ID};
};

struct ProjectileSnapshot {
    EntityId id{INVALID_ENTITY_ID};
    std::string type;
    Vector2D position;
    float rotation{0.0f};
};

struct SimulationSnapshot {
    int wave{1};
    WaveState waveState{WaveState::WaveActive};
    float elapsedTime{0.0f};
    std::vector<EnemySnapshot> enemies;
    std::vector<TowerSnapshot> towers;
    std::vector<ProjectileSnapshot> projectiles;
};

} // namespace Bulwark

#endif // SIMULATION_SNAPSHOT_HPP
