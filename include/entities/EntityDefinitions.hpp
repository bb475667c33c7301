/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_DEFINITIONS_HPP
#define ENTITY_DEFINITIONS_HPP

#include "entities/EntityTypes.hpp"
#include "entities/TargetingStrategy.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace Bulwark {

/**
 * @brief Data-driven description of an enemy type (one per JSON entry)
 */
struct EnemyDefinition {
    std::string name;
    float health{1.0f};
    float speed{0.0f};          // world units per second
    float size{16.0f};          // diameter, used for the hit box
    int bounty{0};              // money paid out on death
    float armor{0.0f};          // flat reduction, at least 1 damage still lands
    ResistanceTable resistances{};
    int spawnCost{1};           // wave budget consumed per spawn
    int introWave{0};           // excluded up to and including this wave
    int rampWaves{0};           // waves over which inclusion odds climb to 1
};

enum class StatusEffectType : uint8_t {
    Slow = 0,
    Stun,
    Burn,
    Freeze
};

const char* toString(StatusEffectType type);
std::optional<StatusEffectType> statusEffectTypeFromString(const std::string& name);

// Effect a projectile applies to the enemy it strikes directly
struct OnHitEffect {
    StatusEffectType type{StatusEffectType::Slow};
    float magnitude{0.0f}; // slow factor for Slow, damage per second for Burn
    float duration{0.0f};
};

// Lightning-style damage that jumps on to nearby enemies after a hit
struct ChainSpec {
    int maxChains{0};
    float chainRange{0.0f};
    float damageMultiplier{1.0f}; // applied once per jump
};

/**
 * @brief Data-driven description of a tower type
 */
struct TowerDefinition {
    std::string name;
    int cost{0};
    int upgradeCost{0};
    float range{0.0f};
    float fireRate{1.0f};         // seconds between shots
    float damage{0.0f};
    DamageType damageType{DamageType::Normal};
    std::string projectileType;
    bool piercing{false};
    TargetingStrategy targeting{TargetingStrategy::Closest};
    int maxLevel{10};
    float damageVariance{0.1f};   // symmetric, 0.1 means x0.9..x1.1
    std::optional<OnHitEffect> onHit;
    float splashRadius{0.0f};     // 0 disables area damage
    std::optional<ChainSpec> chain;
};

/**
 * @brief Data-driven description of a projectile type
 */
struct ProjectileDefinition {
    std::string name;
    float speed{300.0f};
    float size{4.0f};
    float maxDistance{1000.0f};
    float lifetime{5.0f};
    bool piercing{false};
    bool homing{false};
};

} // namespace Bulwark

#endif // ENTITY_DEFINITIONS_HPP
