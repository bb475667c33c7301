/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TOWER_HPP
#define TOWER_HPP

#include "entities/Enemy.hpp"
#include "entities/EntityDefinitions.hpp"
#include "entities/EntityTypes.hpp"
#include "entities/ProjectileSpawnRequest.hpp"
#include "entities/TargetingStrategy.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace Bulwark {

struct TowerStats {
    uint32_t shotsFired{0};
    uint32_t kills{0};
    float damageDealt{0.0f};
};

/**
 * @brief Stationary shooter placed on a grid cell
 *
 * Per tick: cool down, re-validate the remembered target by id (dead, gone or
 * out of range means re-acquire this same tick), then fire if the cooldown
 * has run out. The cooldown stays within [0, fireRate].
 *
 * Level scaling: damage x(1 + 0.15 * (level - 1)), range x1.05^(level - 1),
 * upgrade price upgradeCost x1.15^(level - 1) rounded down.
 */
class Tower {
public:
    static constexpr float DAMAGE_PER_LEVEL = 0.15f;
    static constexpr float RANGE_GROWTH = 1.05f;
    static constexpr float UPGRADE_COST_GROWTH = 1.15f;

    Tower() = default;

    void place(EntityId id, const TowerDefinition& definition, GridCell cell, const Vector2D& position);
    void reset();

    /**
     * @brief Advances cooldown and targeting
     * @param rng Source for damage variance
     * @return A spawn descriptor if the tower fired this tick
     */
    std::optional<ProjectileSpawnRequest> update(float deltaTime, const EnemyList& enemies,
                                                 std::mt19937& rng);

    // Level scaled damage with the definition's variance applied, rounded
    float rollDamage(std::mt19937& rng) const;
    float getBaseDamageAtLevel() const;

    bool canUpgrade() const { return m_level < m_definition.maxLevel; }
    int getUpgradeCost() const;
    bool upgrade();

    // floor(cost * baseRatio + (level - 1) * upgradeCost * upgradeRatio)
    int getSellValue(float baseRatio, float upgradeRatio) const;

    // Shots are counted when the projectile is launched, not when requested
    void recordShot() { ++m_stats.shotsFired; }
    void recordHit(float damage, bool killed);

    EntityId getId() const { return m_id; }
    const std::string& getType() const { return m_definition.name; }
    const TowerDefinition& getDefinition() const { return m_definition; }
    GridCell getCell() const { return m_cell; }
    const Vector2D& getPosition() const { return m_position; }
    int getLevel() const { return m_level; }
    float getRange() const;
    float getFireRate() const { return m_definition.fireRate; }
    float getCooldown() const { return m_cooldown; }
    float getRotation() const { return m_rotation; }
    EntityId getTargetId() const { return m_targetId; }
    TargetingStrategy getTargetingStrategy() const { return m_strategy; }
    void setTargetingStrategy(TargetingStrategy strategy) { m_strategy = strategy; }
    const TowerStats& getStats() const { return m_stats; }

private:
    const Enemy* revalidateTarget(const EnemyList& enemies);

    EntityId m_id{INVALID_ENTITY_ID};
    TowerDefinition m_definition;
    GridCell m_cell;
    Vector2D m_position;
    int m_level{1};
    float m_cooldown{0.0f};
    float m_rotation{0.0f};
    EntityId m_targetId{INVALID_ENTITY_ID};
    TargetingStrategy m_strategy{TargetingStrategy::Closest};
    TowerStats m_stats;
};

using TowerList = std::vector<std::unique_ptr<Tower>>;

} // namespace Bulwark

#endif // TOWER_HPP
