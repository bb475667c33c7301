/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENEMY_HPP
#define ENEMY_HPP

#include "collisions/AABB.hpp"
#include "entities/EntityDefinitions.hpp"
#include "entities/EntityTypes.hpp"
#include "entities/PathFollower.hpp"
#include "entities/StatusEffectSet.hpp"
#include "utils/Vector2D.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Bulwark {

/**
 * @brief Path-walking attacker configured from an EnemyDefinition
 *
 * Objects are pooled: spawn() fully re-initialises one and reset() returns it
 * to an inert state before it goes back to the pool.
 *
 * Terminal states are dead (health reached 0, pays bounty) and reached-end
 * (walked off the last waypoint, costs a life). Callers check isDead() first;
 * a dead enemy never also counts as escaped.
 */
class Enemy {
public:
    Enemy() = default;

    void spawn(EntityId id, const EnemyDefinition& definition, float maxHealth,
               std::shared_ptr<const WaypointPath> path);
    void reset();

    /**
     * @brief Applies armor then resistance: max(1, amount - armor) * (1 - resistance)
     * @return Health actually removed (0 if already dead or amount <= 0)
     */
    float takeDamage(float amount, DamageType type);

    /**
     * @brief Removes health directly, ignoring armor and resistances (burn ticks)
     */
    float takeTrueDamage(float amount);

    void heal(float amount);

    // Resolves status effects (burn may kill), then walks unless stunned
    void update(float deltaTime);

    EntityId getId() const { return m_id; }
    const std::string& getType() const { return m_type; }

    Vector2D getPosition() const { return m_follower.position(); }
    float getRotation() const { return m_follower.heading().angle(); }
    AABB getBoundingBox() const { return AABB::fromCenterSize(getPosition(), m_size); }
    float getSize() const { return m_size; }

    float getHealth() const { return m_health; }
    float getMaxHealth() const { return m_maxHealth; }
    float getHealthPercent() const { return m_maxHealth > 0.0f ? m_health / m_maxHealth : 0.0f; }
    float getArmor() const { return m_armor; }
    float getResistance(DamageType type) const { return m_resistances[static_cast<size_t>(type)]; }
    int getBounty() const { return m_bounty; }
    int getSpawnCost() const { return m_spawnCost; }

    float getBaseSpeed() const { return m_speed; }
    float getEffectiveSpeed() const;

    bool isDead() const { return m_dead; }
    bool hasReachedEnd() const { return m_follower.hasReachedEnd(); }
    bool isActive() const { return m_id != INVALID_ENTITY_ID && !m_dead && !hasReachedEnd(); }

    const PathFollower& getPathFollower() const { return m_follower; }
    float getProgressFraction() const { return m_follower.progressFraction(); }
    float getDistanceTraveled() const { return m_follower.distanceTraveled(); }
    float getTotalPathLength() const { return m_follower.totalPathLength(); }

    StatusEffectSet& getStatusEffects() { return m_effects; }
    const StatusEffectSet& getStatusEffects() const { return m_effects; }

private:
    float removeHealth(float amount);

    EntityId m_id{INVALID_ENTITY_ID};
    std::string m_type;
    PathFollower m_follower;
    StatusEffectSet m_effects;

    float m_health{0.0f};
    float m_maxHealth{0.0f};
    float m_armor{0.0f};
    ResistanceTable m_resistances{};
    float m_speed{0.0f};
    float m_size{0.0f};
    int m_bounty{0};
    int m_spawnCost{0};
    bool m_dead{false};
};

using EnemyList = std::vector<std::unique_ptr<Enemy>>;

// Live enemy with the given id, or nullptr
const Enemy* findEnemyById(const EnemyList& enemies, EntityId id);

} // namespace Bulwark

#endif // ENEMY_HPP
