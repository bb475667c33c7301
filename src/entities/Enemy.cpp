/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Enemy.hpp"
#include <algorithm>
#include <cassert>

namespace Bulwark {

void Enemy::spawn(EntityId id, const EnemyDefinition& definition, float maxHealth,
                  std::shared_ptr<const WaypointPath> path) {
    m_id = id;
    m_type = definition.name;
    m_follower.reset(std::move(path));
    m_effects.clear();

    m_maxHealth = std::max(1.0f, maxHealth);
    m_health = m_maxHealth;
    m_armor = std::max(0.0f, definition.armor);
    m_resistances = definition.resistances;
    m_speed = definition.speed;
    m_size = definition.size;
    m_bounty = definition.bounty;
    m_spawnCost = definition.spawnCost;
    m_dead = false;
}

void Enemy::reset() {
    m_id = INVALID_ENTITY_ID;
    m_type.clear();
    m_follower.reset(nullptr);
    m_effects.clear();
    m_health = 0.0f;
    m_maxHealth = 0.0f;
    m_dead = false;
}

float Enemy::takeDamage(float amount, DamageType type) {
    if (m_dead || amount <= 0.0f) {
        return 0.0f;
    }

    float effective = std::max(1.0f, amount - m_armor);
    effective *= 1.0f - getResistance(type);
    return removeHealth(effective);
}

float Enemy::takeTrueDamage(float amount) {
    if (m_dead || amount <= 0.0f) {
        return 0.0f;
    }
    return removeHealth(amount);
}

float Enemy::removeHealth(float amount) {
    float applied = std::min(amount, m_health);
    m_health -= applied;
    if (m_health <= 0.0f) {
        m_health = 0.0f;
        m_dead = true;
    }
    assert(m_health >= 0.0f && m_health <= m_maxHealth);
    return applied;
}

void Enemy::heal(float amount) {
    if (m_dead || amount <= 0.0f) {
        return;
    }
    m_health = std::min(m_maxHealth, m_health + amount);
}

float Enemy::getEffectiveSpeed() const {
    if (m_effects.isStunned()) {
        return 0.0f;
    }
    return m_speed * m_effects.speedMultiplier();
}

void Enemy::update(float deltaTime) {
    if (m_dead || hasReachedEnd()) {
        return;
    }

    float burnDamage = m_effects.update(deltaTime);
    if (burnDamage > 0.0f) {
        takeTrueDamage(burnDamage);
        if (m_dead) {
            return;
        }
    }

    if (!m_effects.isStunned()) {
        [[maybe_unused]] const size_t indexBefore = m_follower.pathIndex();
        m_follower.advance(getEffectiveSpeed(), deltaTime);
        assert(m_follower.pathIndex() >= indexBefore);
    }
}

const Enemy* findEnemyById(const EnemyList& enemies, EntityId id) {
    if (id == INVALID_ENTITY_ID) {
        return nullptr;
    }
    auto it = std::find_if(enemies.begin(), enemies.end(),
                           [id](const std::unique_ptr<Enemy>& enemy) {
                               return enemy->getId() == id;
                           });
    return it == enemies.end() ? nullptr : it->get();
}

} // namespace Bulwark
