/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Tower.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>

namespace Bulwark {

void Tower::place(EntityId id, const TowerDefinition& definition, GridCell cell, const Vector2D& position) {
    m_id = id;
    m_definition = definition;
    m_cell = cell;
    m_position = position;
    m_level = 1;
    m_cooldown = 0.0f;
    m_rotation = 0.0f;
    m_targetId = INVALID_ENTITY_ID;
    m_strategy = definition.targeting;
    m_stats = TowerStats{};
}

void Tower::reset() {
    m_id = INVALID_ENTITY_ID;
    m_definition = TowerDefinition{};
    m_targetId = INVALID_ENTITY_ID;
    m_level = 1;
    m_cooldown = 0.0f;
    m_stats = TowerStats{};
}

float Tower::getRange() const {
    return m_definition.range * std::pow(RANGE_GROWTH, static_cast<float>(m_level - 1));
}

const Enemy* Tower::revalidateTarget(const EnemyList& enemies) {
    const Enemy* target = findEnemyById(enemies, m_targetId);
    if (target != nullptr && isTargetable(*target, m_position, getRange())) {
        return target;
    }
    m_targetId = INVALID_ENTITY_ID;
    return nullptr;
}

std::optional<ProjectileSpawnRequest> Tower::update(float deltaTime, const EnemyList& enemies,
                                                    std::mt19937& rng) {
    if (deltaTime > 0.0f) {
        m_cooldown = std::max(0.0f, m_cooldown - deltaTime);
    }

    const Enemy* target = revalidateTarget(enemies);
    if (target == nullptr) {
        target = selectTarget(m_strategy, m_position, getRange(), enemies);
        if (target == nullptr) {
            return std::nullopt;
        }
        m_targetId = target->getId();
    }

    const Vector2D targetPosition = target->getPosition();
    Vector2D aim = Vector2D::direction(m_position, targetPosition);
    if (aim.lengthSquared() > 0.0f) {
        m_rotation = aim.angle();
    }

    if (m_cooldown > 0.0f) {
        return std::nullopt;
    }
    m_cooldown = m_definition.fireRate;
    assert(m_cooldown >= 0.0f);

    ProjectileSpawnRequest request;
    request.sourceTowerId = m_id;
    request.projectileType = m_definition.projectileType;
    request.origin = m_position;
    request.targetPoint = targetPosition;
    request.targetId = m_targetId;
    request.damage = rollDamage(rng);
    request.damageType = m_definition.damageType;
    request.piercing = m_definition.piercing;
    request.onHit = m_definition.onHit;
    request.splashRadius = m_definition.splashRadius;
    request.chain = m_definition.chain;
    return request;
}

float Tower::getBaseDamageAtLevel() const {
    return m_definition.damage * (1.0f + static_cast<float>(m_level - 1) * DAMAGE_PER_LEVEL);
}

float Tower::rollDamage(std::mt19937& rng) const {
    float damage = getBaseDamageAtLevel();
    const float variance = m_definition.damageVariance;
    if (variance > 0.0f) {
        std::uniform_real_distribution<float> spread(1.0f - variance, 1.0f + variance);
        damage *= spread(rng);
    }
    return std::round(damage);
}

int Tower::getUpgradeCost() const {
    return static_cast<int>(std::floor(static_cast<float>(m_definition.upgradeCost) *
                                       std::pow(UPGRADE_COST_GROWTH, static_cast<float>(m_level - 1))));
}

bool Tower::upgrade() {
    if (!canUpgrade()) {
        return false;
    }
    ++m_level;
    return true;
}

int Tower::getSellValue(float baseRatio, float upgradeRatio) const {
    float value = static_cast<float>(m_definition.cost) * baseRatio +
                  static_cast<float>(m_level - 1) * static_cast<float>(m_definition.upgradeCost) * upgradeRatio;
    return static_cast<int>(std::floor(value));
}

void Tower::recordHit(float damage, bool killed) {
    m_stats.damageDealt += damage;
    if (killed) {
        ++m_stats.kills;
    }
}

} // namespace Bulwark
