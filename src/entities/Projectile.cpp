/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Projectile.hpp"
#include <algorithm>

namespace Bulwark {

void Projectile::launch(EntityId id, const ProjectileDefinition& definition,
                        const ProjectileSpawnRequest& request) {
    m_id = id;
    m_type = definition.name;
    m_sourceTowerId = request.sourceTowerId;
    m_targetId = definition.homing ? request.targetId : INVALID_ENTITY_ID;

    m_position = request.origin;
    m_previousPosition = request.origin;
    m_targetPoint = request.targetPoint;
    m_direction = Vector2D::direction(request.origin, request.targetPoint);

    m_speed = definition.speed;
    m_size = definition.size;
    m_damage = request.damage;
    m_damageType = request.damageType;
    m_onHit = request.onHit;
    m_splashRadius = request.splashRadius;
    m_chain = request.chain;

    m_age = 0.0f;
    m_lifetime = definition.lifetime;
    m_distanceTraveled = 0.0f;
    m_maxDistance = definition.maxDistance;

    m_piercing = definition.piercing || request.piercing;
    m_homing = definition.homing;
    m_hasHit = false;
    m_dead = false;
    m_hitIds.clear();
}

void Projectile::reset() {
    m_id = INVALID_ENTITY_ID;
    m_type.clear();
    m_sourceTowerId = INVALID_ENTITY_ID;
    m_targetId = INVALID_ENTITY_ID;
    m_onHit.reset();
    m_chain.reset();
    m_hasHit = false;
    m_dead = false;
    m_hitIds.clear();
}

void Projectile::update(float deltaTime, const EnemyList& enemies) {
    if (m_dead || deltaTime < 0.0f) {
        return;
    }
    m_previousPosition = m_position;

    m_age += deltaTime;
    if (m_age >= m_lifetime) {
        m_dead = true;
        return;
    }

    float step = m_speed * deltaTime;

    if (m_homing && m_targetId != INVALID_ENTITY_ID) {
        const Enemy* target = findEnemyById(enemies, m_targetId);
        if (target != nullptr && !target->isDead()) {
            m_targetPoint = target->getPosition();
            Vector2D toTarget = m_targetPoint - m_position;
            float distance = toTarget.length();
            if (distance > 0.0f) {
                m_direction = toTarget * (1.0f / distance);
            }
            // Homing shots stop on the target instead of overshooting it
            step = std::min(step, distance);
        } else {
            m_targetId = INVALID_ENTITY_ID;
        }
    }

    Vector2D displacement = m_direction * step;
    m_position += displacement;
    m_distanceTraveled += displacement.length();

    if (m_distanceTraveled >= m_maxDistance) {
        m_dead = true;
    }
}

bool Projectile::canHit(EntityId enemyId) const {
    if (m_dead) {
        return false;
    }
    return std::find(m_hitIds.begin(), m_hitIds.end(), enemyId) == m_hitIds.end();
}

void Projectile::markStruck(EntityId enemyId) {
    if (std::find(m_hitIds.begin(), m_hitIds.end(), enemyId) == m_hitIds.end()) {
        m_hitIds.push_back(enemyId);
    }
}

void Projectile::hit(EntityId enemyId) {
    m_hasHit = true;
    m_hitIds.push_back(enemyId);
    if (!m_piercing) {
        m_dead = true;
    }
}

} // namespace Bulwark
