/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionResolver.hpp"
#include "collisions/AABB.hpp"
#include <algorithm>
#include <boost/container/small_vector.hpp>
#include <cmath>

namespace Bulwark {

namespace {

HitEvent strike(const Projectile& projectile, Enemy& enemy, float damage, HitKind kind) {
    HitEvent event;
    event.projectileId = projectile.getId();
    event.enemyId = enemy.getId();
    event.sourceTowerId = projectile.getSourceTowerId();
    event.damage = enemy.takeDamage(damage, projectile.getDamageType());
    event.killed = enemy.isDead();
    event.kind = kind;
    return event;
}

} // namespace

std::vector<HitEvent> CollisionResolver::resolve(const ProjectileList& projectiles,
                                                 const EnemyList& enemies) const {
    std::vector<HitEvent> events;

    for (const auto& projectile : projectiles) {
        if (projectile->isDead()) {
            continue;
        }
        const Vector2D& from = projectile->getPreviousPosition();
        const Vector2D& to = projectile->getPosition();
        const float halfSize = projectile->getSize() * 0.5f;

        for (const auto& enemy : enemies) {
            if (!enemy->isActive() || !projectile->canHit(enemy->getId())) {
                continue;
            }
            if (!enemy->getBoundingBox().expanded(halfSize).intersectsSegment(from, to)) {
                continue;
            }

            events.push_back(strike(*projectile, *enemy, projectile->getDamage(), HitKind::Direct));
            projectile->hit(enemy->getId());

            const auto& onHit = projectile->getOnHitEffect();
            if (onHit && !enemy->isDead()) {
                enemy->getStatusEffects().apply(*onHit);
            }
            if (projectile->getSplashRadius() > 0.0f) {
                applySplash(*projectile, *enemy, enemies, events);
            }
            if (projectile->getChain()) {
                applyChain(*projectile, *enemy, enemies, events);
            }
            break;
        }
    }
    return events;
}

void CollisionResolver::applySplash(const Projectile& projectile, const Enemy& center,
                                    const EnemyList& enemies, std::vector<HitEvent>& events) const {
    const float radius = projectile.getSplashRadius();
    const Vector2D origin = center.getPosition();

    for (const auto& enemy : enemies) {
        if (enemy.get() == &center || !enemy->isActive()) {
            continue;
        }
        if (Vector2D::distanceSquared(origin, enemy->getPosition()) <= radius * radius) {
            events.push_back(strike(projectile, *enemy, projectile.getDamage(), HitKind::Splash));
        }
    }
}

void CollisionResolver::applyChain(Projectile& projectile, const Enemy& first,
                                   const EnemyList& enemies, std::vector<HitEvent>& events) const {
    const ChainSpec& chain = *projectile.getChain();
    const float rangeSquared = chain.chainRange * chain.chainRange;

    // Enemies the projectile already struck, the first one included, are never chained to
    const auto& previous = projectile.getStruckIds();
    boost::container::small_vector<EntityId, 8> struck(previous.begin(), previous.end());
    if (std::find(struck.begin(), struck.end(), first.getId()) == struck.end()) {
        struck.push_back(first.getId());
    }
    Vector2D from = first.getPosition();

    for (int jump = 1; jump <= chain.maxChains; ++jump) {
        Enemy* next = nullptr;
        float bestDistance = rangeSquared;
        for (const auto& enemy : enemies) {
            if (!enemy->isActive() ||
                std::find(struck.begin(), struck.end(), enemy->getId()) != struck.end()) {
                continue;
            }
            float distance = Vector2D::distanceSquared(from, enemy->getPosition());
            if (distance <= bestDistance && (next == nullptr || distance < bestDistance)) {
                next = enemy.get();
                bestDistance = distance;
            }
        }
        if (next == nullptr) {
            break;
        }

        float damage = projectile.getDamage() * std::pow(chain.damageMultiplier, static_cast<float>(jump));
        events.push_back(strike(projectile, *next, damage, HitKind::Chain));
        struck.push_back(next->getId());
        projectile.markStruck(next->getId());
        from = next->getPosition();
    }
}

} // namespace Bulwark
