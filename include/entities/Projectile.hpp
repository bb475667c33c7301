/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PROJECTILE_HPP
#define PROJECTILE_HPP

#include "entities/Enemy.hpp"
#include "entities/EntityDefinitions.hpp"
#include "entities/EntityTypes.hpp"
#include "entities/ProjectileSpawnRequest.hpp"
#include "utils/Vector2D.hpp"
#include <boost/container/small_vector.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Bulwark {

/**
 * @brief Shot travelling from a tower toward a point or a homing target
 *
 * Moves in a straight line fixed at launch unless homing, in which case the
 * heading is re-aimed at the target (looked up by id) every tick while it is
 * alive; once the target is gone the last heading is kept. Expires when its
 * lifetime or travel distance runs out.
 *
 * Hit detection lives in CollisionResolver, which sweeps the path covered by
 * the last update; the projectile only remembers which enemies it already
 * struck so a piercing shot never hits one twice.
 */
class Projectile {
public:
    Projectile() = default;

    void launch(EntityId id, const ProjectileDefinition& definition, const ProjectileSpawnRequest& request);
    void reset();

    void update(float deltaTime, const EnemyList& enemies);

    // Alive and has not struck this enemy before
    bool canHit(EntityId enemyId) const;

    // Registers a hit; non-piercing projectiles die on their first one
    void hit(EntityId enemyId);

    // Records an enemy damaged indirectly (chain) so it is never struck again
    void markStruck(EntityId enemyId);

    EntityId getId() const { return m_id; }
    const std::string& getType() const { return m_type; }
    EntityId getSourceTowerId() const { return m_sourceTowerId; }
    EntityId getTargetId() const { return m_targetId; }

    const Vector2D& getPosition() const { return m_position; }
    // Where the last update started; equals the position until the first move
    const Vector2D& getPreviousPosition() const { return m_previousPosition; }
    const Vector2D& getDirection() const { return m_direction; }
    const Vector2D& getTargetPoint() const { return m_targetPoint; }
    float getRotation() const { return m_direction.angle(); }
    float getSize() const { return m_size; }

    float getDamage() const { return m_damage; }
    DamageType getDamageType() const { return m_damageType; }
    const std::optional<OnHitEffect>& getOnHitEffect() const { return m_onHit; }
    float getSplashRadius() const { return m_splashRadius; }
    const std::optional<ChainSpec>& getChain() const { return m_chain; }

    bool isPiercing() const { return m_piercing; }
    bool isHoming() const { return m_homing; }
    bool hasHit() const { return m_hasHit; }
    bool isDead() const { return m_dead; }
    size_t getHitCount() const { return m_hitIds.size(); }
    const boost::container::small_vector<EntityId, 4>& getStruckIds() const { return m_hitIds; }

    float getAge() const { return m_age; }
    float getDistanceTraveled() const { return m_distanceTraveled; }

private:
    EntityId m_id{INVALID_ENTITY_ID};
    std::string m_type;
    EntityId m_sourceTowerId{INVALID_ENTITY_ID};
    EntityId m_targetId{INVALID_ENTITY_ID};

    Vector2D m_position;
    Vector2D m_previousPosition;
    Vector2D m_direction;
    Vector2D m_targetPoint;

    float m_speed{0.0f};
    float m_size{0.0f};
    float m_damage{0.0f};
    DamageType m_damageType{DamageType::Normal};
    std::optional<OnHitEffect> m_onHit;
    float m_splashRadius{0.0f};
    std::optional<ChainSpec> m_chain;

    float m_age{0.0f};
    float m_lifetime{0.0f};
    float m_distanceTraveled{0.0f};
    float m_maxDistance{0.0f};

    bool m_piercing{false};
    bool m_homing{false};
    bool m_hasHit{false};
    bool m_dead{false};

    boost::container::small_vector<EntityId, 4> m_hitIds;
};

using ProjectileList = std::vector<std::unique_ptr<Projectile>>;

} // namespace Bulwark

#endif // PROJECTILE_HPP
