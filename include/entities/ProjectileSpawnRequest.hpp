/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PROJECTILE_SPAWN_REQUEST_HPP
#define PROJECTILE_SPAWN_REQUEST_HPP

#include "entities/EntityDefinitions.hpp"
#include "entities/EntityTypes.hpp"
#include "utils/Vector2D.hpp"
#include <optional>
#include <string>

namespace Bulwark {

/**
 * @brief What a tower emits when it fires
 *
 * Towers never touch enemies; the simulation turns this descriptor into a
 * pooled Projectile that does the damage.
 */
struct ProjectileSpawnRequest {
    EntityId sourceTowerId{INVALID_ENTITY_ID};
    std::string projectileType;
    Vector2D origin;
    Vector2D targetPoint;                 // target position at fire time
    EntityId targetId{INVALID_ENTITY_ID}; // followed when the projectile homes
    float damage{0.0f};
    DamageType damageType{DamageType::Normal};
    bool piercing{false};                 // tower-granted, OR'ed with the projectile's own flag
    std::optional<OnHitEffect> onHit;
    float splashRadius{0.0f};
    std::optional<ChainSpec> chain;
};

} // namespace Bulwark

#endif // PROJECTILE_SPAWN_REQUEST_HPP
