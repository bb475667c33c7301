/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_INFO_HPP
#define COLLISION_INFO_HPP

#include "entities/EntityTypes.hpp"
#include <cstdint>

namespace Bulwark {

enum class HitKind : uint8_t {
    Direct = 0, // projectile box overlapped the enemy
    Splash,     // area damage around a direct hit
    Chain       // jumped on from a previously struck enemy
};

// One application of projectile damage to one enemy
struct HitEvent {
    EntityId projectileId{INVALID_ENTITY_ID};
    EntityId enemyId{INVALID_ENTITY_ID};
    EntityId sourceTowerId{INVALID_ENTITY_ID};
    float damage{0.0f}; // health actually removed
    bool killed{false};
    HitKind kind{HitKind::Direct};
};

} // namespace Bulwark

#endif // COLLISION_INFO_HPP
