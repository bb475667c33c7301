/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STATUS_EFFECT_SET_HPP
#define STATUS_EFFECT_SET_HPP

#include "entities/EntityDefinitions.hpp"

namespace Bulwark {

/**
 * @brief Timed slow / stun / burn / freeze modifiers carried by one enemy
 *
 * Re-applying an active effect keeps the longer of the remaining and the new
 * duration; the slow factor and burn rate are overwritten by the latest
 * application. Freeze pins the speed multiplier to 0 on its own timer and
 * leaves any slow untouched, so the slow resumes once the freeze thaws.
 */
class StatusEffectSet {
public:
    void applySlow(float factor, float duration);
    void applyStun(float duration);
    void applyBurn(float damagePerSecond, float duration);
    void applyFreeze(float duration);

    // Dispatches a data-driven on-hit effect to the matching apply call
    void apply(const OnHitEffect& effect);

    /**
     * @brief Ages every effect by deltaTime and expires the finished ones
     * @return Burn damage to deal this tick (0 if burn is not active)
     */
    float update(float deltaTime);

    // Multiplier on base movement speed; stun is reported separately
    float speedMultiplier() const {
        if (isFrozen()) {
            return 0.0f;
        }
        return m_slowRemaining > 0.0f ? m_slowFactor : 1.0f;
    }

    bool isSlowed() const { return m_slowRemaining > 0.0f; }
    bool isStunned() const { return m_stunRemaining > 0.0f; }
    bool isBurning() const { return m_burnRemaining > 0.0f; }
    bool isFrozen() const { return m_freezeRemaining > 0.0f; }
    bool hasAnyEffect() const { return isSlowed() || isStunned() || isBurning() || isFrozen(); }

    float remaining(StatusEffectType type) const;
    float burnRate() const { return isBurning() ? m_burnDamagePerSecond : 0.0f; }

    void clear();

private:
    float m_slowFactor{1.0f};
    float m_slowRemaining{0.0f};
    float m_stunRemaining{0.0f};
    float m_burnDamagePerSecond{0.0f};
    float m_burnRemaining{0.0f};
    float m_freezeRemaining{0.0f};
};

} // namespace Bulwark

#endif // STATUS_EFFECT_SET_HPP
