/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/StatusEffectSet.hpp"
#include <algorithm>

namespace Bulwark {

const char* toString(StatusEffectType type) {
    switch (type) {
        case StatusEffectType::Slow: return "slow";
        case StatusEffectType::Stun: return "stun";
        case StatusEffectType::Burn: return "burn";
        case StatusEffectType::Freeze: return "freeze";
    }
    return "unknown";
}

std::optional<StatusEffectType> statusEffectTypeFromString(const std::string& name) {
    for (auto type : {StatusEffectType::Slow, StatusEffectType::Stun,
                      StatusEffectType::Burn, StatusEffectType::Freeze}) {
        if (name == toString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

void StatusEffectSet::applySlow(float factor, float duration) {
    if (duration <= 0.0f) {
        return;
    }
    m_slowFactor = std::clamp(factor, 0.0f, 1.0f);
    m_slowRemaining = std::max(m_slowRemaining, duration);
}

void StatusEffectSet::applyStun(float duration) {
    if (duration <= 0.0f) {
        return;
    }
    m_stunRemaining = std::max(m_stunRemaining, duration);
}

void StatusEffectSet::applyBurn(float damagePerSecond, float duration) {
    if (duration <= 0.0f) {
        return;
    }
    m_burnDamagePerSecond = std::max(0.0f, damagePerSecond);
    m_burnRemaining = std::max(m_burnRemaining, duration);
}

void StatusEffectSet::applyFreeze(float duration) {
    if (duration <= 0.0f) {
        return;
    }
    m_freezeRemaining = std::max(m_freezeRemaining, duration);
}

void StatusEffectSet::apply(const OnHitEffect& effect) {
    switch (effect.type) {
        case StatusEffectType::Slow:
            applySlow(effect.magnitude, effect.duration);
            break;
        case StatusEffectType::Stun:
            applyStun(effect.duration);
            break;
        case StatusEffectType::Burn:
            applyBurn(effect.magnitude, effect.duration);
            break;
        case StatusEffectType::Freeze:
            applyFreeze(effect.duration);
            break;
    }
}

float StatusEffectSet::update(float deltaTime) {
    if (deltaTime <= 0.0f) {
        return 0.0f;
    }

    auto tick = [deltaTime](float& remaining) {
        if (remaining > 0.0f) {
            remaining = std::max(0.0f, remaining - deltaTime);
        }
    };
    tick(m_slowRemaining);
    tick(m_stunRemaining);
    tick(m_burnRemaining);
    tick(m_freezeRemaining);

    if (m_slowRemaining <= 0.0f) {
        m_slowFactor = 1.0f;
    }
    if (m_burnRemaining <= 0.0f) {
        m_burnDamagePerSecond = 0.0f;
        return 0.0f;
    }
    return m_burnDamagePerSecond * deltaTime;
}

float StatusEffectSet::remaining(StatusEffectType type) const {
    switch (type) {
        case StatusEffectType::Slow: return m_slowRemaining;
        case StatusEffectType::Stun: return m_stunRemaining;
        case StatusEffectType::Burn: return m_burnRemaining;
        case StatusEffectType::Freeze: return m_freezeRemaining;
    }
    return 0.0f;
}

void StatusEffectSet::clear() {
    *this = StatusEffectSet{};
}

} // namespace Bulwark
