/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_TYPES_HPP
#define ENTITY_TYPES_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace Bulwark {

/**
 * @brief Stable identity of a live enemy, tower or projectile
 *
 * Ids are handed out per manager and never reused within a simulation, so a
 * stale id held by a tower or projectile simply fails to resolve.
 */
using EntityId = uint64_t;
inline constexpr EntityId INVALID_ENTITY_ID = 0;

enum class DamageType : uint8_t {
    Normal = 0,
    Fire,
    Ice,
    Magic,
    Poison,
    Lightning,
    COUNT
};

inline constexpr size_t DAMAGE_TYPE_COUNT = static_cast<size_t>(DamageType::COUNT);

// Fraction of incoming damage ignored, per damage type, each in [0, 1)
using ResistanceTable = std::array<float, DAMAGE_TYPE_COUNT>;

constexpr const char* toString(DamageType type) noexcept {
    switch (type) {
        case DamageType::Normal: return "normal";
        case DamageType::Fire: return "fire";
        case DamageType::Ice: return "ice";
        case DamageType::Magic: return "magic";
        case DamageType::Poison: return "poison";
        case DamageType::Lightning: return "lightning";
        default: return "unknown";
    }
}

inline std::optional<DamageType> damageTypeFromString(std::string_view name) {
    for (size_t i = 0; i < DAMAGE_TYPE_COUNT; ++i) {
        auto type = static_cast<DamageType>(i);
        if (name == toString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

// Placement grid coordinate (column, row)
struct GridCell {
    int col{0};
    int row{0};

    bool operator==(const GridCell& other) const { return col == other.col && row == other.row; }
    bool operator<(const GridCell& other) const {
        return row != other.row ? row < other.row : col < other.col;
    }
};

} // namespace Bulwark

#endif // ENTITY_TYPES_HPP
