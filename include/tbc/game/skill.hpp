#pragma once

/// @file skill.hpp
/// @brief Skill definitions and archetype suitability rules.

#include <cstdint>
#include <memory>
#include <string>

#include "tbc/foundation/types.hpp"
#include "tbc/game/status_effect.hpp"

namespace tbc::game {

/// Combat archetype; restricts which skills the AI considers.
enum class UnitArchetype : uint8_t {
    Soldier,  ///< Any skill.
    Beast,    ///< Melee-range skills only.
    Magi      ///< Ranged or ground-hazard skills.
};

enum class SkillKind : uint8_t {
    Damage,   ///< Resolved through CombatResolver against a hostile target.
    Support   ///< Heals or buffs an allied target.
};

/// A usable skill.
struct Skill {
    tbc::foundation::SkillId id;
    std::string name;
    SkillKind kind = SkillKind::Damage;
    int32_t range = 1;         ///< Chebyshev reach.
    int32_t power = 0;         ///< Base damage for Damage skills.
    int32_t healAmount = 0;    ///< Healing for Support skills.
    bool createsGroundHazard = false;

    /// Effect applied to the target on a successful use (optional).
    std::shared_ptr<const StatusEffectDefinition> appliesEffect;
    int32_t effectDuration = 0;

    [[nodiscard]] bool IsSupport() const noexcept { return kind == SkillKind::Support; }
    [[nodiscard]] bool IsMeleeRange() const noexcept { return range <= 1; }
};

/// Whether a unit of @p archetype would choose @p skill.
inline bool IsSkillSuitableForArchetype(const Skill& skill, UnitArchetype archetype) {
    switch (archetype) {
        case UnitArchetype::Beast:
            return skill.range <= 1;
        case UnitArchetype::Magi:
            return skill.range > 1 || skill.createsGroundHazard;
        case UnitArchetype::Soldier:
            return true;
    }
    return true;
}

}  // namespace tbc::game
