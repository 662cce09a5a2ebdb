#pragma once

/// @file proficiency_effects.hpp
/// @brief Weapon proficiency tiers and their modifier table.

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tbc::game {

/// Ordinal skill level with a weapon family.
enum class ProficiencyTier : uint8_t {
    Untrained,
    Familiar,
    Trained,
    Competent,
    Proficient,
    Advanced,
    Expert,
    Master,
    Grandmaster,
    Legendary
};

/// Number of proficiency tiers.
constexpr std::size_t kProficiencyTierCount = 10;

/// Modifiers granted by one proficiency tier.
struct ProficiencyModifiers {
    /// Multiplier applied to attacker stats before combat math.
    float statEfficiency = 1.0f;

    /// Flat bonus added to hit chance (percentage points).
    float hitVarianceBonus = 0.0f;

    /// Reduction of fumble chance (percentage points). Not consumed by
    /// CombatResolver yet.
    float fumbleReduction = 0.0f;

    /// Fractional bonus to recovery speed.
    float recoveryBonus = 0.0f;

    /// Fractional bonus to stamina efficiency.
    float staminaBonus = 0.0f;
};

/// Pure lookup of proficiency modifiers.
///
/// Every column is monotonically non-decreasing with tier. A tier value
/// outside the enumeration resolves to the Familiar row (multiplier 1.0,
/// no bonuses).
class ProficiencyEffects {
public:
    [[nodiscard]] static ProficiencyModifiers Lookup(ProficiencyTier tier);

    /// Lookup by raw ordinal, e.g. a value read from configuration.
    [[nodiscard]] static ProficiencyModifiers LookupOrdinal(int ordinal);

    [[nodiscard]] static float StatEfficiency(ProficiencyTier tier) {
        return Lookup(tier).statEfficiency;
    }

    [[nodiscard]] static float HitVarianceBonus(ProficiencyTier tier) {
        return Lookup(tier).hitVarianceBonus;
    }

    [[nodiscard]] static float FumbleReduction(ProficiencyTier tier) {
        return Lookup(tier).fumbleReduction;
    }

    [[nodiscard]] static float RecoveryBonus(ProficiencyTier tier) {
        return Lookup(tier).recoveryBonus;
    }

    [[nodiscard]] static float StaminaBonus(ProficiencyTier tier) {
        return Lookup(tier).staminaBonus;
    }

    /// Scale an integer stat by the tier's efficiency, rounding to nearest.
    [[nodiscard]] static int32_t ApplyStatEfficiency(int32_t stat, ProficiencyTier tier);

    [[nodiscard]] static std::string_view TierName(ProficiencyTier tier);

    /// Parse a tier name as written in configuration files.
    [[nodiscard]] static std::optional<ProficiencyTier> ParseTier(std::string_view name);
};

}  // namespace tbc::game
