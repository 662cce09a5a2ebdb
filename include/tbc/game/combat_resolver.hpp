#pragma once

/// @file combat_resolver.hpp
/// @brief CombatResolver: hit / parry / critical resolution of one attack.

#include <cstdint>
#include <optional>

#include "tbc/foundation/random_source.hpp"
#include "tbc/game/proficiency_effects.hpp"

namespace tbc::game {

class Combatant;

/// Tunable constants of the resolution pipeline.
///
/// All chances are percentage points.
struct CombatTuning {
    float baseHitChance = 90.0f;
    float finesseHitFactor = 1.0f;
    float minHitChance = 5.0f;
    float maxHitChance = 95.0f;

    float baseParryChance = 5.0f;
    float finesseParryFactor = 0.5f;
    float maxParryChance = 30.0f;

    float baseCritChance = 5.0f;
    float luckCritFactor = 0.5f;
    float maxCritChance = 50.0f;

    float baseCritDefense = 10.0f;
    float focusCritDefenseFactor = 0.5f;
    float maxCritDefense = 50.0f;

    float criticalMultiplier = 1.5f;
    int32_t minimumDamage = 1;
};

/// Attacker-side inputs gathered from a combatant.
struct AttackerProfile {
    int32_t finesse = 0;
    int32_t luck = 0;
    float statusHitModifier = 0.0f;
    float statusCritModifier = 0.0f;
};

/// Target-side inputs gathered from a combatant.
struct DefenderProfile {
    int32_t finesse = 0;
    int32_t focus = 0;
    int32_t defense = 0;
    float statusParryModifier = 0.0f;
    float statusCritDefenseModifier = 0.0f;
};

/// Outcome of one attack. Consumed immediately by the action executor.
struct CombatResolutionResult {
    bool hit = false;
    bool parried = false;
    bool criticalHit = false;
    bool criticalDefended = false;
    int32_t finalDamage = 0;

    /// True when damage reached the target.
    [[nodiscard]] bool Landed() const noexcept { return hit && !parried; }
};

/// Pure computation of attack outcomes.
///
/// Holds only its tuning; every random draw comes from the RandomSource
/// passed to Resolve(), in this order: hit, parry, crit, crit defense.
/// A miss consumes one draw and a parry two.
///
/// Pipeline:
///   1. hit chance = clamp(baseHit + finesse*factor + status + tier bonus, 5, 95);
///      roll > chance is a miss (0 damage).
///   2. parry chance = clamp(baseParry + finesse*factor + status, 0, 30);
///      roll <= chance is a parry (0 damage).
///   3. crit and crit-defense are rolled independently.
///   4. damage = base, times the critical multiplier (rounded) when the crit
///      lands undefended, minus defense, floored at minimumDamage.
class CombatResolver {
public:
    explicit CombatResolver(CombatTuning tuning = {});

    [[nodiscard]] CombatResolutionResult Resolve(
        const AttackerProfile& attacker,
        const DefenderProfile& target,
        int32_t baseDamage,
        std::optional<ProficiencyTier> tier,
        tbc::foundation::RandomSource& rng) const;

    [[nodiscard]] float HitChance(const AttackerProfile& attacker,
                                  std::optional<ProficiencyTier> tier) const;
    [[nodiscard]] float ParryChance(const DefenderProfile& target) const;
    [[nodiscard]] float CritChance(const AttackerProfile& attacker) const;
    [[nodiscard]] float CritDefenseChance(const DefenderProfile& target) const;

    /// Damage after the critical step and defense, without any rolls.
    [[nodiscard]] int32_t CalculateDamage(int32_t baseDamage, bool critical,
                                          bool criticalDefended, int32_t defense) const;

    /// Gather attacker inputs; finesse and luck are scaled by the tier's
    /// stat efficiency.
    [[nodiscard]] static AttackerProfile BuildAttackerProfile(
        const Combatant& attacker, std::optional<ProficiencyTier> tier);

    [[nodiscard]] static DefenderProfile BuildDefenderProfile(const Combatant& target);

    [[nodiscard]] const CombatTuning& Tuning() const noexcept { return tuning_; }

private:
    CombatTuning tuning_;
};

}  // namespace tbc::game
