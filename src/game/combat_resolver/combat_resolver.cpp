/// @file combat_resolver.cpp
/// @brief CombatResolver implementation.

#include "tbc/game/combat_resolver.hpp"

#include <algorithm>
#include <cmath>

#include "tbc/game/combatant.hpp"

namespace tbc::game {

CombatResolver::CombatResolver(CombatTuning tuning) : tuning_(tuning) {}

// ── Chances ─────────────────────────────────────────────────────────────

float CombatResolver::HitChance(const AttackerProfile& attacker,
                                std::optional<ProficiencyTier> tier) const {
    float chance = tuning_.baseHitChance +
                   static_cast<float>(attacker.finesse) * tuning_.finesseHitFactor +
                   attacker.statusHitModifier;
    if (tier) {
        chance += ProficiencyEffects::HitVarianceBonus(*tier);
    }
    return std::clamp(chance, tuning_.minHitChance, tuning_.maxHitChance);
}

float CombatResolver::ParryChance(const DefenderProfile& target) const {
    float chance = tuning_.baseParryChance +
                   static_cast<float>(target.finesse) * tuning_.finesseParryFactor +
                   target.statusParryModifier;
    return std::clamp(chance, 0.0f, tuning_.maxParryChance);
}

float CombatResolver::CritChance(const AttackerProfile& attacker) const {
    float chance = tuning_.baseCritChance +
                   static_cast<float>(attacker.luck) * tuning_.luckCritFactor +
                   attacker.statusCritModifier;
    return std::clamp(chance, 0.0f, tuning_.maxCritChance);
}

float CombatResolver::CritDefenseChance(const DefenderProfile& target) const {
    float chance = tuning_.baseCritDefense +
                   static_cast<float>(target.focus) * tuning_.focusCritDefenseFactor +
                   target.statusCritDefenseModifier;
    return std::clamp(chance, 0.0f, tuning_.maxCritDefense);
}

// ── Damage ──────────────────────────────────────────────────────────────

int32_t CombatResolver::CalculateDamage(int32_t baseDamage, bool critical,
                                        bool criticalDefended, int32_t defense) const {
    auto damage = baseDamage;
    if (critical && !criticalDefended) {
        // Halves round to even under the default rounding mode.
        damage = static_cast<int32_t>(
            std::nearbyint(static_cast<float>(baseDamage) * tuning_.criticalMultiplier));
    }
    damage -= defense;
    return std::max(damage, tuning_.minimumDamage);
}

// ── Resolve ─────────────────────────────────────────────────────────────

CombatResolutionResult CombatResolver::Resolve(const AttackerProfile& attacker,
                                               const DefenderProfile& target,
                                               int32_t baseDamage,
                                               std::optional<ProficiencyTier> tier,
                                               tbc::foundation::RandomSource& rng) const {
    CombatResolutionResult result;

    auto hitRoll = rng.rollPercent();
    if (hitRoll > HitChance(attacker, tier)) {
        return result;
    }
    result.hit = true;

    auto parryRoll = rng.rollPercent();
    if (parryRoll <= ParryChance(target)) {
        result.parried = true;
        return result;
    }

    auto critRoll = rng.rollPercent();
    auto critDefenseRoll = rng.rollPercent();
    result.criticalHit = critRoll <= CritChance(attacker);
    result.criticalDefended = critDefenseRoll <= CritDefenseChance(target);

    result.finalDamage = CalculateDamage(baseDamage, result.criticalHit,
                                         result.criticalDefended, target.defense);
    return result;
}

// ── Profile builders ────────────────────────────────────────────────────

AttackerProfile CombatResolver::BuildAttackerProfile(const Combatant& attacker,
                                                     std::optional<ProficiencyTier> tier) {
    const auto& stats = attacker.Stats();
    auto mods = attacker.StatusEffects().Aggregate();

    AttackerProfile profile;
    profile.finesse = tier ? ProficiencyEffects::ApplyStatEfficiency(stats.finesse, *tier)
                           : stats.finesse;
    profile.luck = tier ? ProficiencyEffects::ApplyStatEfficiency(stats.luck, *tier)
                        : stats.luck;
    profile.statusHitModifier = mods.hit;
    profile.statusCritModifier = mods.crit;
    return profile;
}

DefenderProfile CombatResolver::BuildDefenderProfile(const Combatant& target) {
    const auto& stats = target.Stats();
    auto mods = target.StatusEffects().Aggregate();

    DefenderProfile profile;
    profile.finesse = stats.finesse;
    profile.focus = stats.focus;
    profile.defense = stats.defense;
    profile.statusParryModifier = mods.parry;
    profile.statusCritDefenseModifier = mods.critDefense;
    return profile;
}

}  // namespace tbc::game
