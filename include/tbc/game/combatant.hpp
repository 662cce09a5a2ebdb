#pragma once

/// @file combatant.hpp
/// @brief Combatant: one battle participant with stats, turn state and effects.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tbc/foundation/types.hpp"
#include "tbc/game/faction_types.hpp"
#include "tbc/game/grid_types.hpp"
#include "tbc/game/proficiency_effects.hpp"
#include "tbc/game/skill.hpp"
#include "tbc/game/status_effect.hpp"

namespace tbc::game {

using tbc::foundation::CombatantId;
using tbc::foundation::SkillId;

/// Static combat statistics of a unit.
struct CombatStats {
    int32_t maxHp = 20;
    int32_t attack = 5;
    int32_t defense = 0;
    int32_t speed = 5;
    int32_t luck = 0;
    int32_t finesse = 0;
    int32_t focus = 0;
    int32_t movementPoints = 4;
};

/// A participant in battle.
///
/// HP is clamped to [0, maxHp]; HP 0 means not alive. A dead combatant stays
/// in the turn order until removed but is excluded from targeting, windows
/// and victory counts.
class Combatant {
public:
    Combatant(CombatantId id, std::string name, Faction faction, CombatStats stats,
              GridPos position = {});

    [[nodiscard]] CombatantId Id() const noexcept { return id_; }
    [[nodiscard]] const std::string& Name() const noexcept { return name_; }
    [[nodiscard]] Faction GetFaction() const noexcept { return faction_; }
    void SetFaction(Faction faction) noexcept { faction_ = faction; }

    /// Player-faction units wait for external action requests.
    [[nodiscard]] bool IsPlayerControlled() const noexcept { return faction_ == Faction::Player; }

    [[nodiscard]] const CombatStats& Stats() const noexcept { return stats_; }

    // ── Vitals ──────────────────────────────────────────────────────────

    [[nodiscard]] int32_t Hp() const noexcept { return hp_; }
    [[nodiscard]] int32_t MaxHp() const noexcept { return stats_.maxHp; }
    [[nodiscard]] bool IsAlive() const noexcept { return hp_ > 0; }

    /// Fraction of HP remaining in [0, 1].
    [[nodiscard]] float HpPercent() const noexcept;

    /// Set HP, clamped to [0, maxHp].
    void SetHp(int32_t hp);

    /// Reduce HP by @p amount (ignored when non-positive).
    /// @return The HP actually removed.
    int32_t ApplyDamage(int32_t amount);

    /// Restore HP by @p amount up to maxHp. Dead units cannot be healed.
    /// @return The HP actually restored.
    int32_t ApplyHealing(int32_t amount);

    // ── Position ────────────────────────────────────────────────────────

    [[nodiscard]] GridPos Position() const noexcept { return position_; }
    void SetPosition(GridPos pos) noexcept { position_ = pos; }

    // ── Turn state ──────────────────────────────────────────────────────

    /// Reset movement and action flags, then tick status effects once.
    void StartTurn();

    /// Movement budget for this turn after status multipliers.
    [[nodiscard]] int32_t EffectiveMovementBudget() const;

    [[nodiscard]] int32_t MovementRemaining() const noexcept { return movementRemaining_; }
    [[nodiscard]] bool HasMoved() const noexcept { return hasMoved_; }
    [[nodiscard]] bool HasActed() const noexcept { return hasActed_; }

    /// Whether a move costing @p cost may start now.
    [[nodiscard]] bool CanSpendMovement(int32_t cost) const;

    /// Spend @p cost movement points. Refused when movement is locked,
    /// prevented by a status effect, or the budget is insufficient.
    bool SpendMovement(int32_t cost);

    /// Record that the unit acted. Acting after moving locks further movement.
    void MarkActed();

    [[nodiscard]] bool CanAct() const;

    // ── Skills / proficiency ────────────────────────────────────────────

    void AddSkill(Skill skill);
    [[nodiscard]] const std::vector<Skill>& Skills() const noexcept { return skills_; }
    [[nodiscard]] const Skill* FindSkill(SkillId id) const;

    [[nodiscard]] UnitArchetype Archetype() const noexcept { return archetype_; }
    void SetArchetype(UnitArchetype archetype) noexcept { archetype_ = archetype; }

    /// Proficiency with the equipped weapon family, if any.
    [[nodiscard]] std::optional<ProficiencyTier> Proficiency() const noexcept { return proficiency_; }
    void SetProficiency(std::optional<ProficiencyTier> tier) noexcept { proficiency_ = tier; }

    // ── Status effects ──────────────────────────────────────────────────

    [[nodiscard]] StatusEffectHolder& StatusEffects() noexcept { return statusEffects_; }
    [[nodiscard]] const StatusEffectHolder& StatusEffects() const noexcept { return statusEffects_; }

private:
    CombatantId id_;
    std::string name_;
    Faction faction_;
    CombatStats stats_;
    int32_t hp_;
    GridPos position_;

    int32_t movementRemaining_ = 0;
    bool hasMoved_ = false;
    bool hasActed_ = false;
    bool movementLocked_ = false;

    std::vector<Skill> skills_;
    UnitArchetype archetype_ = UnitArchetype::Soldier;
    std::optional<ProficiencyTier> proficiency_;
    StatusEffectHolder statusEffects_;
};

}  // namespace tbc::game
