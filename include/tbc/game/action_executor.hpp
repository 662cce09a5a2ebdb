#pragma once

/// @file action_executor.hpp
/// @brief Validated application of attacks, skills, support and movement.

#include <cstdint>
#include <vector>

#include "tbc/foundation/game_result.hpp"
#include "tbc/foundation/random_source.hpp"
#include "tbc/game/battle_services.hpp"
#include "tbc/game/combat_resolver.hpp"
#include "tbc/game/combatant_roster.hpp"
#include "tbc/game/faction_relationship_resolver.hpp"
#include "tbc/game/turn_order_engine.hpp"

namespace tbc::game {

/// Shared executor used by player requests and AI turns alike.
///
/// Every entry point validates first and mutates only on success:
///   - the engine is running and the actor is in the current window
///   - the actor is alive, has not acted and is not action-prevented
///   - the target is alive, has the right relationship and is within reach
/// Damage goes through CombatResolver; HP changes and deaths are reported to
/// the TurnOrderEngine, which raises the notifications.
class ActionExecutor {
public:
    ActionExecutor(CombatantRoster& roster, const FactionRelationshipResolver& factions,
                   const CombatResolver& resolver, TurnOrderEngine& engine,
                   tbc::foundation::RandomSource& rng, IGridService* grid = nullptr);

    void SetGridService(IGridService* grid) noexcept { grid_ = grid; }

    /// Basic attack against an adjacent hostile unit (Chebyshev distance 1).
    tbc::foundation::GameResult<CombatResolutionResult> ExecuteMeleeAttack(
        CombatantId attacker, CombatantId target);

    /// Damage skill against a hostile unit within the skill's range.
    tbc::foundation::GameResult<CombatResolutionResult> ExecuteSkill(
        CombatantId user, SkillId skill, CombatantId target);

    /// Support skill on an allied unit (the user included) within range.
    /// @return The HP restored.
    tbc::foundation::GameResult<int32_t> ExecuteSupport(CombatantId user, SkillId skill,
                                                        CombatantId ally);

    /// Move @p id to @p destination, spending one movement point per step.
    /// @return The path walked, excluding the start cell.
    tbc::foundation::GameResult<std::vector<GridPos>> MoveUnit(CombatantId id,
                                                               GridPos destination);

private:
    tbc::foundation::GameResult<Combatant*> ValidateActor(CombatantId id);
    tbc::foundation::GameResult<Combatant*> ValidateTarget(const Combatant& actor,
                                                           CombatantId target,
                                                           bool hostile, int32_t reach);

    CombatResolutionResult Strike(Combatant& attacker, Combatant& target, int32_t basePower);

    CombatantRoster& roster_;
    const FactionRelationshipResolver& factions_;
    const CombatResolver& resolver_;
    TurnOrderEngine& engine_;
    tbc::foundation::RandomSource& rng_;
    IGridService* grid_;
};

}  // namespace tbc::game
