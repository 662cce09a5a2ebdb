#pragma once

/// @file battle_events.hpp
/// @brief Typed notification channel owned by the turn order engine.

#include <cstdint>
#include <vector>

#include "tbc/foundation/signal.hpp"
#include "tbc/foundation/types.hpp"
#include "tbc/game/combat_resolver.hpp"

namespace tbc::game {

using tbc::foundation::CombatantId;
using tbc::foundation::SkillId;
using tbc::foundation::Signal;

/// Every observable battle event.
///
/// Emission is fire-and-forget: the engine never waits on a subscriber.
/// Subscribers that outlive a battle should hold ScopedConnection handles.
struct BattleEvents {
    /// (unit, old HP, new HP)
    Signal<CombatantId, int32_t, int32_t> hpChanged;
    Signal<CombatantId> unitDefeated;
    Signal<const std::vector<CombatantId>&> turnWindowChanged;
    Signal<CombatantId> currentUnitChanged;
    Signal<CombatantId> unitTurnEnded;
    Signal<int32_t> roundStarted;
    /// (attacker, target, outcome)
    Signal<CombatantId, CombatantId, const CombatResolutionResult&> attackResolved;
    Signal<CombatantId, SkillId> skillUsed;
    /// Raised once per battle; true when the player side won.
    Signal<bool> combatEnded;

    /// Drop every subscriber of every signal.
    void disconnectAll() {
        hpChanged.disconnectAll();
        unitDefeated.disconnectAll();
        turnWindowChanged.disconnectAll();
        currentUnitChanged.disconnectAll();
        unitTurnEnded.disconnectAll();
        roundStarted.disconnectAll();
        attackResolved.disconnectAll();
        skillUsed.disconnectAll();
        combatEnded.disconnectAll();
    }
};

}  // namespace tbc::game
