#pragma once

/// @file battle_statistics.hpp
/// @brief Per-combatant battle statistics gathered from BattleEvents.

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "tbc/foundation/signal.hpp"
#include "tbc/game/battle_events.hpp"

namespace tbc::game {

/// Counters for one combatant.
struct CombatantStatistics {
    int32_t damageDealt = 0;
    int32_t damageTaken = 0;
    int32_t kills = 0;
    int32_t attacks = 0;
    int32_t criticalHits = 0;
    int32_t misses = 0;
    int32_t parried = 0;     ///< Own attacks that were parried.
    int32_t skillsUsed = 0;
    int32_t turnsTaken = 0;
};

/// Subscribes to a BattleEvents channel and accumulates statistics.
///
/// Kills are credited to the last unit that landed an attack on the victim.
/// Must not outlive the BattleEvents it observes.
class BattleStatistics {
public:
    explicit BattleStatistics(BattleEvents& events);

    BattleStatistics(const BattleStatistics&) = delete;
    BattleStatistics& operator=(const BattleStatistics&) = delete;

    /// Counters for @p id (zeroes when it never appeared).
    [[nodiscard]] CombatantStatistics For(CombatantId id) const;

    [[nodiscard]] int32_t RoundsPlayed() const noexcept { return rounds_; }
    [[nodiscard]] std::optional<bool> Outcome() const noexcept { return outcome_; }
    [[nodiscard]] int32_t TotalDamage() const noexcept { return totalDamage_; }

    void Reset();

private:
    void OnAttack(CombatantId attacker, CombatantId target, const CombatResolutionResult& result);
    void OnDefeated(CombatantId id);

    std::unordered_map<CombatantId, CombatantStatistics> stats_;
    std::unordered_map<CombatantId, CombatantId> lastAttacker_;
    int32_t rounds_ = 0;
    int32_t totalDamage_ = 0;
    std::optional<bool> outcome_;

    std::vector<tbc::foundation::ScopedConnection> connections_;
};

}  // namespace tbc::game
