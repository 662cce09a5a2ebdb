#pragma once

/// @file turn_order_engine.hpp
/// @brief TurnOrderEngine: initiative order, turn windows, rounds and victory.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "tbc/foundation/game_result.hpp"
#include "tbc/game/battle_events.hpp"
#include "tbc/game/battle_services.hpp"
#include "tbc/game/combatant_roster.hpp"
#include "tbc/game/encounter_config.hpp"
#include "tbc/game/faction_relationship_resolver.hpp"

namespace tbc::game {

/// Receives control whenever a non-player window is announced.
///
/// Implementations must not call back into the engine synchronously from
/// OnAIWindowReady(); turns start on a later timer tick.
class IAITurnDriver {
public:
    virtual ~IAITurnDriver() = default;

    /// The current window belongs to an AI-controlled faction.
    virtual void OnAIWindowReady() = 0;

    /// Abort all in-flight AI work without ending any turn.
    virtual void CancelAll() = 0;
};

enum class EngineState : uint8_t {
    NotStarted,
    WindowActive,
    CombatOver
};

std::string_view engineStateName(EngineState state);

/// Top-level combat state machine.
///
/// Owns the initiative order (a list of CombatantId resolved through the
/// roster), the cursor into it, the round counter and the current turn
/// window. A window is the run of consecutive same-faction living units
/// starting at the cursor; units that finish their turn move to the back of
/// the order, so the slice [cursor, roundEnd) is always "still due this
/// round". When it is exhausted the round wraps and board hazards tick once.
///
/// Example:
/// @code
///   TurnOrderEngine engine(roster, factions, &grid);
///   engine.SetAITurnDriver(&sequencer);
///   engine.Initialize(roster.Ids(), encounter);
///   for (auto id : engine.GetCurrentWindow()) { ... }
///   engine.EndTurn(playerId);
/// @endcode
class TurnOrderEngine {
public:
    TurnOrderEngine(CombatantRoster& roster, const FactionRelationshipResolver& factions,
                    IHazardService* hazards = nullptr);

    TurnOrderEngine(const TurnOrderEngine&) = delete;
    TurnOrderEngine& operator=(const TurnOrderEngine&) = delete;

    void SetAITurnDriver(IAITurnDriver* driver) noexcept { aiDriver_ = driver; }
    void SetHazardService(IHazardService* hazards) noexcept { hazards_ = hazards; }

    /// Reset all state, sort @p units by initiative and open the first window.
    /// Fails with EmptyRoster when no known unit is given.
    tbc::foundation::GameResult<void> Initialize(const std::vector<CombatantId>& units,
                                                 EncounterConfiguration config = {});

    /// Add a unit created after Initialize(). While combat runs it is slotted
    /// by speed among the units still due this round.
    tbc::foundation::GameResult<void> RegisterUnit(CombatantId id);

    /// Remove a unit from the order and the current window.
    tbc::foundation::GameResult<void> UnregisterUnit(CombatantId id);

    /// Finish @p id's turn: hazard damage, re-queue at the back, then
    /// advance or re-announce the window.
    tbc::foundation::GameResult<void> EndTurn(CombatantId id);

    /// Report that @p id's HP changed from @p oldHp; handles death.
    void OnCombatantHpChanged(CombatantId id, int32_t oldHp);

    /// Evaluate the victory condition. Raises combatEnded once.
    bool IsCombatOver();

    [[nodiscard]] bool IsUnitInCurrentWindow(CombatantId id) const;
    [[nodiscard]] const std::vector<CombatantId>& GetCurrentWindow() const noexcept { return window_; }

    /// The full initiative order, dead units included.
    [[nodiscard]] const std::vector<CombatantId>& GetAllUnits() const noexcept { return order_; }

    /// Faction of the current window, if one is open.
    [[nodiscard]] std::optional<Faction> WindowFaction() const noexcept { return windowFaction_; }

    /// Winner once combat is over: true for the player side.
    [[nodiscard]] std::optional<bool> Outcome() const noexcept { return outcome_; }

    [[nodiscard]] EngineState State() const noexcept { return state_; }
    [[nodiscard]] int32_t Round() const noexcept { return round_; }
    [[nodiscard]] std::size_t Cursor() const noexcept { return cursor_; }
    [[nodiscard]] const EncounterConfiguration& Encounter() const noexcept { return config_; }

    [[nodiscard]] BattleEvents& events() noexcept { return events_; }

private:
    /// Initiative comparison: speed descending, player first on ties.
    [[nodiscard]] bool ActsBefore(const Combatant& a, const Combatant& b) const;

    void AdvanceToNextWindow();
    void StartNextRound();
    void BuildWindow();
    void StartWindowTurns();
    void AnnounceWindow();
    void DispatchWindow();

    /// Returns true when combat is (now) over.
    bool EvaluateVictory();
    void FinishCombat(bool playerVictory);

    /// Index of @p id in order_, if present.
    [[nodiscard]] std::optional<std::size_t> IndexOf(CombatantId id) const;

    /// Erase order_[index] keeping cursor and round boundary aligned.
    void EraseAt(std::size_t index);

    bool RemoveFromWindow(CombatantId id);
    void EmitHpChange(const Combatant& unit, int32_t oldHp);

    /// After the window lost a member: advance when empty, else re-announce.
    void ContinueAfterWindowChange();

    CombatantRoster& roster_;
    const FactionRelationshipResolver& factions_;
    IHazardService* hazards_;
    IAITurnDriver* aiDriver_ = nullptr;

    EncounterConfiguration config_;
    EngineState state_ = EngineState::NotStarted;
    std::optional<bool> outcome_;

    std::vector<CombatantId> order_;
    std::size_t cursor_ = 0;
    std::size_t roundEnd_ = 0;
    int32_t round_ = 1;
    int32_t lastHazardRound_ = 1;

    std::vector<CombatantId> window_;
    std::optional<Faction> windowFaction_;

    BattleEvents events_;
};

}  // namespace tbc::game
