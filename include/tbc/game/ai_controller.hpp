#pragma once

/// @file ai_controller.hpp
/// @brief Asynchronous per-unit AI turn: think, move, act, complete.

#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>

#include "tbc/foundation/cancellation.hpp"
#include "tbc/foundation/game_result.hpp"
#include "tbc/foundation/random_source.hpp"
#include "tbc/foundation/timer_scheduler.hpp"
#include "tbc/game/action_executor.hpp"
#include "tbc/game/ai_behavior.hpp"
#include "tbc/game/encounter_config.hpp"

namespace tbc::game {

/// Runs one AI unit's turn and reports completion.
class IAITurnRunner {
public:
    using CompletionCallback = std::function<void(CombatantId)>;

    virtual ~IAITurnRunner() = default;

    /// Start @p id's turn. @p onComplete fires at most once, and never after
    /// CancelTurn(@p id).
    virtual tbc::foundation::GameResult<void> BeginTurn(CombatantId id,
                                                        CompletionCallback onComplete) = 0;

    /// Abort @p id's turn without completing it.
    virtual void CancelTurn(CombatantId id) = 0;

    virtual void CancelAll() = 0;
};

/// Decision pipeline for AI-controlled units.
///
/// A turn is a chain of continuations on the TimerScheduler:
///   1. thinking delay
///   2. validate (alive, still in the window captured at start); a unit
///      whose actions are prevented completes immediately
///   3. choose target and action, then the best reachable cell
///   4. move through the IMovementDriver when a better cell exists
///   5. on arrival re-validate, execute the action, complete
/// Each continuation checks the turn's CancellationToken first.
class AIController final : public IAITurnRunner {
public:
    AIController(CombatantRoster& roster, const FactionRelationshipResolver& factions,
                 TurnOrderEngine& engine, ActionExecutor& executor,
                 tbc::foundation::TimerScheduler& timers, tbc::foundation::RandomSource& rng,
                 AITiming timing = {});

    AIController(const AIController&) = delete;
    AIController& operator=(const AIController&) = delete;

    void SetGridService(const IGridService* grid) noexcept { grid_ = grid; }
    void SetMovementDriver(IMovementDriver* movement) noexcept { movement_ = movement; }

    void AssignBehavior(CombatantId id, AIBehavior behavior);
    void ClearBehavior(CombatantId id);
    [[nodiscard]] const AIBehavior* BehaviorFor(CombatantId id) const;

    tbc::foundation::GameResult<void> BeginTurn(CombatantId id,
                                                CompletionCallback onComplete) override;
    void CancelTurn(CombatantId id) override;
    void CancelAll() override;

    [[nodiscard]] bool IsTurnInProgress(CombatantId id) const { return turns_.count(id) > 0; }

private:
    struct TurnState {
        tbc::foundation::CancellationSource cancellation;
        CompletionCallback onComplete;
        std::optional<tbc::foundation::TimerId> thinkingTimer;
        bool wasInWindow = false;
        bool completed = false;
    };
    using TurnPtr = std::shared_ptr<TurnState>;

    void Decide(CombatantId id, const TurnPtr& turn);
    void Act(CombatantId id, const TurnPtr& turn, CombatantId targetId,
             AIActionChoice choice, bool moved);
    void Complete(CombatantId id, const TurnPtr& turn, std::string_view reason);

    /// Alive, window captured at start, and still in the current window.
    [[nodiscard]] bool StillActive(CombatantId id, const TurnState& turn) const;

    CombatantRoster& roster_;
    const FactionRelationshipResolver& factions_;
    TurnOrderEngine& engine_;
    ActionExecutor& executor_;
    tbc::foundation::TimerScheduler& timers_;
    tbc::foundation::RandomSource& rng_;
    AITiming timing_;
    const IGridService* grid_ = nullptr;
    IMovementDriver* movement_ = nullptr;

    std::unordered_map<CombatantId, AIBehavior> behaviors_;
    std::unordered_map<CombatantId, TurnPtr> turns_;
};

}  // namespace tbc::game
