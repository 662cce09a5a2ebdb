#pragma once

/// @file ai_window_sequencer.hpp
/// @brief Drives the members of an AI window one at a time with a timeout.

#include <cstdint>
#include <optional>
#include <vector>

#include "tbc/foundation/signal.hpp"
#include "tbc/foundation/timer_scheduler.hpp"
#include "tbc/game/ai_controller.hpp"
#include "tbc/game/encounter_config.hpp"
#include "tbc/game/turn_order_engine.hpp"

namespace tbc::game {

/// IAITurnDriver that runs an AI window strictly sequentially.
///
/// For the head of the current window it waits the inter-unit gap, starts
/// the unit's turn on the runner and arms the decision timeout. Whichever
/// of completion or timeout comes first ends the turn; the other one is
/// ignored through a generation counter, so EndTurn is called exactly once
/// per unit. A unit that dies mid-turn is cancelled without EndTurn since
/// the engine already dropped it from the window.
class AIWindowSequencer final : public IAITurnDriver {
public:
    AIWindowSequencer(TurnOrderEngine& engine, IAITurnRunner& runner,
                      tbc::foundation::TimerScheduler& timers, AITiming timing = {});
    ~AIWindowSequencer() override;

    AIWindowSequencer(const AIWindowSequencer&) = delete;
    AIWindowSequencer& operator=(const AIWindowSequencer&) = delete;

    void OnAIWindowReady() override;
    void CancelAll() override;

    /// The unit whose turn is running, if any.
    [[nodiscard]] std::optional<CombatantId> InFlight() const noexcept { return inFlight_; }

    /// Number of turns forced to end by the decision timeout.
    [[nodiscard]] std::size_t TimeoutCount() const noexcept { return timeouts_; }

private:
    void StartNext();
    void OnUnitComplete(CombatantId id, uint64_t generation);
    void OnTimeout(CombatantId id, uint64_t generation);
    void OnUnitDefeated(CombatantId id);

    /// Stop tracking the in-flight unit; optionally end its turn.
    void Release(CombatantId id, bool endTurn);
    void CancelTimer(std::optional<tbc::foundation::TimerId>& timer);

    TurnOrderEngine& engine_;
    IAITurnRunner& runner_;
    tbc::foundation::TimerScheduler& timers_;
    AITiming timing_;

    std::optional<CombatantId> inFlight_;
    uint64_t generation_ = 0;
    std::optional<tbc::foundation::TimerId> gapTimer_;
    std::optional<tbc::foundation::TimerId> timeoutTimer_;
    std::size_t timeouts_ = 0;

    tbc::foundation::ScopedConnection defeatedConnection_;
    tbc::foundation::ScopedConnection windowConnection_;
};

}  // namespace tbc::game
