/// @file ai_window_sequencer.cpp
/// @brief AIWindowSequencer implementation.

#include "tbc/game/ai_window_sequencer.hpp"

#include <algorithm>
#include <string>

#include "tbc/foundation/game_logger.hpp"

namespace tbc::game {

using tbc::foundation::LogCategory;

AIWindowSequencer::AIWindowSequencer(TurnOrderEngine& engine, IAITurnRunner& runner,
                                     tbc::foundation::TimerScheduler& timers, AITiming timing)
    : engine_(engine), runner_(runner), timers_(timers), timing_(timing) {
    defeatedConnection_ = tbc::foundation::connectScoped(
        engine_.events().unitDefeated, [this](CombatantId id) { OnUnitDefeated(id); });
    windowConnection_ = tbc::foundation::connectScoped(
        engine_.events().turnWindowChanged, [this](const std::vector<CombatantId>& window) {
            // A unit removed from the battle mid-turn is dropped without EndTurn.
            if (inFlight_ && std::find(window.begin(), window.end(), *inFlight_) == window.end()) {
                runner_.CancelTurn(*inFlight_);
                Release(*inFlight_, false);
            }
        });
}

AIWindowSequencer::~AIWindowSequencer() {
    CancelAll();
}

void AIWindowSequencer::OnAIWindowReady() {
    if (inFlight_) {
        if (engine_.IsUnitInCurrentWindow(*inFlight_)) {
            return;
        }
        runner_.CancelTurn(*inFlight_);
        Release(*inFlight_, false);
    }
    if (gapTimer_) {
        return;
    }
    auto timer = timers_.scheduleAfter(timing_.interUnitGap, [this] {
        gapTimer_.reset();
        StartNext();
    });
    if (timer.hasError()) {
        TBC_LOG_ERROR(LogCategory::AI,
                      "Cannot schedule AI window step: " + std::string(timer.error().message()));
        return;
    }
    gapTimer_ = timer.value();
}

void AIWindowSequencer::StartNext() {
    if (inFlight_ || engine_.State() != EngineState::WindowActive) {
        return;
    }
    const auto& window = engine_.GetCurrentWindow();
    auto faction = engine_.WindowFaction();
    if (window.empty() || !faction || *faction == Faction::Player) {
        return;
    }

    auto id = window.front();
    auto generation = ++generation_;
    inFlight_ = id;

    auto timeout = timers_.scheduleAfter(timing_.decisionTimeout,
                                         [this, id, generation] { OnTimeout(id, generation); });
    if (timeout.hasError()) {
        TBC_LOG_ERROR(LogCategory::AI, "Cannot arm decision timeout: " +
                                           std::string(timeout.error().message()));
    } else {
        timeoutTimer_ = timeout.value();
    }

    auto started = runner_.BeginTurn(
        id, [this, generation](CombatantId who) { OnUnitComplete(who, generation); });
    if (started.hasError()) {
        TBC_LOG_ERROR(LogCategory::AI, "AI turn of " + std::to_string(id.value()) +
                                           " failed to start: " +
                                           std::string(started.error().message()));
        Release(id, true);
    }
}

void AIWindowSequencer::OnUnitComplete(CombatantId id, uint64_t generation) {
    if (generation != generation_ || inFlight_ != id) {
        TBC_LOG_DEBUG(LogCategory::AI,
                      "Ignoring late completion of " + std::to_string(id.value()));
        return;
    }
    Release(id, true);
}

void AIWindowSequencer::OnTimeout(CombatantId id, uint64_t generation) {
    timeoutTimer_.reset();
    if (generation != generation_ || inFlight_ != id) {
        return;
    }
    TBC_LOG_WARN(LogCategory::AI, "AI turn of " + std::to_string(id.value()) +
                                      " timed out; forcing end of turn");
    ++timeouts_;
    runner_.CancelTurn(id);
    Release(id, true);
}

void AIWindowSequencer::OnUnitDefeated(CombatantId id) {
    if (inFlight_ != id) {
        return;
    }
    runner_.CancelTurn(id);
    Release(id, false);
}

void AIWindowSequencer::Release(CombatantId id, bool endTurn) {
    CancelTimer(timeoutTimer_);
    inFlight_.reset();
    ++generation_;
    if (!endTurn) {
        return;
    }
    auto result = engine_.EndTurn(id);
    if (result.hasError()) {
        TBC_LOG_WARN(LogCategory::AI, "EndTurn for " + std::to_string(id.value()) + " refused: " +
                                          std::string(result.error().message()));
    }
}

void AIWindowSequencer::CancelAll() {
    CancelTimer(gapTimer_);
    if (inFlight_) {
        runner_.CancelTurn(*inFlight_);
        Release(*inFlight_, false);
    }
    runner_.CancelAll();
}

void AIWindowSequencer::CancelTimer(std::optional<tbc::foundation::TimerId>& timer) {
    if (!timer) {
        return;
    }
    auto cancelled = timers_.cancel(*timer);
    if (cancelled.hasError()) {
        TBC_LOG_DEBUG(LogCategory::AI, std::string(cancelled.error().message()));
    }
    timer.reset();
}

}  // namespace tbc::game
