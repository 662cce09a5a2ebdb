/// @file ai_controller.cpp
/// @brief AIController implementation.

#include "tbc/game/ai_controller.hpp"

#include <string>

#include "tbc/foundation/game_logger.hpp"

namespace tbc::game {

using tbc::foundation::ErrorCode;
using tbc::foundation::GameLogger;
using tbc::foundation::GameResult;
using tbc::foundation::LogCategory;
using tbc::foundation::LogContext;
using tbc::foundation::LogLevel;
using tbc::foundation::makeError;

AIController::AIController(CombatantRoster& roster, const FactionRelationshipResolver& factions,
                           TurnOrderEngine& engine, ActionExecutor& executor,
                           tbc::foundation::TimerScheduler& timers,
                           tbc::foundation::RandomSource& rng, AITiming timing)
    : roster_(roster),
      factions_(factions),
      engine_(engine),
      executor_(executor),
      timers_(timers),
      rng_(rng),
      timing_(timing) {}

void AIController::AssignBehavior(CombatantId id, AIBehavior behavior) {
    behaviors_.insert_or_assign(id, std::move(behavior));
}

void AIController::ClearBehavior(CombatantId id) {
    behaviors_.erase(id);
}

const AIBehavior* AIController::BehaviorFor(CombatantId id) const {
    auto it = behaviors_.find(id);
    return it == behaviors_.end() ? nullptr : &it->second;
}

// ── Turn lifecycle ──────────────────────────────────────────────────────

GameResult<void> AIController::BeginTurn(CombatantId id, CompletionCallback onComplete) {
    if (turns_.count(id) > 0) {
        return makeError<void>(ErrorCode::TurnAlreadyInProgress,
                               "AI turn already running for " + std::to_string(id.value()));
    }

    auto turn = std::make_shared<TurnState>();
    turn->onComplete = std::move(onComplete);
    turn->wasInWindow = engine_.IsUnitInCurrentWindow(id);

    auto token = turn->cancellation.token();
    auto timer = timers_.scheduleAfter(timing_.thinkingDelay, [this, id, turn, token] {
        turn->thinkingTimer.reset();
        if (token.isCancelled()) {
            return;
        }
        Decide(id, turn);
    });
    if (timer.hasError()) {
        return GameResult<void>::err(timer.error());
    }
    turn->thinkingTimer = timer.value();
    turns_[id] = turn;
    return GameResult<void>::ok();
}

void AIController::CancelTurn(CombatantId id) {
    auto it = turns_.find(id);
    if (it == turns_.end()) {
        return;
    }
    auto turn = it->second;
    turns_.erase(it);

    turn->cancellation.cancel();
    if (turn->thinkingTimer) {
        auto cancelled = timers_.cancel(*turn->thinkingTimer);
        if (cancelled.hasError()) {
            TBC_LOG_DEBUG(LogCategory::AI, std::string(cancelled.error().message()));
        }
        turn->thinkingTimer.reset();
    }
    if (movement_ != nullptr) {
        movement_->Cancel(id);
    }
    TBC_LOG_DEBUG(LogCategory::AI, "Cancelled AI turn of " + std::to_string(id.value()));
}

void AIController::CancelAll() {
    std::vector<CombatantId> ids;
    ids.reserve(turns_.size());
    for (const auto& [id, turn] : turns_) {
        ids.push_back(id);
    }
    for (auto id : ids) {
        CancelTurn(id);
    }
}

bool AIController::StillActive(CombatantId id, const TurnState& turn) const {
    const auto* unit = roster_.Find(id);
    return unit != nullptr && unit->IsAlive() && turn.wasInWindow &&
           engine_.IsUnitInCurrentWindow(id);
}

// ── Decision ────────────────────────────────────────────────────────────

void AIController::Decide(CombatantId id, const TurnPtr& turn) {
    if (!StillActive(id, *turn)) {
        Complete(id, turn, "no longer active");
        return;
    }
    auto* unit = roster_.Find(id);
    if (unit->StatusEffects().PreventsActions()) {
        Complete(id, turn, "actions prevented");
        return;
    }
    const auto* behavior = BehaviorFor(id);
    if (behavior == nullptr) {
        TBC_LOG_ERROR(LogCategory::AI, unit->Name() + " has no AI behavior assigned");
        Complete(id, turn, "no behavior");
        return;
    }

    auto units = static_cast<const CombatantRoster&>(roster_).All();
    AIContext ctx{*unit, units, factions_, grid_, rng_};
    const auto* target = behavior->ChooseTarget(ctx);
    if (target == nullptr) {
        Complete(id, turn, "no target");
        return;
    }
    auto choice = behavior->ChooseAction(ctx, *target);

    LogContext logCtx;
    logCtx.combatantId = id;
    logCtx.targetId = target->Id();
    logCtx.round = engine_.Round();
    logCtx.extra["behavior"] = std::string(aiBehaviorName(behavior->Kind()));
    logCtx.extra["action"] = std::string(aiActionName(choice.kind));
    GameLogger::instance().logWithContext(LogLevel::Debug, LogCategory::AI, "AI decision", logCtx);

    auto targetId = target->Id();
    std::optional<GridPos> destination;
    if (grid_ != nullptr && unit->MovementRemaining() > 0 &&
        !unit->StatusEffects().PreventsMovement()) {
        destination = behavior->EvaluateBestMove(
            ctx, *target, grid_->ReachableCells(*unit, unit->MovementRemaining()));
    }
    if (!destination) {
        Act(id, turn, targetId, choice, false);
        return;
    }

    auto path = executor_.MoveUnit(id, *destination);
    if (path.hasError() || path.value().empty()) {
        Act(id, turn, targetId, choice, false);
        return;
    }
    if (movement_ == nullptr) {
        Act(id, turn, targetId, choice, true);
        return;
    }

    auto token = turn->cancellation.token();
    movement_->MoveAlong(id, std::move(path).value(),
                         [this, id, turn, token, targetId, choice] {
                             if (token.isCancelled()) {
                                 return;
                             }
                             Act(id, turn, targetId, choice, true);
                         });
}

void AIController::Act(CombatantId id, const TurnPtr& turn, CombatantId targetId,
                       AIActionChoice choice, bool moved) {
    if (!StillActive(id, *turn)) {
        Complete(id, turn, "no longer active after moving");
        return;
    }
    const auto* target = roster_.Find(targetId);
    if (target == nullptr || !target->IsAlive()) {
        Complete(id, turn, "target lost");
        return;
    }

    if (moved) {
        // Adjacency may have changed on the way.
        const auto* behavior = BehaviorFor(id);
        if (behavior != nullptr) {
            auto units = static_cast<const CombatantRoster&>(roster_).All();
            AIContext ctx{*roster_.Find(id), units, factions_, grid_, rng_};
            choice = behavior->ChooseAction(ctx, *target);
        }
    }

    switch (choice.kind) {
        case AIActionKind::MeleeAttack: {
            auto result = executor_.ExecuteMeleeAttack(id, targetId);
            if (result.hasError()) {
                TBC_LOG_DEBUG(LogCategory::AI, "Melee attack skipped: " +
                                                   std::string(result.error().message()));
            }
            break;
        }
        case AIActionKind::RangedSkill: {
            if (!choice.skill) {
                break;
            }
            auto result = executor_.ExecuteSkill(id, *choice.skill, targetId);
            if (result.hasError()) {
                TBC_LOG_DEBUG(LogCategory::AI,
                              "Skill skipped: " + std::string(result.error().message()));
            }
            break;
        }
        case AIActionKind::Support: {
            if (!choice.skill) {
                break;
            }
            auto result = executor_.ExecuteSupport(id, *choice.skill, targetId);
            if (result.hasError()) {
                TBC_LOG_DEBUG(LogCategory::AI,
                              "Support skipped: " + std::string(result.error().message()));
            }
            break;
        }
        case AIActionKind::Move:
        case AIActionKind::Wait:
            break;
    }
    Complete(id, turn, aiActionName(choice.kind));
}

void AIController::Complete(CombatantId id, const TurnPtr& turn, std::string_view reason) {
    if (turn->completed || turn->cancellation.isCancelled()) {
        return;
    }
    turn->completed = true;

    auto it = turns_.find(id);
    if (it != turns_.end() && it->second == turn) {
        turns_.erase(it);
    }
    TBC_LOG_DEBUG(LogCategory::AI, "AI turn of " + std::to_string(id.value()) + " complete (" +
                                       std::string(reason) + ")");
    auto callback = std::move(turn->onComplete);
    if (callback) {
        callback(id);
    }
}

}  // namespace tbc::game
