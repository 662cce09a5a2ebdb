/// @file action_executor.cpp
/// @brief ActionExecutor implementation.

#include "tbc/game/action_executor.hpp"

#include <string>

#include "tbc/foundation/game_logger.hpp"

namespace tbc::game {

using tbc::foundation::ErrorCode;
using tbc::foundation::GameError;
using tbc::foundation::GameLogger;
using tbc::foundation::GameResult;
using tbc::foundation::LogCategory;
using tbc::foundation::LogContext;
using tbc::foundation::LogLevel;

namespace {

template <typename T>
GameResult<T> Refuse(ErrorCode code, std::string message, CombatantId who) {
    TBC_LOG_WARN(LogCategory::Combat, message);
    return GameResult<T>::err(GameError(code, std::move(message), who));
}

}  // namespace

ActionExecutor::ActionExecutor(CombatantRoster& roster,
                               const FactionRelationshipResolver& factions,
                               const CombatResolver& resolver, TurnOrderEngine& engine,
                               tbc::foundation::RandomSource& rng, IGridService* grid)
    : roster_(roster),
      factions_(factions),
      resolver_(resolver),
      engine_(engine),
      rng_(rng),
      grid_(grid) {}

// ── Validation ──────────────────────────────────────────────────────────

GameResult<Combatant*> ActionExecutor::ValidateActor(CombatantId id) {
    if (engine_.State() == EngineState::CombatOver) {
        return Refuse<Combatant*>(ErrorCode::CombatOver, "combat is already over", id);
    }
    if (engine_.State() != EngineState::WindowActive) {
        return Refuse<Combatant*>(ErrorCode::CombatNotRunning, "combat is not running", id);
    }
    auto* actor = roster_.Find(id);
    if (actor == nullptr) {
        return Refuse<Combatant*>(ErrorCode::UnitNotFound,
                                  "unknown combatant " + std::to_string(id.value()), id);
    }
    if (!actor->IsAlive()) {
        return Refuse<Combatant*>(ErrorCode::UnitDead, actor->Name() + " is dead", id);
    }
    if (!engine_.IsUnitInCurrentWindow(id)) {
        return Refuse<Combatant*>(ErrorCode::NotInTurnWindow,
                                  actor->Name() + " is not in the current turn window", id);
    }
    return GameResult<Combatant*>::ok(actor);
}

GameResult<Combatant*> ActionExecutor::ValidateTarget(const Combatant& actor, CombatantId target,
                                                      bool hostile, int32_t reach) {
    auto* unit = roster_.Find(target);
    if (unit == nullptr || !unit->IsAlive()) {
        return Refuse<Combatant*>(ErrorCode::InvalidTarget,
                                  "target " + std::to_string(target.value()) +
                                      " is missing or dead",
                                  target);
    }
    auto relationship = factions_.GetRelationship(actor.GetFaction(), unit->GetFaction());
    bool matches = hostile ? relationship == FactionRelationship::Hostile
                           : relationship == FactionRelationship::Ally;
    if (!matches) {
        return Refuse<Combatant*>(ErrorCode::InvalidTarget,
                                  unit->Name() + " is " +
                                      std::string(relationshipName(relationship)) + " to " +
                                      actor.Name(),
                                  target);
    }
    if (ChebyshevDistance(actor.Position(), unit->Position()) > reach) {
        return Refuse<Combatant*>(ErrorCode::TargetOutOfRange,
                                  unit->Name() + " is out of reach of " + actor.Name(), target);
    }
    return GameResult<Combatant*>::ok(unit);
}

// ── Attacks ─────────────────────────────────────────────────────────────

CombatResolutionResult ActionExecutor::Strike(Combatant& attacker, Combatant& target,
                                              int32_t basePower) {
    auto tier = attacker.Proficiency();
    auto base = tier ? ProficiencyEffects::ApplyStatEfficiency(basePower, *tier) : basePower;
    auto result = resolver_.Resolve(CombatResolver::BuildAttackerProfile(attacker, tier),
                                    CombatResolver::BuildDefenderProfile(target), base, tier,
                                    rng_);

    auto oldHp = target.Hp();
    if (result.Landed()) {
        target.ApplyDamage(result.finalDamage);
    }
    attacker.MarkActed();

    LogContext ctx;
    ctx.combatantId = attacker.Id();
    ctx.targetId = target.Id();
    ctx.round = engine_.Round();
    ctx.extra["damage"] = std::to_string(result.finalDamage);
    ctx.extra["outcome"] = !result.hit ? "miss"
                           : result.parried ? "parry"
                           : (result.criticalHit && !result.criticalDefended) ? "critical"
                                                                                 : "hit";
    GameLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Combat,
                                          "Attack resolved", ctx);

    engine_.events().attackResolved.emit(attacker.Id(), target.Id(), result);
    engine_.OnCombatantHpChanged(target.Id(), oldHp);
    return result;
}

GameResult<CombatResolutionResult> ActionExecutor::ExecuteMeleeAttack(CombatantId attacker,
                                                                     CombatantId target) {
    auto actor = ValidateActor(attacker);
    if (actor.hasError()) {
        return GameResult<CombatResolutionResult>::err(actor.error());
    }
    auto* self = actor.value();
    if (!self->CanAct()) {
        return Refuse<CombatResolutionResult>(
            self->HasActed() ? ErrorCode::AlreadyActed : ErrorCode::ActionPrevented,
            self->Name() + " cannot act", attacker);
    }
    auto victim = ValidateTarget(*self, target, true, 1);
    if (victim.hasError()) {
        return GameResult<CombatResolutionResult>::err(victim.error());
    }
    return GameResult<CombatResolutionResult>::ok(
        Strike(*self, *victim.value(), self->Stats().attack));
}

GameResult<CombatResolutionResult> ActionExecutor::ExecuteSkill(CombatantId user, SkillId skill,
                                                              CombatantId target) {
    auto actor = ValidateActor(user);
    if (actor.hasError()) {
        return GameResult<CombatResolutionResult>::err(actor.error());
    }
    auto* self = actor.value();
    if (!self->CanAct()) {
        return Refuse<CombatResolutionResult>(
            self->HasActed() ? ErrorCode::AlreadyActed : ErrorCode::ActionPrevented,
            self->Name() + " cannot act", user);
    }
    const auto* known = self->FindSkill(skill);
    if (known == nullptr) {
        return Refuse<CombatResolutionResult>(
            ErrorCode::SkillNotKnown,
            self->Name() + " does not know skill " + std::to_string(skill.value()), user);
    }
    if (known->IsSupport()) {
        return Refuse<CombatResolutionResult>(ErrorCode::InvalidArgument,
                                              known->name + " is a support skill", user);
    }
    auto victim = ValidateTarget(*self, target, true, known->range);
    if (victim.hasError()) {
        return GameResult<CombatResolutionResult>::err(victim.error());
    }

    engine_.events().skillUsed.emit(user, known->id);
    auto* victimUnit = victim.value();
    auto result = Strike(*self, *victimUnit, known->power);
    if (known->appliesEffect && result.Landed() && victimUnit->IsAlive()) {
        victimUnit->StatusEffects().Apply(known->appliesEffect, known->effectDuration);
        TBC_LOG_DEBUG(LogCategory::Combat, victimUnit->Name() + " is afflicted with " +
                                               known->appliesEffect->name);
    }
    return GameResult<CombatResolutionResult>::ok(result);
}

// ── Support ─────────────────────────────────────────────────────────────

GameResult<int32_t> ActionExecutor::ExecuteSupport(CombatantId user, SkillId skill,
                                                   CombatantId ally) {
    auto actor = ValidateActor(user);
    if (actor.hasError()) {
        return GameResult<int32_t>::err(actor.error());
    }
    auto* self = actor.value();
    if (!self->CanAct()) {
        return Refuse<int32_t>(self->HasActed() ? ErrorCode::AlreadyActed
                                                : ErrorCode::ActionPrevented,
                               self->Name() + " cannot act", user);
    }
    const auto* known = self->FindSkill(skill);
    if (known == nullptr) {
        return Refuse<int32_t>(ErrorCode::SkillNotKnown,
                               self->Name() + " does not know skill " +
                                   std::to_string(skill.value()),
                               user);
    }
    if (!known->IsSupport()) {
        return Refuse<int32_t>(ErrorCode::InvalidArgument, known->name + " is not a support skill",
                               user);
    }
    auto recipient = ValidateTarget(*self, ally, false, known->range);
    if (recipient.hasError()) {
        return GameResult<int32_t>::err(recipient.error());
    }

    auto* friendUnit = recipient.value();
    auto oldHp = friendUnit->Hp();
    auto healed = friendUnit->ApplyHealing(known->healAmount);
    if (known->appliesEffect) {
        friendUnit->StatusEffects().Apply(known->appliesEffect, known->effectDuration);
    }
    self->MarkActed();

    TBC_LOG_DEBUG(LogCategory::Combat, self->Name() + " uses " + known->name + " on " +
                                           friendUnit->Name() + " (+" + std::to_string(healed) +
                                           " HP)");
    engine_.events().skillUsed.emit(user, known->id);
    engine_.OnCombatantHpChanged(ally, oldHp);
    return GameResult<int32_t>::ok(healed);
}

// ── Movement ────────────────────────────────────────────────────────────

GameResult<std::vector<GridPos>> ActionExecutor::MoveUnit(CombatantId id, GridPos destination) {
    using PathResult = GameResult<std::vector<GridPos>>;

    auto actor = ValidateActor(id);
    if (actor.hasError()) {
        return PathResult::err(actor.error());
    }
    if (grid_ == nullptr) {
        TBC_LOG_ERROR(LogCategory::Combat, "No grid service attached; cannot move");
        return PathResult::err(GameError(ErrorCode::CollaboratorMissing, "grid service missing", id));
    }
    auto* unit = actor.value();
    if (!grid_->IsValidPosition(destination.x, destination.y)) {
        return Refuse<std::vector<GridPos>>(ErrorCode::InvalidPosition,
                                            "destination is off the board", id);
    }
    if (destination == unit->Position()) {
        return PathResult::ok({});
    }
    if (unit->StatusEffects().PreventsMovement()) {
        return Refuse<std::vector<GridPos>>(ErrorCode::MovementPrevented,
                                            unit->Name() + " cannot move", id);
    }

    auto path = grid_->Path(*unit, destination);
    if (path.empty()) {
        return Refuse<std::vector<GridPos>>(ErrorCode::InvalidPosition,
                                            "destination is unreachable", id);
    }
    auto cost = static_cast<int32_t>(path.size());
    if (!unit->SpendMovement(cost)) {
        return Refuse<std::vector<GridPos>>(
            unit->HasActed() && unit->HasMoved() ? ErrorCode::MovementPrevented
                                                 : ErrorCode::InsufficientMovement,
            unit->Name() + " cannot spend " + std::to_string(cost) + " movement", id);
    }

    auto from = unit->Position();
    grid_->MoveOccupant(id, from, destination);
    unit->SetPosition(destination);
    TBC_LOG_DEBUG(LogCategory::Combat, unit->Name() + " moves " + std::to_string(cost) +
                                           " step(s) to (" + std::to_string(destination.x) +
                                           "," + std::to_string(destination.y) + ")");
    return PathResult::ok(std::move(path));
}

}  // namespace tbc::game
