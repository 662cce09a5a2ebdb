/// @file battle_session.cpp
/// @brief BattleSession wiring and player request handling.

#include "tbc/service/battle_session.hpp"

#include <string>
#include <unordered_set>

#include "tbc/foundation/game_logger.hpp"
#include "tbc/game/action_executor.hpp"
#include "tbc/game/ai_controller.hpp"
#include "tbc/game/ai_window_sequencer.hpp"

namespace tbc::service {

using tbc::foundation::ConfigManager;
using tbc::foundation::ErrorCode;
using tbc::foundation::GameError;
using tbc::foundation::GameResult;
using tbc::foundation::LogCategory;
using tbc::foundation::makeError;
using namespace tbc::game;

std::string_view sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Setup:          return "Setup";
        case SessionState::AwaitingStakes: return "AwaitingStakes";
        case SessionState::Running:        return "Running";
        case SessionState::Finished:       return "Finished";
        case SessionState::ShutDown:       return "ShutDown";
    }
    return "Unknown";
}

GameResult<BattleSessionConfig> BattleSessionConfig::fromConfig(const ConfigManager& config) {
    BattleSessionConfig cfg;

    auto width = config.getOr<int32_t>("battle.grid_width", cfg.gridWidth);
    auto height = config.getOr<int32_t>("battle.grid_height", cfg.gridHeight);
    auto seed = config.getOr<uint32_t>("battle.seed", cfg.seed);
    if (width.hasError()) {
        return GameResult<BattleSessionConfig>::err(width.error());
    }
    if (height.hasError()) {
        return GameResult<BattleSessionConfig>::err(height.error());
    }
    if (seed.hasError()) {
        return GameResult<BattleSessionConfig>::err(seed.error());
    }
    if (width.value() <= 0 || height.value() <= 0) {
        return makeError<BattleSessionConfig>(ErrorCode::ConfigValueOutOfRange,
                                              "battle grid dimensions must be positive");
    }
    cfg.gridWidth = width.value();
    cfg.gridHeight = height.value();
    cfg.seed = seed.value();

    auto tuning = LoadCombatTuning(config);
    if (tuning.hasError()) {
        return GameResult<BattleSessionConfig>::err(tuning.error());
    }
    auto timing = LoadAITiming(config);
    if (timing.hasError()) {
        return GameResult<BattleSessionConfig>::err(timing.error());
    }
    auto encounter = LoadEncounter(config);
    if (encounter.hasError()) {
        return GameResult<BattleSessionConfig>::err(encounter.error());
    }
    cfg.tuning = tuning.value();
    cfg.timing = timing.value();
    cfg.encounter = encounter.value();
    return GameResult<BattleSessionConfig>::ok(cfg);
}

// -- Impl --------------------------------------------------------------------

struct BattleSession::Impl {
    BattleSessionConfig config;
    SessionState state = SessionState::Setup;

    std::unique_ptr<tbc::foundation::RandomSource> rng;
    tbc::foundation::TimerScheduler timers;
    CombatantRoster roster;
    FactionRelationshipResolver factions;
    SquareGrid grid;
    TimedMovementDriver movement;
    CombatResolver resolver;
    TurnOrderEngine engine;
    ActionExecutor executor;
    AIController controller;
    AIWindowSequencer sequencer;
    BattleStatistics statistics;

    /// Player units with a pending automatic end of turn.
    std::unordered_set<CombatantId> autoEnding;
    std::vector<tbc::foundation::ScopedConnection> connections;

    Impl(BattleSessionConfig cfg, std::unique_ptr<tbc::foundation::RandomSource> source)
        : config(cfg),
          rng(source ? std::move(source)
                     : std::make_unique<tbc::foundation::MersenneRandomSource>(cfg.seed)),
          grid(cfg.gridWidth, cfg.gridHeight),
          movement(timers, cfg.timing.movementStepDuration),
          resolver(cfg.tuning),
          engine(roster, factions, &grid),
          executor(roster, factions, resolver, engine, *rng, &grid),
          controller(roster, factions, engine, executor, timers, *rng, cfg.timing),
          sequencer(engine, controller, timers, cfg.timing),
          statistics(engine.events()) {
        controller.SetGridService(&grid);
        controller.SetMovementDriver(&movement);
        engine.SetAITurnDriver(&sequencer);

        connections.push_back(tbc::foundation::connectScoped(
            engine.events().turnWindowChanged,
            [this](const std::vector<CombatantId>& window) { skipIncapacitated(window); }));
        connections.push_back(tbc::foundation::connectScoped(
            engine.events().combatEnded, [this](bool) { state = SessionState::Finished; }));
    }

    ~Impl() {
        connections.clear();
        engine.SetAITurnDriver(nullptr);
        sequencer.CancelAll();
    }

    /// Player units that cannot act still hold the window; end their turn
    /// on the next timer tick.
    void skipIncapacitated(const std::vector<CombatantId>& window) {
        for (auto id : window) {
            const auto* unit = roster.Find(id);
            if (unit == nullptr || !unit->IsPlayerControlled() ||
                !unit->StatusEffects().PreventsActions() || autoEnding.count(id) > 0) {
                continue;
            }
            auto timer = timers.scheduleAfter(Duration::zero(), [this, id] {
                autoEnding.erase(id);
                if (!engine.IsUnitInCurrentWindow(id)) {
                    return;
                }
                auto ended = engine.EndTurn(id);
                if (ended.hasError()) {
                    TBC_LOG_WARN(LogCategory::Session, std::string(ended.error().message()));
                }
            });
            if (timer.hasError()) {
                TBC_LOG_ERROR(LogCategory::Session, std::string(timer.error().message()));
                continue;
            }
            autoEnding.insert(id);
            TBC_LOG_INFO(LogCategory::Session, unit->Name() + " cannot act and skips the turn");
        }
    }

    /// Requests are accepted only for player units of a running battle.
    GameResult<void> checkRequest(CombatantId id) const {
        switch (state) {
            case SessionState::Running:
                break;
            case SessionState::AwaitingStakes:
                return makeError<void>(ErrorCode::AwaitingAcknowledgement,
                                       "battle is waiting for stakes acknowledgement");
            case SessionState::Finished:
                return makeError<void>(ErrorCode::CombatOver, "combat is already over");
            case SessionState::Setup:
            case SessionState::ShutDown:
                return makeError<void>(ErrorCode::CombatNotRunning, "combat is not running");
        }
        const auto* unit = roster.Find(id);
        if (unit == nullptr) {
            return GameResult<void>::err(
                GameError(ErrorCode::UnitNotFound, "unknown combatant", id));
        }
        if (!unit->IsPlayerControlled()) {
            TBC_LOG_WARN(LogCategory::Session,
                         "Rejected request for AI-controlled " + unit->Name());
            return GameResult<void>::err(
                GameError(ErrorCode::InvalidArgument, unit->Name() + " is AI-controlled", id));
        }
        return GameResult<void>::ok();
    }

    GameResult<void> beginCombat() {
        auto initialized = engine.Initialize(roster.Ids(), config.encounter);
        if (initialized.hasError()) {
            state = SessionState::Setup;
            return initialized;
        }
        if (state != SessionState::Finished) {
            state = SessionState::Running;
        }
        TBC_LOG_INFO(LogCategory::Session, "Battle started with " +
                                               std::to_string(roster.Size()) + " combatants");
        return GameResult<void>::ok();
    }
};

BattleSession::BattleSession(BattleSessionConfig config,
                             std::unique_ptr<tbc::foundation::RandomSource> rng)
    : impl_(std::make_unique<Impl>(config, std::move(rng))) {}

BattleSession::~BattleSession() = default;

// -- Setup -------------------------------------------------------------------

GameResult<Combatant*> BattleSession::addCombatant(std::unique_ptr<Combatant> combatant,
                                                   std::optional<AIBehavior> behavior) {
    if (impl_->state == SessionState::Finished || impl_->state == SessionState::ShutDown) {
        return makeError<Combatant*>(ErrorCode::CombatOver, "battle has ended");
    }
    if (combatant == nullptr) {
        return makeError<Combatant*>(ErrorCode::InvalidArgument, "null combatant");
    }
    if (!impl_->grid.PlaceCombatant(*combatant)) {
        return GameResult<Combatant*>::err(
            GameError(ErrorCode::InvalidPosition, combatant->Name() + " cannot be placed",
                      combatant->Id()));
    }
    auto position = combatant->Position();
    auto added = impl_->roster.Add(std::move(combatant));
    if (added.hasError()) {
        impl_->grid.ClearOccupant(position);
        return added;
    }

    auto* unit = added.value();
    if (behavior) {
        impl_->controller.AssignBehavior(unit->Id(), std::move(*behavior));
    } else if (!unit->IsPlayerControlled()) {
        TBC_LOG_WARN(LogCategory::Session,
                     unit->Name() + " is AI-controlled but has no behavior; its turns will be skipped");
    }

    if (impl_->state == SessionState::Running) {
        auto registered = impl_->engine.RegisterUnit(unit->Id());
        if (registered.hasError()) {
            return GameResult<Combatant*>::err(registered.error());
        }
    }
    return GameResult<Combatant*>::ok(unit);
}

GameResult<void> BattleSession::removeCombatant(CombatantId id) {
    auto* unit = impl_->roster.Find(id);
    if (unit == nullptr) {
        return GameResult<void>::err(GameError(ErrorCode::UnitNotFound, "unknown combatant", id));
    }
    impl_->controller.CancelTurn(id);
    impl_->movement.Cancel(id);
    if (impl_->state == SessionState::Running || impl_->state == SessionState::Finished) {
        auto unregistered = impl_->engine.UnregisterUnit(id);
        if (unregistered.hasError()) {
            TBC_LOG_WARN(LogCategory::Session, std::string(unregistered.error().message()));
        }
    }
    impl_->grid.ClearOccupant(unit->Position());
    impl_->controller.ClearBehavior(id);
    impl_->roster.Remove(id);
    return GameResult<void>::ok();
}

GameResult<std::size_t> BattleSession::applyFactionConfig(const ConfigManager& config) {
    return ApplyFactionRelationships(config, impl_->factions);
}

// -- Lifecycle ---------------------------------------------------------------

GameResult<void> BattleSession::start() {
    if (impl_->state != SessionState::Setup) {
        return makeError<void>(ErrorCode::InvalidArgument,
                               std::string("cannot start from state ") +
                                   std::string(sessionStateName(impl_->state)));
    }
    if (impl_->config.encounter.requireStakesAcknowledgement) {
        impl_->state = SessionState::AwaitingStakes;
        TBC_LOG_INFO(LogCategory::Session, "Waiting for stakes acknowledgement");
        return GameResult<void>::ok();
    }
    return impl_->beginCombat();
}

GameResult<void> BattleSession::acknowledgeStakes() {
    if (impl_->state != SessionState::AwaitingStakes) {
        return makeError<void>(ErrorCode::InvalidArgument, "no stakes acknowledgement pending");
    }
    TBC_LOG_INFO(LogCategory::Session, "Stakes acknowledged");
    return impl_->beginCombat();
}

void BattleSession::shutdown() {
    if (impl_->state == SessionState::ShutDown) {
        return;
    }
    impl_->sequencer.CancelAll();
    impl_->controller.CancelAll();
    impl_->timers.clear();
    impl_->autoEnding.clear();
    impl_->state = SessionState::ShutDown;
    TBC_LOG_INFO(LogCategory::Session, "Battle session shut down");
}

std::size_t BattleSession::advance(Duration delta) {
    return impl_->timers.advance(delta);
}

std::size_t BattleSession::runUntilIdle(Duration limit) {
    return impl_->timers.runUntilIdle(limit);
}

// -- Player requests ---------------------------------------------------------

GameResult<CombatResolutionResult> BattleSession::requestAttack(CombatantId attacker,
                                                                CombatantId target) {
    auto allowed = impl_->checkRequest(attacker);
    if (allowed.hasError()) {
        return GameResult<CombatResolutionResult>::err(allowed.error());
    }
    return impl_->executor.ExecuteMeleeAttack(attacker, target);
}

GameResult<CombatResolutionResult> BattleSession::requestSkill(CombatantId user, SkillId skill,
                                                               CombatantId target) {
    auto allowed = impl_->checkRequest(user);
    if (allowed.hasError()) {
        return GameResult<CombatResolutionResult>::err(allowed.error());
    }
    return impl_->executor.ExecuteSkill(user, skill, target);
}

GameResult<int32_t> BattleSession::requestSupport(CombatantId user, SkillId skill,
                                                  CombatantId ally) {
    auto allowed = impl_->checkRequest(user);
    if (allowed.hasError()) {
        return GameResult<int32_t>::err(allowed.error());
    }
    return impl_->executor.ExecuteSupport(user, skill, ally);
}

GameResult<std::vector<GridPos>> BattleSession::requestMove(CombatantId id, GridPos destination) {
    auto allowed = impl_->checkRequest(id);
    if (allowed.hasError()) {
        return GameResult<std::vector<GridPos>>::err(allowed.error());
    }
    return impl_->executor.MoveUnit(id, destination);
}

GameResult<void> BattleSession::requestEndTurn(CombatantId id) {
    auto allowed = impl_->checkRequest(id);
    if (allowed.hasError()) {
        return allowed;
    }
    return impl_->engine.EndTurn(id);
}

// -- Queries -----------------------------------------------------------------

SessionState BattleSession::state() const noexcept { return impl_->state; }

std::optional<bool> BattleSession::outcome() const noexcept { return impl_->engine.Outcome(); }

CombatantRoster& BattleSession::roster() noexcept { return impl_->roster; }

FactionRelationshipResolver& BattleSession::factions() noexcept { return impl_->factions; }

SquareGrid& BattleSession::grid() noexcept { return impl_->grid; }

TurnOrderEngine& BattleSession::engine() noexcept { return impl_->engine; }

BattleEvents& BattleSession::events() noexcept { return impl_->engine.events(); }

const BattleStatistics& BattleSession::statistics() const noexcept { return impl_->statistics; }

tbc::foundation::TimerScheduler& BattleSession::timers() noexcept { return impl_->timers; }

const BattleSessionConfig& BattleSession::config() const noexcept { return impl_->config; }

}  // namespace tbc::service
